#include "docent_core/services/content_hash.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <memory>
#include <sstream>

namespace docent_core {

std::string sha256_hex(std::string_view data) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> mdctx(EVP_MD_CTX_new(),
                                                               &EVP_MD_CTX_free);
  if (!mdctx) {
    throw ContentHashError("Failed to create EVP context for hashing");
  }
  if (EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr) != 1) {
    throw ContentHashError("Failed to initialize SHA256 digest");
  }
  if (EVP_DigestUpdate(mdctx.get(), data.data(), data.size()) != 1) {
    throw ContentHashError("Failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (EVP_DigestFinal_ex(mdctx.get(), hash, &hash_len) != 1) {
    throw ContentHashError("Failed to finalize SHA256 digest");
  }

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::string document_fingerprint(std::string_view text, const Metadata &metadata) {
  std::string material(text);
  // Unit separator keeps "ab"+"{}" apart from "a"+"b{}"
  material.push_back('\x1f');
  material += metadata.is_null() ? std::string("{}") : metadata.dump();
  return sha256_hex(material);
}

}  // namespace docent_core
