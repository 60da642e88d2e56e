#include "docent_core/portal/http_portal_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <utility>

namespace docent_core {

namespace {

size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

// Returning non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
int progress_callback(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  const auto *token = static_cast<async::CancellationToken *>(clientp);
  return token->is_cancelled() ? 1 : 0;
}

std::string escape(CURL *handle, const std::string &segment) {
  std::unique_ptr<char, decltype(&curl_free)> escaped(
      curl_easy_escape(handle, segment.c_str(), static_cast<int>(segment.size())), &curl_free);
  if (!escaped) {
    throw PortalError(PortalErrorKind::Unavailable, "Failed to escape URL segment");
  }
  return std::string(escaped.get());
}

}  // namespace

HttpPortalClient::HttpPortalClient(PortalOptions options) : options_(std::move(options)) {
  while (!options_.base_url.empty() && options_.base_url.back() == '/') {
    options_.base_url.pop_back();
  }
}

bool HttpPortalClient::is_configured() const {
  return !options_.base_url.empty();
}

std::string HttpPortalClient::build_url(const std::string &user_id,
                                        const std::string &data_type) const {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle(curl_easy_init(),
                                                             &curl_easy_cleanup);
  if (!handle) {
    throw PortalError(PortalErrorKind::Unavailable, "CURL handle not initialized");
  }
  return options_.base_url + "/api/user/" + escape(handle.get(), user_id) + "/" +
         escape(handle.get(), data_type);
}

nlohmann::json HttpPortalClient::fetch(const std::string &user_id,
                                       const std::string &data_type,
                                       const std::string &credential,
                                       const async::CancellationToken &cancel) {
  if (!is_configured()) {
    throw PortalError(PortalErrorKind::Unavailable, "Internal portal integration not configured.");
  }

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle(curl_easy_init(),
                                                             &curl_easy_cleanup);
  if (!handle) {
    throw PortalError(PortalErrorKind::Unavailable, "CURL handle not initialized");
  }

  const std::string url = build_url(user_id, data_type);
  std::string response_buffer;

  curl_slist *raw_headers = nullptr;
  raw_headers = curl_slist_append(raw_headers, ("Authorization: Bearer " + credential).c_str());
  raw_headers = curl_slist_append(raw_headers, ("X-API-Key: " + options_.api_key).c_str());
  raw_headers = curl_slist_append(raw_headers, "Accept: application/json");
  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(raw_headers,
                                                                      &curl_slist_free_all);

  // Shares the flag with the caller's token
  async::CancellationToken token = cancel;

  CURL *curl = handle.get();
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, options_.timeout_ms);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &token);

  CURLcode res = curl_easy_perform(curl);
  if (res == CURLE_ABORTED_BY_CALLBACK) {
    throw PortalError(PortalErrorKind::Cancelled, "Portal request cancelled");
  }
  if (res != CURLE_OK) {
    throw PortalError(PortalErrorKind::Unavailable,
                      "Portal request failed: " + std::string(curl_easy_strerror(res)));
  }

  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code == 401 || http_code == 403) {
    throw PortalError(PortalErrorKind::Unauthorized,
                      "Portal rejected the credential (HTTP " + std::to_string(http_code) + ")");
  }
  if (http_code == 404) {
    throw PortalError(PortalErrorKind::NotFound, "Data type '" + data_type + "' not available.");
  }
  if (http_code != 200) {
    throw PortalError(PortalErrorKind::Unavailable,
                      "Portal request failed with status code: " + std::to_string(http_code));
  }

  auto body = nlohmann::json::parse(response_buffer, nullptr, /*allow_exceptions*/ false);
  if (body.is_discarded()) {
    throw PortalError(PortalErrorKind::Unavailable, "Portal returned a non-JSON body");
  }
  return body;
}

}  // namespace docent_core
