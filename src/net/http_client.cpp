#include "scenecast/net/http_client.hpp"

#include <mutex>

#include <curl/curl.h>

namespace scenecast::net {

namespace {

std::once_flag g_curl_init_once;

std::size_t write_body(char *ptr, std::size_t size, std::size_t nmemb, void *userdata) {
  auto *out = static_cast<std::string *>(userdata);
  out->append(ptr, size * nmemb);
  return size * nmemb;
}

} // namespace

CurlHttpClient::CurlHttpClient() {
  std::call_once(g_curl_init_once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse CurlHttpClient::post_json(const std::string &url,
                                       const std::unordered_map<std::string, std::string> &headers,
                                       const std::string &body, std::uint64_t timeout_ms) {
  return perform(url, headers, &body, timeout_ms);
}

HttpResponse CurlHttpClient::get(const std::string &url,
                                 const std::unordered_map<std::string, std::string> &headers,
                                 std::uint64_t timeout_ms) {
  return perform(url, headers, nullptr, timeout_ms);
}

HttpResponse CurlHttpClient::perform(const std::string &url,
                                     const std::unordered_map<std::string, std::string> &headers,
                                     const std::string *body, std::uint64_t timeout_ms) {
  HttpResponse response;
  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "failed to initialize curl";
    return response;
  }

  struct curl_slist *header_list = nullptr;
  bool has_content_type = false;
  for (const auto &[key, value] : headers) {
    if (key == "Content-Type") {
      has_content_type = true;
    }
    header_list = curl_slist_append(header_list, (key + ": " + value).c_str());
  }
  if (body != nullptr && !has_content_type) {
    header_list = curl_slist_append(header_list, "Content-Type: application/json");
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  if (body != nullptr) {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
  }

  const CURLcode code = curl_easy_perform(curl);
  if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
  } else {
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
  }

  curl_slist_free_all(header_list);
  curl_easy_cleanup(curl);
  return response;
}

} // namespace scenecast::net
