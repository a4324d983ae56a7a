#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace scenecast::net {

struct HttpResponse {
  long status = 0;
  std::string body;
  bool network_error = false;
  std::string network_error_message;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;

  [[nodiscard]] virtual HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) = 0;

  [[nodiscard]] virtual HttpResponse
  get(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
      std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();

  [[nodiscard]] HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) override;

  [[nodiscard]] HttpResponse get(const std::string &url,
                                 const std::unordered_map<std::string, std::string> &headers,
                                 std::uint64_t timeout_ms) override;

private:
  [[nodiscard]] HttpResponse perform(const std::string &url,
                                     const std::unordered_map<std::string, std::string> &headers,
                                     const std::string *body, std::uint64_t timeout_ms);
};

} // namespace scenecast::net
