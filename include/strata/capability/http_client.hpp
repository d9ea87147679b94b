#pragma once

#include "strata/common/result.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>

namespace strata::capability {

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  std::unordered_map<std::string, std::string> headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

using HttpHeaders = std::unordered_map<std::string, std::string>;

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse post_json(const std::string &url, const HttpHeaders &headers,
                                               const std::string &body,
                                               std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpResponse post_json(const std::string &url, const HttpHeaders &headers,
                                       const std::string &body,
                                       std::uint64_t timeout_ms) override;
};

/// Returns the body of a 2xx response. Timeouts, transport failures, 429 and 5xx map to
/// TransientCapability; any other status is fatal.
[[nodiscard]] common::Result<std::string> classify_response(const HttpResponse &response,
                                                            const std::string &context);

} // namespace strata::capability
