#pragma once

#include <cstdint>
#include <string>

namespace weather_mcp::weather {

struct HttpResponse {
  long status{0};
  std::string body{};
  // Set when no HTTP response was received at all.
  std::string transport_error{};
};

class HttpClient {
 public:
  virtual ~HttpClient() = default;

  virtual HttpResponse get(const std::string& url) const = 0;
};

class CurlHttpClient : public HttpClient {
 public:
  explicit CurlHttpClient(std::uint32_t timeout_ms);

  HttpResponse get(const std::string& url) const override;

 private:
  std::uint32_t timeout_ms_;
};

}  // namespace weather_mcp::weather
