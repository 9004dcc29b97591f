#pragma once

#include <chrono>
#include <map>
#include <string>

namespace httplib {
class Response;
}

namespace platform {

struct HttpClientResponse {
  int status = 0;
  std::string content_type;
  std::string body;
  std::map<std::string, std::string> headers;

  bool ok() const { return status >= 200 && status < 300; }
};

struct HttpClientTimeouts {
  std::chrono::milliseconds connect{1000};
  std::chrono::milliseconds read{5000};
  std::chrono::milliseconds write{5000};
};

// Blocking plain-HTTP client bound to one host:port. Throws std::runtime_error
// when no response arrives (refused, timed out, reset).
class HttpClient {
 public:
  HttpClient(std::string host, int port, HttpClientTimeouts timeouts = {});

  HttpClientResponse Get(const std::string& path) const;
  HttpClientResponse Post(const std::string& path, const std::string& body,
                          const std::string& content_type = "application/json") const;

  const std::string& host() const { return host_; }
  int port() const { return port_; }

 private:
  HttpClientResponse ConvertResponse(const httplib::Response& response) const;
  [[noreturn]] void Raise(const std::string& method, const std::string& target,
                          const std::string& reason) const;

  std::string host_;
  int port_;
  HttpClientTimeouts timeouts_;
};

}  // namespace platform
