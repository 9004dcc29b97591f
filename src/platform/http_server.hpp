#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace platform {

enum class HttpMethod { kGet = 0, kPost };

struct HttpRequest {
  std::string path;
  std::string body;
  std::vector<std::string> path_params;
  std::map<std::string, std::string> query_params;
  std::map<std::string, std::string> headers;
};

struct HttpResponse {
  int status = 200;
  std::string content_type = "application/json";
  std::string body;
  std::map<std::string, std::string> headers;
};

using HttpHandler = std::function<HttpResponse(const HttpRequest&)>;

class HttpServer {
 public:
  HttpServer();
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // `path` is a regular expression; capture groups become HttpRequest::path_params.
  void AddHandler(HttpMethod method, const std::string& path, HttpHandler handler);

  // Blocks until Stop() is called.
  void Start(const std::string& host, int port);

  // Binds synchronously and serves on an owned thread. Throws if the bind fails.
  void StartInBackground(const std::string& host, int port,
                         std::chrono::milliseconds ready_timeout = std::chrono::seconds(2));
  void Stop();
  bool IsRunning() const;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace platform
