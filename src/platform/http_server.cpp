#include "platform/http_server.hpp"

#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include "httplib.h"

namespace platform {

class HttpServer::Impl {
 public:
  httplib::Server server;
  std::mutex lifecycle_mutex;
  std::thread worker;
  bool running = false;
};

namespace {

HttpRequest ConvertRequest(const httplib::Request& req) {
  HttpRequest request;
  request.path = req.path;
  request.body = req.body;
  for (std::size_t i = 1; i < req.matches.size(); ++i) {
    request.path_params.push_back(req.matches[i].str());
  }
  for (const auto& param : req.params) {
    request.query_params[param.first] = param.second;
  }
  for (const auto& header : req.headers) {
    request.headers[header.first] = header.second;
  }
  return request;
}

httplib::Server::Handler WrapHandler(HttpHandler handler) {
  return [handler = std::move(handler)](const httplib::Request& req,
                                        httplib::Response& res) {
    try {
      const HttpRequest request = ConvertRequest(req);
      HttpResponse response = handler(request);
      if (response.content_type.empty()) {
        response.content_type = "text/plain";
      }
      for (const auto& header : response.headers) {
        res.set_header(header.first.c_str(), header.second.c_str());
      }
      res.status = response.status;
      res.set_content(response.body, response.content_type.c_str());
    } catch (const std::exception& ex) {
      res.status = 500;
      res.set_content(std::string{"{\"error\":\""} + ex.what() + "\"}", "application/json");
    }
  };
}

}  // namespace

HttpServer::HttpServer() : impl_(std::make_unique<Impl>()) {}

HttpServer::~HttpServer() { Stop(); }

void HttpServer::AddHandler(HttpMethod method, const std::string& path, HttpHandler handler) {
  if (!handler) {
    throw std::invalid_argument("HTTP handler must not be empty");
  }

  auto wrapped_handler = WrapHandler(std::move(handler));

  switch (method) {
    case HttpMethod::kGet:
      impl_->server.Get(path, std::move(wrapped_handler));
      break;
    case HttpMethod::kPost:
      impl_->server.Post(path, std::move(wrapped_handler));
      break;
    default:
      throw std::invalid_argument("Unsupported HTTP method");
  }
}

void HttpServer::Start(const std::string& host, int port) {
  {
    std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);
    if (impl_->running) {
      throw std::runtime_error("Server already running");
    }
    impl_->running = true;
  }

  const bool ok = impl_->server.listen(host, port);

  {
    std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);
    impl_->running = false;
  }

  if (!ok) {
    throw std::runtime_error("Failed to bind HTTP server to " + host + ":" +
                             std::to_string(port));
  }
}

void HttpServer::StartInBackground(const std::string& host, int port,
                                   std::chrono::milliseconds ready_timeout) {
  {
    std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);
    if (impl_->running) {
      throw std::runtime_error("Server already running");
    }
    if (!impl_->server.bind_to_port(host, port)) {
      throw std::runtime_error("Failed to bind HTTP server to " + host + ":" +
                               std::to_string(port));
    }
    impl_->running = true;
  }

  impl_->worker = std::thread([this] { impl_->server.listen_after_bind(); });

  const auto deadline = std::chrono::steady_clock::now() + ready_timeout;
  while (!impl_->server.is_running()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      Stop();
      throw std::runtime_error("HTTP server on " + host + ":" + std::to_string(port) +
                               " did not become ready");
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
}

void HttpServer::Stop() {
  impl_->server.stop();
  if (impl_->worker.joinable()) {
    impl_->worker.join();
  }
  std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);
  impl_->running = false;
}

bool HttpServer::IsRunning() const { return impl_->server.is_running(); }

}  // namespace platform
