#include "platform/http_client.hpp"

#include <cctype>
#include <ctime>
#include <stdexcept>
#include <string>
#include <utility>

#include "httplib.h"

namespace {

std::string Trim(const std::string& value) {
  std::size_t first = 0;
  std::size_t last = value.size();
  while (first < value.size() && std::isspace(static_cast<unsigned char>(value[first]))) {
    ++first;
  }
  while (last > first && std::isspace(static_cast<unsigned char>(value[last - 1]))) {
    --last;
  }
  return value.substr(first, last - first);
}

void ApplyTimeouts(httplib::Client& client, const platform::HttpClientTimeouts& timeouts) {
  const auto split = [](std::chrono::milliseconds value) {
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(value);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(value - seconds);
    return std::make_pair(static_cast<time_t>(seconds.count()),
                          static_cast<time_t>(micros.count()));
  };
  const auto connect = split(timeouts.connect);
  const auto read = split(timeouts.read);
  const auto write = split(timeouts.write);
  client.set_connection_timeout(connect.first, connect.second);
  client.set_read_timeout(read.first, read.second);
  client.set_write_timeout(write.first, write.second);
}

}  // namespace

namespace platform {

HttpClient::HttpClient(std::string host, int port, HttpClientTimeouts timeouts)
    : host_(std::move(host)), port_(port), timeouts_(timeouts) {
  if (host_.empty()) {
    throw std::invalid_argument("HTTP client host must not be empty");
  }
  if (port_ <= 0 || port_ > 65535) {
    throw std::invalid_argument("HTTP client port is out of range: " + std::to_string(port_));
  }
}

HttpClientResponse HttpClient::Get(const std::string& path) const {
  httplib::Client client(host_, port_);
  ApplyTimeouts(client, timeouts_);

  auto response = client.Get(path.c_str());
  if (!response) {
    Raise("GET", path, httplib::to_string(response.error()));
  }
  return ConvertResponse(*response);
}

HttpClientResponse HttpClient::Post(const std::string& path, const std::string& body,
                                    const std::string& content_type) const {
  httplib::Client client(host_, port_);
  ApplyTimeouts(client, timeouts_);

  auto response = client.Post(path.c_str(), body, content_type.c_str());
  if (!response) {
    Raise("POST", path, httplib::to_string(response.error()));
  }
  return ConvertResponse(*response);
}

HttpClientResponse HttpClient::ConvertResponse(const httplib::Response& result) const {
  HttpClientResponse response;
  response.status = result.status;
  response.content_type = Trim(result.get_header_value("Content-Type"));
  response.body = result.body;
  for (const auto& header : result.headers) {
    response.headers[header.first] = header.second;
  }
  return response;
}

[[noreturn]] void HttpClient::Raise(const std::string& method, const std::string& target,
                                    const std::string& reason) const {
  throw std::runtime_error("HTTP " + method + " http://" + host_ + ":" + std::to_string(port_) +
                           target + " failed: " + reason);
}

}  // namespace platform
