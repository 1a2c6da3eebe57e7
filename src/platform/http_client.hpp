#pragma once

#include <functional>
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
};

struct ServerSentEvent {
  std::string event;
  std::string data;
};

// Return false to stop reading the stream.
using EventCallback = std::function<bool(const ServerSentEvent&)>;

class HttpClient {
 public:
  explicit HttpClient(std::string base_url, int timeout_seconds = 30);

  HttpClientResponse Get(const std::string& path,
                         const std::map<std::string, std::string>& query = {}) const;
  HttpClientResponse Post(const std::string& path, const std::string& body,
                          const std::map<std::string, std::string>& query = {},
                          const std::string& content_type = "application/json") const;

  // Opens a text/event-stream and hands every complete event to `on_event`.
  // Returns the HTTP status of the stream response.
  int ReadEvents(const std::string& path, const EventCallback& on_event) const;

 private:
  std::string BuildTarget(const std::string& path,
                          const std::map<std::string, std::string>& query) const;
  HttpClientResponse ConvertResponse(const httplib::Response& response) const;
  [[noreturn]] void Raise(const std::string& target, const std::string& detail) const;

  std::string scheme_;
  std::string host_;
  int port_;
  int timeout_seconds_;
};

}  // namespace platform
