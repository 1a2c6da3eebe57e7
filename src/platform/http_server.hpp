#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace platform {

enum class HttpMethod { kGet = 0, kPost, kOptions };

struct HttpRequest {
  std::string path;
  std::string body;
  std::map<std::string, std::string> query_params;
  std::map<std::string, std::string> headers;
};

struct HttpResponse {
  int status = 200;
  std::string content_type = "application/json";
  std::string body;
  std::map<std::string, std::string> headers;
};

class StreamWriter {
 public:
  virtual ~StreamWriter() = default;
  virtual bool Write(const std::string& chunk) = 0;
  virtual bool IsWritable() const = 0;
};

struct StreamResponse {
  int status = 200;
  std::string content_type = "text/event-stream";
  std::map<std::string, std::string> headers;
  // Invoked repeatedly on the connection's worker thread until it returns false.
  std::function<bool(StreamWriter&)> pump;
  // Invoked once when the stream ends; `completed` is false if the peer went away.
  std::function<void(bool completed)> on_close;
};

using HttpHandler = std::function<HttpResponse(const HttpRequest&)>;
using StreamHandler = std::function<StreamResponse(const HttpRequest&)>;

class HttpServer {
 public:
  static constexpr std::size_t kDefaultWorkerThreads = 64;

  explicit HttpServer(std::size_t worker_threads = kDefaultWorkerThreads);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  void AddHandler(HttpMethod method, const std::string& path, HttpHandler handler);
  void AddStreamHandler(const std::string& path, StreamHandler handler);
  // Blocks until Stop() is called from another thread.
  void Start(const std::string& host, int port);
  void Stop();
  bool IsRunning() const;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace platform
