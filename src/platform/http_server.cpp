#include "platform/http_server.hpp"

#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

#include "httplib.h"

namespace platform {

class HttpServer::Impl {
 public:
  httplib::Server server;
  mutable std::mutex lifecycle_mutex;
  bool running = false;
};

namespace {

constexpr char kInternalErrorBody[] = "{\"error\":\"Unhandled server error\"}";

class SinkWriter : public StreamWriter {
 public:
  explicit SinkWriter(httplib::DataSink& sink) : sink_(sink) {}

  bool Write(const std::string& chunk) override {
    if (!sink_.write(chunk.data(), chunk.size())) {
      failed_ = true;
      return false;
    }
    return true;
  }

  bool IsWritable() const override {
    if (failed_) {
      return false;
    }
    return sink_.is_writable ? sink_.is_writable() : true;
  }

  bool failed() const { return failed_; }

 private:
  httplib::DataSink& sink_;
  bool failed_ = false;
};

HttpRequest ConvertRequest(const httplib::Request& req) {
  HttpRequest request;
  request.path = req.path;
  request.body = req.body;
  for (const auto& param : req.params) {
    request.query_params[param.first] = param.second;
  }
  for (const auto& header : req.headers) {
    request.headers[header.first] = header.second;
  }
  return request;
}

void ApplyHeaders(const std::map<std::string, std::string>& headers, httplib::Response& res) {
  for (const auto& header : headers) {
    res.set_header(header.first.c_str(), header.second.c_str());
  }
}

void SetServerError(httplib::Response& res, const std::string& message) {
  res.status = 500;
  res.set_content(std::string{"{\"error\":\""} + message + "\"}", "application/json");
}

httplib::Server::Handler WrapHandler(HttpHandler handler) {
  return [handler = std::move(handler)](const httplib::Request& req, httplib::Response& res) {
    try {
      HttpResponse response = handler(ConvertRequest(req));
      if (response.content_type.empty()) {
        response.content_type = "text/plain";
      }
      ApplyHeaders(response.headers, res);
      res.status = response.status;
      res.set_content(response.body, response.content_type);
    } catch (const std::exception& ex) {
      SetServerError(res, ex.what());
    } catch (...) {
      res.status = 500;
      res.set_content(kInternalErrorBody, "application/json");
    }
  };
}

httplib::Server::Handler WrapStreamHandler(StreamHandler handler) {
  return [handler = std::move(handler)](const httplib::Request& req, httplib::Response& res) {
    StreamResponse stream;
    try {
      stream = handler(ConvertRequest(req));
    } catch (const std::exception& ex) {
      SetServerError(res, ex.what());
      return;
    }
    if (!stream.pump) {
      SetServerError(res, "Stream handler returned no producer");
      return;
    }

    ApplyHeaders(stream.headers, res);
    res.status = stream.status;
    auto pump = std::move(stream.pump);
    auto on_close = std::move(stream.on_close);
    res.set_chunked_content_provider(
        stream.content_type,
        [pump](size_t, httplib::DataSink& sink) {
          SinkWriter writer(sink);
          if (pump(writer)) {
            return true;
          }
          if (writer.failed()) {
            return false;
          }
          sink.done();
          return true;
        },
        [on_close](bool success) {
          if (on_close) {
            on_close(success);
          }
        });
  };
}

}  // namespace

HttpServer::HttpServer(std::size_t worker_threads) : impl_(std::make_unique<Impl>()) {
  if (worker_threads == 0) {
    throw std::invalid_argument("HTTP server needs at least one worker thread");
  }
  // Every open stream pins a worker, so the pool must outnumber expected streams.
  impl_->server.new_task_queue = [worker_threads] {
    return new httplib::ThreadPool(worker_threads);
  };
}

HttpServer::~HttpServer() = default;

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
    case HttpMethod::kOptions:
      impl_->server.Options(path, std::move(wrapped_handler));
      break;
  }
}

void HttpServer::AddStreamHandler(const std::string& path, StreamHandler handler) {
  if (!handler) {
    throw std::invalid_argument("Stream handler must not be empty");
  }
  impl_->server.Get(path, WrapStreamHandler(std::move(handler)));
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

void HttpServer::Stop() { impl_->server.stop(); }

bool HttpServer::IsRunning() const {
  std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);
  return impl_->running && impl_->server.is_running();
}

}  // namespace platform
