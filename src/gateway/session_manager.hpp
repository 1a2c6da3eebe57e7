#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

#include "nlohmann/json.hpp"

namespace gateway {

// Active -> Closing -> Closed, never backwards.
enum class SessionState { kActive = 0, kClosing, kClosed };

std::string SessionStateToString(SessionState state);

struct SessionOptions {
  std::size_t max_pending_events = 256;
  std::chrono::milliseconds poll_interval{100};
  std::chrono::milliseconds keepalive_interval{15000};
};

// Write capability handed to a session by the transport. The core never sees
// the connection object itself.
class EventWriter {
 public:
  virtual ~EventWriter() = default;
  virtual bool Write(const std::string& frame) = 0;
  virtual bool IsConnected() const = 0;
};

class Session {
 public:
  Session(std::string id, SessionOptions options);

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  const std::string& id() const { return id_; }
  std::chrono::system_clock::time_point created_at() const { return created_at_; }
  SessionState state() const;
  std::string close_reason() const;
  std::size_t PendingCount() const;

  // Queues a frame without blocking. Returns false when the session is no
  // longer active or its queue overflowed (which starts closing it).
  bool Enqueue(std::string frame);

  // Transport side. Waits up to one poll interval for queued frames and writes
  // them. Returns false once the stream should end.
  bool Pump(EventWriter& writer);

  void BeginClosing(const std::string& reason);

 private:
  friend class SessionManager;

  // Closing with no write in flight -> Closed. Returns true on transition.
  bool TryFinalize();

  const std::string id_;
  const SessionOptions options_;
  const std::chrono::system_clock::time_point created_at_;

  mutable std::mutex mutex_;
  std::condition_variable wake_;
  std::deque<std::string> outbox_;
  SessionState state_ = SessionState::kActive;
  bool writing_ = false;
  std::string close_reason_;
  std::chrono::steady_clock::time_point last_write_;
};

class SessionManager {
 public:
  explicit SessionManager(SessionOptions options = {});
  ~SessionManager();

  SessionManager(const SessionManager&) = delete;
  SessionManager& operator=(const SessionManager&) = delete;

  // Creates a session whose first frame is the tools manifest
  // ({"tools": [...]}), wrapped in a notifications/tools/list notification.
  std::shared_ptr<Session> Open(const nlohmann::json& manifest);

  bool Push(const std::string& session_id, const nlohmann::json& payload,
            const std::string& event = {});
  std::size_t Broadcast(const nlohmann::json& payload, const std::string& event = {});
  void Close(const std::string& session_id, const std::string& reason);

  std::shared_ptr<Session> Find(const std::string& session_id) const;
  // Sessions not yet Closed.
  std::size_t LiveCount() const;

  // Moves drained Closing sessions to Closed and forgets them.
  std::size_t ReapOnce();
  void StartReaper(std::chrono::milliseconds interval);
  void StopReaper();

  // Closes every session and reaps whatever has drained.
  void Shutdown();

 private:
  std::string NextSessionId();
  void ReaperLoop(std::chrono::milliseconds interval);

  const SessionOptions options_;

  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Session>> sessions_;
  // Every id handed out so far; a reaped session's id is never issued again.
  std::unordered_set<std::string> issued_ids_;
  std::uint64_t id_counter_ = 0;

  std::mutex reaper_mutex_;
  std::condition_variable reaper_wake_;
  bool reaper_running_ = false;
  std::thread reaper_;
};

}  // namespace gateway
