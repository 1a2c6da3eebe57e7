#include "gateway/session_manager.hpp"

#include <algorithm>
#include <array>
#include <random>
#include <stdexcept>
#include <utility>
#include <vector>

#include "gateway/jsonrpc.hpp"
#include "gateway/logging.hpp"
#include "xxhash.h"

namespace gateway {
namespace {

using gateway::logging::LogDebug;
using gateway::logging::LogInfo;

constexpr char kBase32Alphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
constexpr char kManifestMethod[] = "notifications/tools/list";

std::string EncodeBase32(const std::array<uint8_t, 10>& bytes) {
  std::string output;
  output.reserve(16);

  uint32_t buffer = 0;
  int bits = 0;
  for (const auto value : bytes) {
    buffer = (buffer << 8) | value;
    bits += 8;
    while (bits >= 5) {
      bits -= 5;
      output.push_back(kBase32Alphabet[(buffer >> bits) & 0x1Fu]);
    }
  }
  return output;
}

std::uint64_t RandomSalt() {
  static std::mutex salt_mutex;
  static std::random_device device;
  static std::mt19937_64 engine(
      (static_cast<std::uint64_t>(device()) << 32) ^ device() ^
      static_cast<std::uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count()));
  std::lock_guard<std::mutex> lock(salt_mutex);
  return engine();
}

}  // namespace

std::string SessionStateToString(SessionState state) {
  switch (state) {
    case SessionState::kActive:
      return "active";
    case SessionState::kClosing:
      return "closing";
    case SessionState::kClosed:
      return "closed";
  }
  return "unknown";
}

Session::Session(std::string id, SessionOptions options)
    : id_(std::move(id)),
      options_(options),
      created_at_(std::chrono::system_clock::now()),
      last_write_(std::chrono::steady_clock::now()) {}

SessionState Session::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::string Session::close_reason() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return close_reason_;
}

std::size_t Session::PendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return outbox_.size();
}

bool Session::Enqueue(std::string frame) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::kActive) {
      return false;
    }
    if (outbox_.size() < std::max<std::size_t>(1, options_.max_pending_events)) {
      outbox_.push_back(std::move(frame));
      wake_.notify_one();
      return true;
    }
  }
  BeginClosing("slow consumer: more than " + std::to_string(options_.max_pending_events) +
               " pending events");
  return false;
}

bool Session::Pump(EventWriter& writer) {
  std::deque<std::string> batch;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    wake_.wait_for(lock, options_.poll_interval, [this] {
      return !outbox_.empty() || state_ != SessionState::kActive;
    });
    if (state_ != SessionState::kActive) {
      return false;
    }
    batch.swap(outbox_);
    writing_ = true;
  }

  bool ok = true;
  bool wrote = false;
  if (batch.empty()) {
    if (!writer.IsConnected()) {
      ok = false;
    } else if (std::chrono::steady_clock::now() - last_write_ >= options_.keepalive_interval) {
      ok = writer.Write(jsonrpc::FormatSseComment("keep-alive"));
      wrote = ok;
    }
  } else {
    for (const auto& frame : batch) {
      if (!writer.Write(frame)) {
        ok = false;
        break;
      }
      wrote = true;
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    writing_ = false;
    if (wrote) {
      last_write_ = std::chrono::steady_clock::now();
    }
  }
  if (!ok) {
    BeginClosing("client disconnected");
    return false;
  }
  return true;
}

void Session::BeginClosing(const std::string& reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != SessionState::kActive) {
    return;
  }
  state_ = SessionState::kClosing;
  close_reason_ = reason;
  outbox_.clear();
  wake_.notify_all();
}

bool Session::TryFinalize() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != SessionState::kClosing || writing_) {
    return false;
  }
  state_ = SessionState::kClosed;
  return true;
}

SessionManager::SessionManager(SessionOptions options) : options_(options) {}

SessionManager::~SessionManager() { StopReaper(); }

std::string SessionManager::NextSessionId() {
  const auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::string canonical = std::to_string(++id_counter_) + "||" + std::to_string(ticks) +
                                "||" + std::to_string(RandomSalt());
  const XXH128_hash_t hash = XXH3_128bits(canonical.data(), canonical.size());
  XXH128_canonical_t hash_bytes;
  XXH128_canonicalFromHash(&hash_bytes, hash);

  std::array<uint8_t, 10> truncated{};
  std::copy(hash_bytes.digest + 6, hash_bytes.digest + 16, truncated.begin());
  return EncodeBase32(truncated);
}

std::shared_ptr<Session> SessionManager::Open(const nlohmann::json& manifest) {
  std::shared_ptr<Session> session;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id = NextSessionId();
    while (!issued_ids_.insert(id).second) {
      id = NextSessionId();
    }
    session = std::make_shared<Session>(std::move(id), options_);

    // Queued before the session becomes visible, so nothing can overtake it.
    nlohmann::json params = manifest.is_object() ? manifest : nlohmann::json::object();
    params["sessionId"] = session->id();
    if (!params.contains("tools")) {
      params["tools"] = nlohmann::json::array();
    }
    session->Enqueue(jsonrpc::FormatSseFrame(jsonrpc::MakeNotification(kManifestMethod, params)));
    sessions_.emplace(session->id(), session);
  }
  LogInfo("Session " + session->id() + " opened (" + std::to_string(LiveCount()) + " live)");
  return session;
}

bool SessionManager::Push(const std::string& session_id, const nlohmann::json& payload,
                          const std::string& event) {
  const auto session = Find(session_id);
  if (!session) {
    return false;
  }
  return session->Enqueue(jsonrpc::FormatSseFrame(payload, event));
}

std::size_t SessionManager::Broadcast(const nlohmann::json& payload, const std::string& event) {
  std::vector<std::shared_ptr<Session>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    targets.reserve(sessions_.size());
    for (const auto& entry : sessions_) {
      targets.push_back(entry.second);
    }
  }
  const std::string frame = jsonrpc::FormatSseFrame(payload, event);
  std::size_t delivered = 0;
  for (const auto& session : targets) {
    if (session->Enqueue(frame)) {
      ++delivered;
    }
  }
  return delivered;
}

void SessionManager::Close(const std::string& session_id, const std::string& reason) {
  if (const auto session = Find(session_id)) {
    session->BeginClosing(reason);
    LogDebug("Session " + session_id + " closing: " + reason);
  }
}

std::shared_ptr<Session> SessionManager::Find(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sessions_.find(session_id);
  return it == sessions_.end() ? nullptr : it->second;
}

std::size_t SessionManager::LiveCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

std::size_t SessionManager::ReapOnce() {
  std::vector<std::shared_ptr<Session>> reaped;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      if (it->second->TryFinalize()) {
        reaped.push_back(it->second);
        it = sessions_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (const auto& session : reaped) {
    LogInfo("Session " + session->id() + " closed (" + session->close_reason() + ")");
  }
  return reaped.size();
}

void SessionManager::StartReaper(std::chrono::milliseconds interval) {
  if (interval.count() <= 0) {
    throw std::invalid_argument("Reap interval must be positive");
  }
  std::lock_guard<std::mutex> lock(reaper_mutex_);
  if (reaper_running_) {
    return;
  }
  reaper_running_ = true;
  reaper_ = std::thread([this, interval] { ReaperLoop(interval); });
}

void SessionManager::StopReaper() {
  {
    std::lock_guard<std::mutex> lock(reaper_mutex_);
    if (!reaper_running_) {
      return;
    }
    reaper_running_ = false;
  }
  reaper_wake_.notify_all();
  if (reaper_.joinable()) {
    reaper_.join();
  }
}

void SessionManager::ReaperLoop(std::chrono::milliseconds interval) {
  std::unique_lock<std::mutex> lock(reaper_mutex_);
  while (reaper_running_) {
    reaper_wake_.wait_for(lock, interval, [this] { return !reaper_running_; });
    if (!reaper_running_) {
      break;
    }
    lock.unlock();
    ReapOnce();
    lock.lock();
  }
}

void SessionManager::Shutdown() {
  std::vector<std::shared_ptr<Session>> all;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : sessions_) {
      all.push_back(entry.second);
    }
  }
  for (const auto& session : all) {
    session->BeginClosing("server shutting down");
  }
  ReapOnce();
}

}  // namespace gateway
