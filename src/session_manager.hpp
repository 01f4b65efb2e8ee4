#pragma once

#include "errors.hpp"
#include "worker_pool.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace bridge {

enum class SessionState {
  kOpen,
  kClosing,
  kClosed,
};

const char* SessionStateName(SessionState state);

// One server-sent event. An empty event name means the default "message" event.
struct Frame {
  std::string event;
  std::string data;
};

std::string EncodeSseFrame(const Frame& frame);
std::string EncodeSseComment(const std::string& text);

enum class CloseMode {
  // Stop accepting input, keep delivering until the queue is empty or the drain period ends.
  kDrain,
  // The stream is gone: close at once, results of in-flight work are discarded on completion.
  kAbort,
};

enum class PollStatus {
  kFrame,
  kTimeout,
  kClosed,
};

struct SessionManagerConfig {
  std::chrono::milliseconds drain_timeout{5000};
  size_t queue_capacity = 256;
  int worker_threads = 8;
  // Dispatches one session may have running on the pool at once; further work waits in
  // that session's backlog. Capped at worker_threads - 1 (the default for 0), so no session
  // can hold every worker.
  size_t max_in_flight_per_session = 0;
  // Open sessions allowed at once; 0 means unlimited.
  size_t max_sessions = 0;
};

// Produces the frame answering one inbound message, or std::nullopt when nothing is owed
// (notifications). Runs on the worker pool.
using SessionWork = std::function<std::optional<Frame>()>;

class SessionManager {
 public:
  explicit SessionManager(SessionManagerConfig cfg = {});
  ~SessionManager();

  SessionManager(const SessionManager&) = delete;
  SessionManager& operator=(const SessionManager&) = delete;

  // Returns the new session id, or an empty string (with *err set) while shutting down or
  // when max_sessions are already open.
  std::string OpenSession(BridgeError* err);

  // Enqueues a frame that is ready now, behind everything already queued.
  bool Push(const std::string& session_id, Frame frame, BridgeError* err);

  // Reserves the next outbound slot and runs `work` on the pool. Blocks while the
  // session's outbound queue is full. When `work` throws, `on_failure` fills the slot.
  bool Submit(const std::string& session_id, SessionWork work, BridgeError* err);
  bool Submit(const std::string& session_id, SessionWork work, std::optional<Frame> on_failure, BridgeError* err);

  // Single-writer side: waits up to `wait` for the head of the queue to become ready.
  // Frames come out in the order they were pushed or submitted.
  PollStatus NextFrame(const std::string& session_id, std::chrono::milliseconds wait, Frame* out);

  bool CloseSession(const std::string& session_id, CloseMode mode, const std::string& reason);

  // Drains every session (bounded by the drain timeout), forces the rest closed and joins
  // the worker pool. Nothing dispatched through this manager runs after it returns.
  void Shutdown();

  std::optional<SessionState> State(const std::string& session_id) const;
  size_t SessionCount() const;

 private:
  struct Slot;
  struct Session;
  struct PendingWork;

  bool Launch(const std::shared_ptr<Session>& s, PendingWork pending);
  std::shared_ptr<Session> Find(const std::string& session_id) const;
  void Forget(const std::string& session_id);

  SessionManagerConfig cfg_;
  mutable std::mutex mu_;
  std::condition_variable closed_cv_;
  std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
  bool shutting_down_ = false;
  bool shut_down_ = false;
  WorkerPool pool_;
};

std::string NewId(const std::string& prefix);

}  // namespace bridge
