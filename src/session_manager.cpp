#include "session_manager.hpp"

#include <algorithm>
#include <deque>
#include <exception>
#include <iostream>
#include <random>
#include <sstream>
#include <utility>
#include <vector>

namespace bridge {
namespace {

static std::string Hex(uint64_t v) {
  std::ostringstream oss;
  oss << std::hex << v;
  return oss.str();
}

static uint64_t Rand64() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  return rng();
}

}  // namespace

struct SessionManager::Slot {
  bool ready = false;
  // Set when the work produced nothing to send; the writer drops the slot.
  bool skip = false;
  Frame frame;
};

struct SessionManager::PendingWork {
  std::shared_ptr<Slot> slot;
  SessionWork work;
  std::optional<Frame> on_failure;
};

struct SessionManager::Session {
  std::string id;
  std::mutex mu;
  std::condition_variable cv;
  SessionState state = SessionState::kOpen;
  std::deque<std::shared_ptr<Slot>> outbound;
  // Submitted work waiting for one of this session's in-flight places.
  std::deque<PendingWork> backlog;
  size_t in_flight = 0;
  uint64_t delivered = 0;
  std::chrono::steady_clock::time_point drain_deadline;

  size_t Undelivered() const {
    size_t n = 0;
    for (const auto& slot : outbound) {
      if (!slot->skip) n++;
    }
    return n;
  }
};

const char* SessionStateName(SessionState state) {
  switch (state) {
    case SessionState::kOpen:
      return "open";
    case SessionState::kClosing:
      return "closing";
    case SessionState::kClosed:
      return "closed";
  }
  return "unknown";
}

std::string EncodeSseFrame(const Frame& frame) {
  std::string out;
  out.reserve(frame.data.size() + frame.event.size() + 16);
  if (!frame.event.empty()) out += "event: " + frame.event + "\n";
  size_t start = 0;
  while (true) {
    auto nl = frame.data.find('\n', start);
    out += "data: ";
    if (nl == std::string::npos) {
      out.append(frame.data, start, std::string::npos);
      out += "\n";
      break;
    }
    out.append(frame.data, start, nl - start);
    out += "\n";
    start = nl + 1;
  }
  out += "\n";
  return out;
}

std::string EncodeSseComment(const std::string& text) {
  return ": " + text + "\n\n";
}

SessionManager::SessionManager(SessionManagerConfig cfg)
    : cfg_(std::move(cfg)), pool_("session", cfg_.worker_threads) {
  if (cfg_.queue_capacity == 0) cfg_.queue_capacity = 1;
  const size_t fair_share = cfg_.worker_threads > 1 ? static_cast<size_t>(cfg_.worker_threads - 1) : 1;
  if (cfg_.max_in_flight_per_session == 0 || cfg_.max_in_flight_per_session > fair_share) {
    cfg_.max_in_flight_per_session = fair_share;
  }
}

SessionManager::~SessionManager() {
  Shutdown();
}

std::string SessionManager::OpenSession(BridgeError* err) {
  auto session = std::make_shared<Session>();
  size_t active = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (shutting_down_) {
      SetError(err, ErrorCode::kQueueClosed, "Server is shutting down");
      return {};
    }
    if (cfg_.max_sessions > 0 && sessions_.size() >= cfg_.max_sessions) {
      if (err) {
        *err = MakeError(ErrorCode::kQueueClosed, "Too many open sessions",
                         {{"max_sessions", cfg_.max_sessions}});
      }
      return {};
    }
    do {
      session->id = NewId("sse");
    } while (sessions_.count(session->id) != 0);
    sessions_[session->id] = session;
    active = sessions_.size();
  }
  std::cout << "[session] open id=" << session->id << " active=" << active << "\n";
  return session->id;
}

bool SessionManager::Push(const std::string& session_id, Frame frame, BridgeError* err) {
  auto s = Find(session_id);
  if (!s) {
    SetError(err, ErrorCode::kSessionNotFound, "Unknown session: " + session_id);
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(s->mu);
    if (s->state != SessionState::kOpen) {
      SetError(err, ErrorCode::kSessionNotFound, "Session is closed: " + session_id);
      return false;
    }
    auto slot = std::make_shared<Slot>();
    slot->ready = true;
    slot->frame = std::move(frame);
    s->outbound.push_back(std::move(slot));
  }
  s->cv.notify_all();
  return true;
}

bool SessionManager::Submit(const std::string& session_id, SessionWork work, BridgeError* err) {
  return Submit(session_id, std::move(work), std::nullopt, err);
}

bool SessionManager::Submit(const std::string& session_id,
                            SessionWork work,
                            std::optional<Frame> on_failure,
                            BridgeError* err) {
  auto s = Find(session_id);
  if (!s) {
    SetError(err, ErrorCode::kSessionNotFound, "Unknown session: " + session_id);
    return false;
  }

  PendingWork pending{std::make_shared<Slot>(), std::move(work), std::move(on_failure)};
  {
    std::unique_lock<std::mutex> lock(s->mu);
    s->cv.wait(lock, [&] { return s->state != SessionState::kOpen || s->outbound.size() < cfg_.queue_capacity; });
    if (s->state != SessionState::kOpen) {
      SetError(err, ErrorCode::kSessionNotFound, "Session is closed: " + session_id);
      return false;
    }
    s->outbound.push_back(pending.slot);
    if (s->in_flight >= cfg_.max_in_flight_per_session) {
      s->backlog.push_back(std::move(pending));
      return true;
    }
    s->in_flight++;
  }

  if (!Launch(s, std::move(pending))) {
    SetError(err, ErrorCode::kQueueClosed, "Server is shutting down");
    return false;
  }
  return true;
}

bool SessionManager::Launch(const std::shared_ptr<Session>& s, PendingWork pending) {
  auto slot = pending.slot;
  bool posted = pool_.Post([this, s, pending = std::move(pending)]() {
    std::optional<Frame> frame;
    bool failed = false;
    try {
      frame = pending.work();
    } catch (const std::exception& e) {
      failed = true;
      std::cout << "[session] work failed id=" << s->id << " error=" << e.what() << "\n";
    } catch (...) {
      failed = true;
      std::cout << "[session] work failed id=" << s->id << " error=non-std exception\n";
    }
    if (failed) frame = pending.on_failure;

    std::optional<PendingWork> next;
    {
      std::lock_guard<std::mutex> lock(s->mu);
      if (s->state == SessionState::kClosed) {
        if (frame) {
          std::cout << "[session] warning: discarding result for closed session id=" << s->id << "\n";
        }
      } else if (frame) {
        pending.slot->frame = std::move(*frame);
        pending.slot->ready = true;
      } else {
        pending.slot->skip = true;
      }
      // The in-flight place passes straight to the next backlog entry.
      if (s->state != SessionState::kClosed && !s->backlog.empty()) {
        next = std::move(s->backlog.front());
        s->backlog.pop_front();
      } else {
        s->in_flight--;
      }
    }
    s->cv.notify_all();
    if (next && !Launch(s, std::move(*next))) {
      std::cout << "[session] warning: pool closed, dropping queued work id=" << s->id << "\n";
    }
  });
  if (!posted) {
    {
      std::lock_guard<std::mutex> lock(s->mu);
      s->in_flight--;
      slot->skip = true;
    }
    s->cv.notify_all();
  }
  return posted;
}

PollStatus SessionManager::NextFrame(const std::string& session_id, std::chrono::milliseconds wait, Frame* out) {
  auto s = Find(session_id);
  if (!s) return PollStatus::kClosed;

  const auto until = std::chrono::steady_clock::now() + wait;
  std::unique_lock<std::mutex> lock(s->mu);
  while (true) {
    while (!s->outbound.empty() && s->outbound.front()->skip) {
      s->outbound.pop_front();
      s->cv.notify_all();
    }
    if (s->state == SessionState::kClosed) return PollStatus::kClosed;

    if (!s->outbound.empty() && s->outbound.front()->ready) {
      if (out) *out = std::move(s->outbound.front()->frame);
      s->outbound.pop_front();
      s->delivered++;
      s->cv.notify_all();
      return PollStatus::kFrame;
    }

    const auto now = std::chrono::steady_clock::now();
    auto wake = until;
    if (s->state == SessionState::kClosing) {
      const bool drained = s->outbound.empty();
      if (drained || now >= s->drain_deadline) {
        const size_t discarded = s->Undelivered();
        s->outbound.clear();
        s->backlog.clear();
        s->state = SessionState::kClosed;
        const auto delivered = s->delivered;
        s->cv.notify_all();
        lock.unlock();
        if (discarded > 0) {
          std::cout << "[session] warning: drain period expired id=" << session_id << " discarded=" << discarded
                    << "\n";
        }
        std::cout << "[session] closed id=" << session_id << " reason=drained delivered=" << delivered << "\n";
        Forget(session_id);
        return PollStatus::kClosed;
      }
      wake = std::min(until, s->drain_deadline);
    }
    if (now >= until) return PollStatus::kTimeout;
    s->cv.wait_until(lock, wake);
  }
}

bool SessionManager::CloseSession(const std::string& session_id, CloseMode mode, const std::string& reason) {
  auto s = Find(session_id);
  if (!s) return false;

  bool forget = false;
  {
    std::lock_guard<std::mutex> lock(s->mu);
    if (s->state == SessionState::kClosed) return false;
    if (mode == CloseMode::kAbort) {
      const size_t discarded = s->Undelivered();
      s->outbound.clear();
      s->backlog.clear();
      s->state = SessionState::kClosed;
      forget = true;
      std::cout << "[session] closed id=" << session_id << " reason=" << reason << " delivered=" << s->delivered
                << " in_flight=" << s->in_flight << " discarded=" << discarded << "\n";
    } else if (s->state == SessionState::kOpen) {
      s->state = SessionState::kClosing;
      s->drain_deadline = std::chrono::steady_clock::now() + cfg_.drain_timeout;
      std::cout << "[session] closing id=" << session_id << " reason=" << reason
                << " pending=" << s->outbound.size() << "\n";
    }
  }
  s->cv.notify_all();
  if (forget) Forget(session_id);
  return true;
}

void SessionManager::Shutdown() {
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (shut_down_) return;
    shutting_down_ = true;
    ids.reserve(sessions_.size());
    for (const auto& kv : sessions_) ids.push_back(kv.first);
  }
  std::cout << "[session] shutdown sessions=" << ids.size() << "\n";
  for (const auto& id : ids) CloseSession(id, CloseMode::kDrain, "shutdown");

  std::vector<std::string> remaining;
  {
    std::unique_lock<std::mutex> lock(mu_);
    // Writers finish the drain; allow them a little past the deadline to notice it.
    closed_cv_.wait_for(lock, cfg_.drain_timeout + std::chrono::milliseconds(500),
                        [&] { return sessions_.empty(); });
    for (const auto& kv : sessions_) remaining.push_back(kv.first);
  }
  for (const auto& id : remaining) {
    std::cout << "[session] warning: forcing close id=" << id << "\n";
    CloseSession(id, CloseMode::kAbort, "shutdown_timeout");
  }

  pool_.Stop();
  {
    std::lock_guard<std::mutex> lock(mu_);
    shut_down_ = true;
  }
  std::cout << "[session] shutdown complete\n";
}

std::optional<SessionState> SessionManager::State(const std::string& session_id) const {
  auto s = Find(session_id);
  if (!s) return std::nullopt;
  std::lock_guard<std::mutex> lock(s->mu);
  return s->state;
}

size_t SessionManager::SessionCount() const {
  std::lock_guard<std::mutex> lock(mu_);
  return sessions_.size();
}

std::shared_ptr<SessionManager::Session> SessionManager::Find(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) return nullptr;
  return it->second;
}

void SessionManager::Forget(const std::string& session_id) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    sessions_.erase(session_id);
  }
  closed_cv_.notify_all();
}

std::string NewId(const std::string& prefix) {
  auto now = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
          .count());
  return prefix + "-" + Hex(now) + "-" + Hex(Rand64());
}

}  // namespace bridge
