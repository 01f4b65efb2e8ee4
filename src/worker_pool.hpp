#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace bridge {

class WorkerPool {
 public:
  WorkerPool(std::string name, int threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // Returns false once Stop() has been called.
  bool Post(std::function<void()> task);

  // Runs every task already queued, then joins the threads. Idempotent.
  void Stop();

  size_t Pending() const;

 private:
  void Run();

  std::string name_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> tasks_;
  std::vector<std::thread> threads_;
  bool stopping_ = false;
};

}  // namespace bridge
