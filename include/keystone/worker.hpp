#pragma once

// keystone/worker.hpp — Worker identity and the execution worker pool.
//
// DESIGN:
//   Each process has one WorkerIdentity. Its worker_id is the owner recorded
//   on execution leases, so an operator can tell which process was driving
//   an execution when it was interrupted.
//
//   WorkerPool is a fixed set of threads draining a FIFO queue. Each submitted
//   task is one independent unit (an execution drive or a recovery); tasks
//   never block on one another through the pool.
//
// INVARIANT:
//   A task that throws is logged and counted; it never takes a pool thread
//   down with it.

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace keystone {

struct WorkerIdentity {
  std::string worker_id;   // "w-<pid>" unless KEYSTONE_WORKER_ID is set
  std::string node_id;     // hostname unless KEYSTONE_NODE_ID is set
};

// Sources, in priority order: explicit arguments, KEYSTONE_WORKER_ID /
// KEYSTONE_NODE_ID, then defaults.
WorkerIdentity init_worker_identity(const std::string& worker_id = "",
                                    const std::string& node_id = "");

// Read-only after first use.
const WorkerIdentity& global_worker_identity();

std::string worker_identity_to_json(const WorkerIdentity& w);

// ---------------------------------------------------------------------------
// WorkerPool
// ---------------------------------------------------------------------------
class WorkerPool {
 public:
  explicit WorkerPool(size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // False once shutdown() has begun.
  bool submit(std::function<void()> task);

  // Drains queued tasks, then joins every thread. Idempotent.
  void shutdown();

  size_t size() const { return threads_.size(); }
  uint64_t queue_depth() const;
  uint64_t inflight() const { return inflight_.load(std::memory_order_relaxed); }
  uint64_t completed() const { return completed_.load(std::memory_order_relaxed); }
  uint64_t task_failures() const { return failures_.load(std::memory_order_relaxed); }

 private:
  void run();

  std::vector<std::thread> threads_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> queue_;
  bool stopping_{false};
  std::atomic<uint64_t> inflight_{0};
  std::atomic<uint64_t> completed_{0};
  std::atomic<uint64_t> failures_{0};
};

struct WorkerHealth {
  std::string worker_id;
  bool        alive{true};
  uint64_t    pool_size{0};
  uint64_t    executions_inflight{0};
  uint64_t    queue_depth{0};
  double      utilization_pct{0.0};
};

WorkerHealth worker_health_snapshot(const WorkerPool& pool);
std::string worker_health_to_json(const WorkerHealth& h);

}  // namespace keystone
