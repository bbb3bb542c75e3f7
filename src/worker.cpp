#include "keystone/worker.hpp"

#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <unistd.h>  // getpid, gethostname

#include "keystone/jsonlite.hpp"
#include "keystone/observability.hpp"

namespace keystone {

namespace {

WorkerIdentity g_worker_identity;
std::mutex     g_init_mu;
bool           g_initialized{false};

std::string get_hostname() {
  char buf[256] = {};
  if (::gethostname(buf, sizeof(buf) - 1) == 0) return buf;
  return "unknown-host";
}

std::string env_or(const char* name, const std::string& fallback) {
  const char* e = std::getenv(name);
  return (e && e[0]) ? std::string(e) : fallback;
}

}  // namespace

WorkerIdentity init_worker_identity(const std::string& worker_id, const std::string& node_id) {
  std::lock_guard<std::mutex> lk(g_init_mu);
  g_worker_identity.worker_id = worker_id.empty()
      ? env_or("KEYSTONE_WORKER_ID", "w-" + std::to_string(static_cast<long>(::getpid())))
      : worker_id;
  g_worker_identity.node_id = node_id.empty() ? env_or("KEYSTONE_NODE_ID", get_hostname()) : node_id;
  g_initialized = true;
  return g_worker_identity;
}

const WorkerIdentity& global_worker_identity() {
  {
    std::lock_guard<std::mutex> lk(g_init_mu);
    if (g_initialized) return g_worker_identity;
  }
  init_worker_identity();
  return g_worker_identity;
}

std::string worker_identity_to_json(const WorkerIdentity& w) {
  std::ostringstream o;
  o << "{"
    << "\"worker_id\":\"" << jsonlite::escape(w.worker_id) << "\""
    << ",\"node_id\":\"" << jsonlite::escape(w.node_id) << "\""
    << "}";
  return o.str();
}

// ---------------------------------------------------------------------------
// WorkerPool
// ---------------------------------------------------------------------------

WorkerPool::WorkerPool(size_t threads) {
  if (threads == 0) threads = 1;
  threads_.reserve(threads);
  for (size_t i = 0; i < threads; ++i) threads_.emplace_back([this] { run(); });
}

WorkerPool::~WorkerPool() { shutdown(); }

bool WorkerPool::submit(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (stopping_) return false;
    queue_.push_back(std::move(task));
  }
  cv_.notify_one();
  return true;
}

void WorkerPool::shutdown() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
}

uint64_t WorkerPool::queue_depth() const {
  std::lock_guard<std::mutex> lk(mu_);
  return queue_.size();
}

void WorkerPool::run() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, [this] { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) return;  // stopping and drained
      task = std::move(queue_.front());
      queue_.pop_front();
    }
    inflight_.fetch_add(1, std::memory_order_relaxed);
    try {
      task();
    } catch (const std::exception& e) {
      failures_.fetch_add(1, std::memory_order_relaxed);
      log_event(LogLevel::error, "worker", std::string("task failed: ") + e.what());
    }
    inflight_.fetch_sub(1, std::memory_order_relaxed);
    completed_.fetch_add(1, std::memory_order_relaxed);
  }
}

WorkerHealth worker_health_snapshot(const WorkerPool& pool) {
  WorkerHealth h;
  h.worker_id = global_worker_identity().worker_id;
  h.pool_size = pool.size();
  h.executions_inflight = pool.inflight();
  h.queue_depth = pool.queue_depth();
  h.utilization_pct = pool.size() == 0
      ? 0.0
      : 100.0 * static_cast<double>(h.executions_inflight) / static_cast<double>(pool.size());
  return h;
}

std::string worker_health_to_json(const WorkerHealth& h) {
  std::ostringstream o;
  char buf[32];
  o << "{"
    << "\"worker_id\":\"" << jsonlite::escape(h.worker_id) << "\""
    << ",\"alive\":" << (h.alive ? "true" : "false")
    << ",\"pool_size\":" << h.pool_size
    << ",\"executions_inflight\":" << h.executions_inflight
    << ",\"queue_depth\":" << h.queue_depth
    << ",\"utilization_pct\":";
  std::snprintf(buf, sizeof(buf), "%.2f", h.utilization_pct);
  o << buf << "}";
  return o.str();
}

}  // namespace keystone
