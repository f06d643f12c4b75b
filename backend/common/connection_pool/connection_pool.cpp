#include "connection_pool.hpp"
#include <stdexcept>

namespace common {

ConnectionPool::~ConnectionPool() {
  shutdown();

  std::lock_guard<std::mutex> lock(mutex_);
  while (!pool_.empty()) {
    pool_.pop();
  }
}

void ConnectionPool::shutdown() {
  shutdown_.store(true);
  condition_.notify_all();
}

bool ConnectionPool::validateConnection(Connection* conn) {
  return conn && conn->isValid();
}

std::unique_ptr<Connection> ConnectionPool::getConnectionFromPool() {
  std::unique_lock<std::mutex> lock(mutex_);

  // 等待连接可用或超时
  auto deadline = std::chrono::steady_clock::now() + cp_config_.timeout;

  while (pool_.empty() && active_connections_.load() >= cp_config_.max_connections && !shutdown_.load()) {
    if (condition_.wait_until(lock, deadline) == std::cv_status::timeout) {
      throw std::runtime_error("Connection pool timeout");
    }
  }

  if (shutdown_.load()) {
    throw std::runtime_error("Connection pool is shutting down");
  }

  std::unique_ptr<Connection> conn;

  while (!pool_.empty()) {
    conn = std::move(pool_.front());
    pool_.pop();
    if (validateConnection(conn.get())) {
      break;
    }
    conn.reset();
  }

  // 如果没有有效连接且未达到最大连接数，创建新连接
  if (!conn && active_connections_.load() < cp_config_.max_connections) {
    // 先占位, 防止解锁期间其他线程超额创建
    active_connections_.fetch_add(1);
    lock.unlock();
    try {
      conn = createConnection();
    } catch (...) {
      lock.lock();
      active_connections_.fetch_sub(1);
      condition_.notify_one();
      throw;
    }
    lock.lock();

    if (!conn) {
      active_connections_.fetch_sub(1);
      condition_.notify_one();
      throw std::runtime_error("Failed to create database connection");
    }
    return conn;
  }

  if (!conn) {
    throw std::runtime_error("No database connection available");
  }

  active_connections_.fetch_add(1);
  return conn;
}

void ConnectionPool::returnConnection(std::unique_ptr<Connection> conn) {
  if (!conn) return;
  std::lock_guard<std::mutex> lock(mutex_);

  active_connections_.fetch_sub(1);

  if (shutdown_.load() || !validateConnection(conn.get()) || pool_.size() >= cp_config_.min_connections) {
    conn.reset();
  } else {
    pool_.push(std::move(conn));
  }
  condition_.notify_one();
}

size_t ConnectionPool::availableConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  // 池内空闲连接也计在 max_connections - active 之内
  return cp_config_.max_connections - active_connections_.load();
}

}
