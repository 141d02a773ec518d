#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace tendril {

// Unbounded MPSC queue. pop() drains what is left after close().
template <typename T> class Channel {
public:
  void push(T v) {
    {
      std::lock_guard<std::mutex> lk(m_);
      if (closed_)
        return;
      q_.push(std::move(v));
    }
    cv_.notify_one();
  }

  std::optional<T> pop() {
    std::unique_lock<std::mutex> lk(m_);
    cv_.wait(lk, [&] { return closed_ || !q_.empty(); });
    return take_locked();
  }

  std::optional<T> pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(m_);
    cv_.wait_for(lk, timeout, [&] { return closed_ || !q_.empty(); });
    return take_locked();
  }

  void close() {
    {
      std::lock_guard<std::mutex> lk(m_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lk(m_);
    return closed_;
  }

private:
  std::optional<T> take_locked() {
    if (q_.empty())
      return std::nullopt;
    T v = std::move(q_.front());
    q_.pop();
    return v;
  }

  mutable std::mutex m_;
  std::condition_variable cv_;
  std::queue<T> q_;
  bool closed_ = false;
};

} // namespace tendril
