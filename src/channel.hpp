#pragma once
#include <deque>
#include <functional>
#include <iterator>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

// Unbounded FIFO handing values from one thread to another. Receiving never
// blocks; a consumer that wants to sleep installs a notifier instead, which
// runs on the sending thread after every accepted value.
template<typename T>
class Channel {
public:
  using Notifier = std::function<void()>;

  // False once the channel is closed; the value is dropped.
  bool send(T value) {
    Notifier notify;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if(closed_) return false;
      queue_.push_back(std::move(value));
      notify = notifier_;
    }
    if(notify) notify();
    return true;
  }

  std::optional<T> try_receive() {
    std::lock_guard<std::mutex> lock(mutex_);
    if(queue_.empty()) return std::nullopt;
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Everything queued right now, oldest first.
  std::vector<T> drain() {
    std::deque<T> taken;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      taken.swap(queue_);
    }
    return std::vector<T>(std::make_move_iterator(taken.begin()),
                          std::make_move_iterator(taken.end()));
  }

  // Further sends fail; values already queued stay receivable.
  void close() {
    Notifier notify;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if(closed_) return;
      closed_ = true;
      notify = notifier_;
    }
    if(notify) notify();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  void set_notifier(Notifier notifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    notifier_ = std::move(notifier);
  }

private:
  mutable std::mutex mutex_;
  std::deque<T> queue_;
  Notifier notifier_;
  bool closed_ = false;
};
