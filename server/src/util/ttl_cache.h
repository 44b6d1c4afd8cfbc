#pragma once

#include <chrono>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace walkplan {

// Thread-safe key/value cache whose entries expire after a fixed TTL. Writes
// are plain overwrites, so racing writers computing the same key are
// harmless. When full, the least recently written entry is evicted.
template <typename Key, typename Value>
class TtlCache {
 public:
  using Clock = std::chrono::steady_clock;
  using NowFn = std::function<Clock::time_point()>;

  TtlCache(
      std::chrono::seconds ttl,
      size_t capacity,
      NowFn now = [] { return Clock::now(); }
  )
      : ttl_(ttl), capacity_(capacity), now_(std::move(now)) {}

  std::optional<Value> Get(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    if (now_() >= it->second.expires_at) {
      order_.erase(it->second.order_it);
      entries_.erase(it);
      return std::nullopt;
    }
    return it->second.value;
  }

  void Put(const Key& key, Value value) {
    if (capacity_ == 0) {
      return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
      order_.erase(it->second.order_it);
      entries_.erase(it);
    }
    while (entries_.size() >= capacity_) {
      entries_.erase(order_.front());
      order_.pop_front();
    }
    order_.push_back(key);
    entries_.emplace(
        key, Entry{std::move(value), now_() + ttl_, std::prev(order_.end())}
    );
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
  }

 private:
  struct Entry {
    Value value;
    Clock::time_point expires_at;
    typename std::list<Key>::iterator order_it;
  };

  std::chrono::seconds ttl_;
  size_t capacity_;
  NowFn now_;
  mutable std::mutex mutex_;
  std::list<Key> order_;
  std::unordered_map<Key, Entry> entries_;
};

}  // namespace walkplan
