#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace algoprobe {
namespace util {

/**
 * ThreadSafeMap - mutex-guarded wrapper around std::map / std::unordered_map
 *
 * Usage:
 *   ThreadSafeMap<uint64_t, PeerConnectionPtr> peers_;
 *   peers_.Insert(id, conn);
 *   peers_.Read(id, [&](const PeerConnectionPtr& c) { c->send_frame(bytes); });
 *   peers_.Erase(id);
 *
 * Every operation takes the lock once. Callbacks run under the lock, so keep
 * them short and never call back into the same map from inside one.
 */
template <typename Key, typename Value,
          template<typename...> class MapType = std::unordered_map>
class ThreadSafeMap {
public:
    ThreadSafeMap() = default;

    ThreadSafeMap(const ThreadSafeMap&) = delete;
    ThreadSafeMap& operator=(const ThreadSafeMap&) = delete;

    /**
     * Insert or update a key-value pair
     * Returns true if inserted, false if updated
     */
    bool Insert(const Key& key, const Value& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [it, inserted] = map_.insert_or_assign(key, value);
        return inserted;
    }

    /**
     * Insert only if key doesn't exist
     */
    bool TryInsert(const Key& key, const Value& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.insert({key, value}).second;
    }

    /**
     * Calls reader(const Value&) under lock if key exists
     */
    template <typename Func>
    bool Read(const Key& key, Func&& reader) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end()) {
            return false;
        }
        reader(it->second);
        return true;
    }

    std::optional<Value> Get(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool Contains(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.count(key) > 0;
    }

    bool Erase(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.size();
    }

    bool Empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.empty();
    }

    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        map_.clear();
    }

    /**
     * Snapshot of all entries (safe to iterate without lock)
     */
    std::vector<std::pair<Key, Value>> GetAll() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<std::pair<Key, Value>>(map_.begin(), map_.end());
    }

    std::vector<Key> GetKeys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Key> keys;
        keys.reserve(map_.size());
        for (const auto& [key, _] : map_) {
            keys.push_back(key);
        }
        return keys;
    }

private:
    mutable std::mutex mutex_;
    MapType<Key, Value> map_;
};

/**
 * BoundedQueue - fixed-capacity blocking FIFO
 *
 * Push() blocks while the queue is full, so a slow consumer stalls the
 * producer instead of losing items. Consumers block in Pop() / PopFor() until
 * an item arrives, the timeout expires or the queue is closed.
 *
 * After Close(), pushes (including blocked ones) are rejected and pops drain
 * what is left, then return std::nullopt.
 */
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    bool Push(T item) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    std::optional<T> TryPop() {
        std::unique_lock<std::mutex> lock(mutex_);
        return PopLocked(lock);
    }

    std::optional<T> Pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        return PopLocked(lock);
    }

    std::optional<T> PopFor(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
        return PopLocked(lock);
    }

    void Close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool IsClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t Capacity() const { return capacity_; }

private:
    std::optional<T> PopLocked(std::unique_lock<std::mutex> &lock) {
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    bool closed_{false};
};

} // namespace util
} // namespace algoprobe
