#pragma once

/// @file concurrent_cache.hpp
/// @brief Compute-if-absent cache shared between callers
///
/// The map mutex is held only to decide whether a key is already present.
/// The first caller for a key runs the factory outside the lock; concurrent
/// callers for the same key block on a shared future and observe the same
/// value (or the same exception). A factory that throws leaves no entry
/// behind, so a later call retries the construction.

#include "fwd.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace attest_core {

template<typename K, typename V>
class ConcurrentCache {
public:
    /// Invoked for every constructed value when the cache is cleared or destroyed
    using Cleanup = std::function<void(const K&, const V&)>;

    ConcurrentCache() = default;
    explicit ConcurrentCache(Cleanup cleanup) : m_cleanup(std::move(cleanup)) {}

    ~ConcurrentCache() { clear(); }

    ConcurrentCache(const ConcurrentCache&) = delete;
    ConcurrentCache& operator=(const ConcurrentCache&) = delete;

    /// Return the cached value for key, constructing it with factory if absent
    template<typename F>
    V get_or_create(const K& key, F&& factory) {
        std::promise<V> promise;
        std::shared_future<V> future;
        std::uint64_t slot_id = 0;
        bool owner = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_entries.find(key);
            if (it != m_entries.end()) {
                future = it->second.future;
            } else {
                future = promise.get_future().share();
                slot_id = ++m_constructions;
                m_entries.emplace(key, Slot{future, slot_id});
                owner = true;
            }
        }
        if (owner) {
            construct(key, slot_id, promise, std::forward<F>(factory));
        }
        return future.get();
    }

    /// Return the value for key if it has finished construction
    [[nodiscard]] std::optional<V> get(const K& key) const {
        std::shared_future<V> future;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_entries.find(key);
            if (it == m_entries.end()) {
                return std::nullopt;
            }
            future = it->second.future;
        }
        if (!is_ready(future)) {
            return std::nullopt;
        }
        return future.get();
    }

    [[nodiscard]] bool contains(const K& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_entries.find(key) != m_entries.end();
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_entries.size();
    }

    /// Number of factory invocations since creation
    [[nodiscard]] std::size_t construction_count() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<std::size_t>(m_constructions);
    }

    /// Forget one entry without running the cleanup callback
    void erase(const K& key) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.erase(key);
    }

    /// Drop every entry, running the cleanup callback on finished values
    void clear() {
        std::unordered_map<K, Slot> entries;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            entries.swap(m_entries);
        }
        if (!m_cleanup) {
            return;
        }
        for (auto& [key, slot] : entries) {
            if (is_ready(slot.future)) {
                m_cleanup(key, slot.future.get());
            }
        }
    }

private:
    static bool is_ready(const std::shared_future<V>& future) {
        return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    struct Slot {
        std::shared_future<V> future;
        std::uint64_t id;
    };

    template<typename F>
    void construct(const K& key, std::uint64_t slot_id, std::promise<V>& promise, F&& factory) {
        try {
            promise.set_value(factory());
        } catch (...) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                auto it = m_entries.find(key);
                if (it != m_entries.end() && it->second.id == slot_id) {
                    m_entries.erase(it);
                }
            }
            // Waiting callers and this caller all observe the same exception
            promise.set_exception(std::current_exception());
        }
    }

    mutable std::mutex m_mutex;
    std::unordered_map<K, Slot> m_entries;
    std::uint64_t m_constructions = 0;
    Cleanup m_cleanup;
};

} // namespace attest_core
