#pragma once

#include "index.hpp"
#include <cstddef>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace difftrace::trace {

    // Index guarded by a reader-writer lock, for an owner that compacts while
    // other threads read. Readers share the lock; add_value, append and
    // compact hold it exclusively, so every reader sees either the state
    // before a compaction or the state after it.
    //
    // The compaction observer runs after the lock is released and may call
    // back into the SharedIndex.
    template <Hashable K, Hashable V> class SharedIndex {
      public:
        using Version = typename Index<K, V>::Version;
        using Antichain = typename Index<K, V>::Antichain;
        template <typename V2> using JoinOutput = typename Index<K, V>::template JoinOutput<V2>;
        using Observer = typename Index<K, V>::Observer;

        SharedIndex() = default;

        // Takes over the observer installed on initial.
        explicit SharedIndex(Index<K, V> initial) : inner_(std::move(initial)), observer_(inner_.observer()) {
            inner_.set_observer(nullptr);
        }

        SharedIndex(const SharedIndex &) = delete;
        SharedIndex &operator=(const SharedIndex &) = delete;

        // ---- Writers --------------------------------------------------------

        void add_value(const K &key, const Version &version, Entry<V> value) {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            inner_.add_value(key, version, std::move(value));
        }

        void append(const Index<K, V> &other) {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            inner_.append(other);
        }

        CompactionStats compact(const Antichain &frontier, const std::vector<K> &keys = {},
                                const ExecutionContext &ctx = {}) {
            CompactionStats stats;
            Observer observer;
            {
                std::unique_lock<std::shared_mutex> lock(mutex_);
                stats = inner_.compact(frontier, keys, ctx);
                observer = observer_;
            }
            notify(observer, stats);
            return stats;
        }

        CompactionStats compact_modified(const Antichain &frontier, const ExecutionContext &ctx = {}) {
            CompactionStats stats;
            Observer observer;
            {
                std::unique_lock<std::shared_mutex> lock(mutex_);
                stats = inner_.compact_modified(frontier, ctx);
                observer = observer_;
            }
            notify(observer, stats);
            return stats;
        }

        void set_observer(Observer observer) {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            observer_ = std::move(observer);
        }

        // ---- Readers --------------------------------------------------------

        std::vector<Entry<V>> reconstruct_at(const K &key, const Version &version) const {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            return inner_.reconstruct_at(key, version);
        }

        std::vector<Version> versions(const K &key) const {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            return inner_.versions(key);
        }

        std::vector<K> keys() const {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            return inner_.keys();
        }

        bool has(const K &key) const {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            return inner_.has(key);
        }

        std::size_t size() const {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            return inner_.size();
        }

        std::size_t entry_count() const {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            return inner_.entry_count();
        }

        std::optional<Antichain> compaction_frontier() const {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            return inner_.compaction_frontier();
        }

        template <Hashable V2> JoinOutput<V2> join(const Index<K, V2> &other) const {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            return inner_.join(other);
        }

        template <Hashable V2> JoinOutput<V2> join(const SharedIndex<K, V2> &other) const {
            if (static_cast<const void *>(&other) == static_cast<const void *>(this)) {
                std::shared_lock<std::shared_mutex> lock(mutex_);
                return inner_.join(other.inner_);
            }
            std::shared_lock<std::shared_mutex> mine(mutex_, std::defer_lock);
            std::shared_lock<std::shared_mutex> theirs(other.mutex_, std::defer_lock);
            std::lock(mine, theirs);
            return inner_.join(other.inner_);
        }

        // Copy of the current state, for callers that want to read without
        // holding the lock. The copy has no observer.
        Index<K, V> snapshot() const {
            Index<K, V> copy;
            {
                std::shared_lock<std::shared_mutex> lock(mutex_);
                copy = inner_;
            }
            copy.set_observer(nullptr);
            return copy;
        }

      private:
        template <Hashable K2, Hashable V2> friend class SharedIndex;

        static void notify(const Observer &observer, const CompactionStats &stats) {
            if (observer)
                observer(stats);
        }

        mutable std::shared_mutex mutex_;
        Index<K, V> inner_;
        Observer observer_;
    };

} // namespace difftrace::trace
