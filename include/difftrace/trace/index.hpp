#pragma once

#include "collection.hpp"
#include "context.hpp"
#include "version_map.hpp"
#include "difftrace/core/error.hpp"
#include "difftrace/core/log.hpp"
#include "difftrace/order/antichain.hpp"
#include "difftrace/order/version.hpp"
#include <concepts>
#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace difftrace::trace {

    template <typename T>
    concept Streamable = requires(std::ostream &os, const T &t) {
        { os << t } -> std::convertible_to<std::ostream &>;
    };

    // Summary of one compact() call, reported to the index observer.
    struct CompactionStats {
        std::size_t keys_visited = 0;
        std::size_t keys_compacted = 0;     // keys that had at least one version below the frontier
        std::size_t versions_collapsed = 0; // versions removed by advancing into the frontier
        std::size_t entries_before = 0;     // entries in merged buckets before consolidation
        std::size_t entries_after = 0;      // ... and after
        bool parallel = false;

        CompactionStats &operator+=(const CompactionStats &o) {
            keys_visited += o.keys_visited;
            keys_compacted += o.keys_compacted;
            versions_collapsed += o.versions_collapsed;
            entries_before += o.entries_before;
            entries_after += o.entries_after;
            return *this;
        }
    };

    // =========================================================================
    // Index<K, V>
    // =========================================================================
    //
    // A difference trace arranged by key: key -> version -> (value, multiplicity)
    // changes observed at that version. Versions may be partially ordered.
    //
    // Writes (add_value, append) never merge entries; identical
    // (key, version, value) entries coexist until compact() consolidates them.
    //
    // compact(F) folds every version not >= F forward into F. From then on
    // only versions and frontiers >= F may be read, written or compacted to;
    // anything earlier throws core::StaleVersionAccess.
    //
    // Not synchronized. One writer, no reads concurrent with writes; see
    // SharedIndex for a locked wrapper.

    template <Hashable K, Hashable V> class Index {
      public:
        using Version = difftrace::order::Version;
        using Antichain = difftrace::order::Antichain;
        using Bag = typename VersionMap<V>::Bag;
        using Observer = std::function<void(const CompactionStats &)>;

        template <typename V2> using JoinRecord = std::pair<K, std::pair<V, V2>>;
        template <typename V2> using JoinOutput = std::vector<std::pair<Version, Collection<JoinRecord<V2>>>>;

        Index() = default;

        // ---- Storage --------------------------------------------------------

        void add_value(const K &key, const Version &version, Entry<V> value) {
            validate(version);
            inner_[key].bag(version).push_back(std::move(value));
            modified_.insert(key);
        }

        // Concatenates other's entries onto this index, bucket by bucket. The
        // source versions are not checked against this index's frontier.
        void append(const Index &other) {
            if (&other == this) {
                Index copy = other;
                append(copy);
                return;
            }
            for (const auto &[key, versions] : other.inner_) {
                auto &mine = inner_[key];
                for (const auto &[version, bag] : versions)
                    mine.append(version, bag);
                modified_.insert(key);
            }
        }

        // ---- Reads ----------------------------------------------------------

        // Every entry recorded at a version <= requested, unconsolidated, in
        // storage order.
        std::vector<Entry<V>> reconstruct_at(const K &key, const Version &requested) const {
            validate(requested);
            std::vector<Entry<V>> out;
            auto it = inner_.find(key);
            if (it == inner_.end())
                return out;
            for (const auto &[version, bag] : it->second) {
                if (version.less_equal(requested))
                    out.insert(out.end(), bag.begin(), bag.end());
            }
            return out;
        }

        std::vector<Version> versions(const K &key) const {
            auto it = inner_.find(key);
            if (it == inner_.end())
                return {};
            return it->second.versions();
        }

        std::vector<K> keys() const {
            std::vector<K> out;
            out.reserve(inner_.size());
            for (const auto &[key, _] : inner_)
                out.push_back(key);
            return out;
        }

        bool has(const K &key) const { return inner_.count(key) > 0; }
        std::size_t size() const { return inner_.size(); }
        bool empty() const { return inner_.empty(); }

        std::size_t entry_count() const {
            std::size_t n = 0;
            for (const auto &[_, versions] : inner_)
                n += versions.entry_count();
            return n;
        }

        // Keys written since they were last compacted.
        std::vector<K> modified_keys() const { return std::vector<K>(modified_.begin(), modified_.end()); }

        const std::optional<Antichain> &compaction_frontier() const { return frontier_; }

        // ---- Join -----------------------------------------------------------

        // Cross product of matching keys. Each pair of entries
        // (v1, x, m1) x (v2, y, m2) contributes ((key, (x, y)), m1 * m2) at
        // version v1.join(v2). One output collection per distinct version, in
        // order of first appearance. A product outside the Multiplicity range
        // throws core::InvariantViolation.
        template <Hashable V2> JoinOutput<V2> join(const Index<K, V2> &other) const {
            std::vector<std::pair<Version, std::vector<Entry<JoinRecord<V2>>>>> grouped;
            std::unordered_map<Version, std::size_t> slot;

            for (const auto &[key, versions] : inner_) {
                auto oit = other.inner_.find(key);
                if (oit == other.inner_.end())
                    continue;
                const auto &other_versions = oit->second;

                for (const auto &[version1, data1] : versions) {
                    for (const auto &[version2, data2] : other_versions) {
                        if (data1.empty() || data2.empty())
                            continue;
                        Version result_version = version1.join(version2);
                        auto [sit, inserted] = slot.try_emplace(result_version, grouped.size());
                        if (inserted)
                            grouped.emplace_back(std::move(result_version), std::vector<Entry<JoinRecord<V2>>>{});
                        auto &records = grouped[sit->second].second;
                        for (const auto &[val1, mul1] : data1)
                            for (const auto &[val2, mul2] : data2)
                                records.emplace_back(JoinRecord<V2>{key, {val1, val2}}, detail::multiply(mul1, mul2));
                    }
                }
            }

            JoinOutput<V2> out;
            out.reserve(grouped.size());
            for (auto &[version, records] : grouped) {
                if (!records.empty())
                    out.emplace_back(std::move(version), Collection<JoinRecord<V2>>(std::move(records)));
            }
            return out;
        }

        // ---- Compaction -----------------------------------------------------

        // Advances every version of the selected keys (all keys when empty)
        // that is not >= frontier to version.advance_by(frontier), then
        // consolidates the buckets that received entries. Installs frontier.
        // Unknown keys are skipped. A frontier whose dimension differs from a
        // selected key's versions throws std::invalid_argument before anything
        // is changed.
        CompactionStats compact(const Antichain &frontier, const std::vector<K> &keys = {},
                                const ExecutionContext &ctx = {}) {
            check_monotonic(frontier);
            if (keys.empty())
                return compact_selected(frontier, this->keys(), ctx);
            std::vector<K> selected;
            selected.reserve(keys.size());
            std::unordered_set<K> seen;
            for (const auto &k : keys) {
                if (inner_.count(k) && seen.insert(k).second)
                    selected.push_back(k);
            }
            return compact_selected(frontier, selected, ctx);
        }

        // Compacts only the keys written since their last compaction. The
        // frontier is installed even when no key is pending.
        CompactionStats compact_modified(const Antichain &frontier, const ExecutionContext &ctx = {}) {
            check_monotonic(frontier);
            return compact_selected(frontier, modified_keys(), ctx);
        }

        // ---- Observability --------------------------------------------------

        // Called with the statistics of every compaction, after the frontier is
        // installed. Copies of the index share the observer.
        void set_observer(Observer observer) { observer_ = std::move(observer); }
        const Observer &observer() const { return observer_; }

        std::string to_string() const
            requires Streamable<K> && Streamable<V>
        {
            std::ostringstream oss;
            oss << "Index(";
            bool first_key = true;
            for (const auto &[key, versions] : inner_) {
                oss << (first_key ? "" : ", ") << key << ": {";
                first_key = false;
                bool first_version = true;
                for (const auto &[version, bag] : versions) {
                    oss << (first_version ? "" : ", ") << version.to_string() << ": [";
                    first_version = false;
                    for (std::size_t i = 0; i < bag.size(); ++i)
                        oss << (i ? ", " : "") << "(" << bag[i].first << ", " << bag[i].second << ")";
                    oss << "]";
                }
                oss << "}";
            }
            oss << ")";
            return oss.str();
        }

      private:
        template <Hashable K2, Hashable V2> friend class Index;

        void validate(const Version &requested) const {
            if (!frontier_ || frontier_->less_equal_version(requested))
                return;
            difftrace::core::Logger::instance().logf(difftrace::core::LogLevel::Error,
                                                     "stale access: %s is not beyond compaction frontier %s",
                                                     requested.to_string().c_str(), frontier_->to_string().c_str());
            throw difftrace::core::StaleVersionAccess(requested.to_string(), frontier_->to_string());
        }

        void check_monotonic(const Antichain &frontier) const {
            if (!frontier_ || frontier_->less_equal(frontier))
                return;
            difftrace::core::Logger::instance().logf(difftrace::core::LogLevel::Error,
                                                     "compact: frontier %s does not follow %s",
                                                     frontier.to_string().c_str(), frontier_->to_string().c_str());
            throw difftrace::core::NonMonotonicCompaction(frontier.to_string(), frontier_->to_string());
        }

        void check_dimensions(const Antichain &frontier, const std::vector<VersionMap<V> *> &maps) const {
            if (frontier.empty())
                return;
            const std::size_t dim = frontier.elements().front().dimension();
            for (const auto *versions : maps) {
                for (const auto &[version, _] : *versions) {
                    if (version.dimension() == dim)
                        continue;
                    difftrace::core::Logger::instance().logf(difftrace::core::LogLevel::Error,
                                                             "compact: frontier %s does not match %s",
                                                             frontier.to_string().c_str(), version.to_string().c_str());
                    throw std::invalid_argument("Version dimensions must match");
                }
            }
        }

        CompactionStats compact_selected(const Antichain &frontier, const std::vector<K> &selected,
                                         const ExecutionContext &ctx) {
            std::vector<VersionMap<V> *> maps;
            maps.reserve(selected.size());
            for (const auto &k : selected)
                maps.push_back(&inner_.find(k)->second);
            check_dimensions(frontier, maps);

            std::vector<CompactionStats> per_key(maps.size());
            CompactionStats stats;
            if (ctx.parallel_for(maps.size())) {
                // One task per key; each touches only its own VersionMap.
                ctx.pool()->bulk([&](std::size_t i) { per_key[i] = compact_key(*maps[i], frontier); }, maps.size());
                stats.parallel = true;
            } else {
                for (std::size_t i = 0; i < maps.size(); ++i)
                    per_key[i] = compact_key(*maps[i], frontier);
            }

            for (const auto &s : per_key)
                stats += s;
            for (const auto &k : selected)
                modified_.erase(k);

            frontier_ = frontier;

            difftrace::core::Logger::instance().logf(
                difftrace::core::LogLevel::Debug,
                "compact to %s: %zu keys visited, %zu compacted, %zu versions collapsed, entries %zu -> %zu",
                frontier.to_string().c_str(), stats.keys_visited, stats.keys_compacted, stats.versions_collapsed,
                stats.entries_before, stats.entries_after);
            if (observer_)
                observer_(stats);
            return stats;
        }

        static CompactionStats compact_key(VersionMap<V> &versions, const Antichain &frontier) {
            CompactionStats stats;
            stats.keys_visited = 1;

            // Materialize the partition before touching the map.
            std::vector<bool> advance;
            advance.reserve(versions.size());
            bool any = false;
            for (const auto &[version, _] : versions) {
                bool below = !frontier.less_equal_version(version);
                advance.push_back(below);
                any = any || below;
            }
            if (!any)
                return stats;

            auto buckets = versions.release();
            for (std::size_t i = 0; i < buckets.size(); ++i) {
                if (!advance[i])
                    versions.append(buckets[i].first, std::move(buckets[i].second));
            }

            std::vector<Version> merged;
            std::unordered_set<Version> merged_set;
            for (std::size_t i = 0; i < buckets.size(); ++i) {
                if (!advance[i])
                    continue;
                Version target = buckets[i].first.advance_by(frontier);
                versions.append(target, std::move(buckets[i].second));
                if (merged_set.insert(target).second)
                    merged.push_back(std::move(target));
                ++stats.versions_collapsed;
            }

            for (const auto &target : merged) {
                auto &bag = versions.bag(target);
                stats.entries_before += bag.size();
                bag = detail::consolidate_entries(bag);
                stats.entries_after += bag.size();
            }

            stats.keys_compacted = 1;
            return stats;
        }

        std::unordered_map<K, VersionMap<V>> inner_;
        std::unordered_set<K> modified_;
        std::optional<Antichain> frontier_;
        Observer observer_;
    };

} // namespace difftrace::trace
