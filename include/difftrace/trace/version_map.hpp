#pragma once

#include "collection.hpp"
#include "difftrace/order/version.hpp"
#include <cstddef>
#include <iterator>
#include <unordered_map>
#include <utility>
#include <vector>

namespace difftrace::trace {

    // =========================================================================
    // VersionMap<V>
    // =========================================================================
    //
    // Per-key history: Version -> bag of (value, multiplicity) entries.
    //
    // Versions are only partially ordered, so there is no sort order to keep.
    // Buckets are enumerated in the order their version was first recorded,
    // which keeps reconstruction output deterministic. A hash index maps each
    // version to its bucket slot.

    template <typename V> class VersionMap {
      public:
        using Version = difftrace::order::Version;
        using Bag = std::vector<Entry<V>>;
        using Bucket = std::pair<Version, Bag>;
        using const_iterator = typename std::vector<Bucket>::const_iterator;

        // Returns the bag for version, creating an empty one at the end if absent.
        Bag &bag(const Version &version) {
            auto [it, inserted] = slot_.try_emplace(version, buckets_.size());
            if (inserted)
                buckets_.emplace_back(version, Bag{});
            return buckets_[it->second].second;
        }

        const Bag *find(const Version &version) const {
            auto it = slot_.find(version);
            if (it == slot_.end())
                return nullptr;
            return &buckets_[it->second].second;
        }

        bool contains(const Version &version) const { return slot_.count(version) > 0; }

        void append(const Version &version, const Bag &entries) {
            auto &b = bag(version);
            b.insert(b.end(), entries.begin(), entries.end());
        }

        void append(const Version &version, Bag &&entries) {
            auto &b = bag(version);
            if (b.empty()) {
                b = std::move(entries);
                return;
            }
            b.insert(b.end(), std::make_move_iterator(entries.begin()), std::make_move_iterator(entries.end()));
        }

        std::vector<Version> versions() const {
            std::vector<Version> out;
            out.reserve(buckets_.size());
            for (const auto &[version, _] : buckets_)
                out.push_back(version);
            return out;
        }

        std::size_t size() const { return buckets_.size(); }
        bool empty() const { return buckets_.empty(); }

        std::size_t entry_count() const {
            std::size_t n = 0;
            for (const auto &[_, b] : buckets_)
                n += b.size();
            return n;
        }

        const_iterator begin() const { return buckets_.begin(); }
        const_iterator end() const { return buckets_.end(); }

        // Moves every bucket out, leaving the map empty.
        std::vector<Bucket> release() {
            slot_.clear();
            return std::exchange(buckets_, {});
        }

      private:
        std::vector<Bucket> buckets_;
        std::unordered_map<Version, std::size_t> slot_;
    };

} // namespace difftrace::trace
