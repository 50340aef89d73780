#pragma once

#include "difftrace/core/error.hpp"
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <limits>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace difftrace::trace {

    // Signed occurrence count. Negative values retract earlier assertions.
    using Multiplicity = std::int64_t;

    template <typename T> using Entry = std::pair<T, Multiplicity>;

    // Keys and values of an index are grouped with std::unordered_map.
    template <typename T>
    concept Hashable = std::equality_comparable<T> && requires(const T &a) {
        { std::hash<T>{}(a) } -> std::convertible_to<std::size_t>;
    };

    namespace detail {

        // Product of two multiplicities. Throws InvariantViolation instead of
        // wrapping when the result does not fit in a Multiplicity.
        inline Multiplicity multiply(Multiplicity a, Multiplicity b) {
            constexpr Multiplicity hi = std::numeric_limits<Multiplicity>::max();
            constexpr Multiplicity lo = std::numeric_limits<Multiplicity>::min();
            bool overflow = false;
            if (a > 0)
                overflow = b > 0 ? a > hi / b : b < lo / a;
            else if (a < 0)
                overflow = b > 0 ? a < lo / b : b < hi / a;
            if (overflow)
                throw difftrace::core::InvariantViolation("Multiplicity overflow: " + std::to_string(a) + " * " +
                                                          std::to_string(b));
            return a * b;
        }

        // Sums multiplicities per distinct value and drops values that net to
        // zero. Survivors keep the position of their first occurrence.
        template <Hashable T> std::vector<Entry<T>> consolidate_entries(const std::vector<Entry<T>> &entries) {
            std::unordered_map<T, std::size_t> slot;
            std::vector<Entry<T>> sums;
            sums.reserve(entries.size());
            for (const auto &[value, mult] : entries) {
                auto [it, inserted] = slot.try_emplace(value, sums.size());
                if (inserted)
                    sums.emplace_back(value, mult);
                else
                    sums[it->second].second += mult;
            }

            std::vector<Entry<T>> out;
            out.reserve(sums.size());
            for (auto &e : sums) {
                if (e.second != 0)
                    out.push_back(std::move(e));
            }
            return out;
        }

    } // namespace detail

    // -------------------------------------------------------------------------
    // Collection<T>
    // -------------------------------------------------------------------------
    //
    // An ordered multiset of (value, multiplicity) pairs. A value may appear
    // any number of times; its net multiplicity is the sum of its entries.
    // Nothing is merged implicitly; call consolidate() for the net form.

    template <typename T> class Collection {
      public:
        using value_type = Entry<T>;
        using const_iterator = typename std::vector<Entry<T>>::const_iterator;

        Collection() = default;
        explicit Collection(std::vector<Entry<T>> entries) : entries_(std::move(entries)) {}
        Collection(std::initializer_list<Entry<T>> entries) : entries_(entries) {}

        const std::vector<Entry<T>> &entries() const { return entries_; }
        std::size_t size() const { return entries_.size(); }
        bool empty() const { return entries_.empty(); }

        const_iterator begin() const { return entries_.begin(); }
        const_iterator end() const { return entries_.end(); }

        Collection negate() const {
            std::vector<Entry<T>> out;
            out.reserve(entries_.size());
            for (const auto &[value, mult] : entries_)
                out.emplace_back(value, -mult);
            return Collection(std::move(out));
        }

        Collection concat(const Collection &other) const {
            std::vector<Entry<T>> out;
            out.reserve(entries_.size() + other.entries_.size());
            out.insert(out.end(), entries_.begin(), entries_.end());
            out.insert(out.end(), other.entries_.begin(), other.entries_.end());
            return Collection(std::move(out));
        }

        Collection consolidate() const
            requires Hashable<T>
        {
            return Collection(detail::consolidate_entries(entries_));
        }

        // Exact, order-sensitive comparison.
        bool operator==(const Collection &other) const { return entries_ == other.entries_; }
        bool operator!=(const Collection &other) const { return !(*this == other); }

      private:
        std::vector<Entry<T>> entries_;
    };

} // namespace difftrace::trace
