#pragma once

#include "version.hpp"
#include <initializer_list>
#include <string>
#include <vector>

namespace difftrace::order {

    // -------------------------------------------------------------------------
    // Antichain
    // -------------------------------------------------------------------------
    //
    // A minimal set of pairwise-incomparable versions, used as a frontier:
    // every version not yet seen is >= some element of the set.
    //
    // Construction keeps only the minimal elements; an element that is >= one
    // already present is dropped.

    class Antichain {
      public:
        Antichain() = default;
        Antichain(std::initializer_list<Version> elements);
        explicit Antichain(const std::vector<Version> &elements);

        // True if every element of other is >= some element of this frontier.
        bool less_equal(const Antichain &other) const;
        bool less_than(const Antichain &other) const;

        // True if some element of this frontier is <= version.
        bool less_equal_version(const Version &version) const;

        Antichain meet(const Antichain &other) const;

        Antichain extend() const;
        Antichain truncate() const;
        Antichain apply_step(Version::Coord step) const;

        const std::vector<Version> &elements() const { return elements_; }
        bool empty() const { return elements_.empty(); }
        std::size_t size() const { return elements_.size(); }
        std::string to_string() const;

        // Set equality; element order is irrelevant.
        bool operator==(const Antichain &other) const;
        bool operator!=(const Antichain &other) const { return !(*this == other); }

      private:
        void insert(const Version &element);

        std::vector<Version> elements_;
    };

} // namespace difftrace::order
