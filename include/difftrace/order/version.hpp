#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <string>
#include <vector>

namespace difftrace::order {

    class Antichain;

    // -------------------------------------------------------------------------
    // Version
    // -------------------------------------------------------------------------
    //
    // A logical timestamp: a tuple of non-negative integers, one per nested
    // scope of the computation. One-dimensional versions are totally ordered;
    // multi-dimensional versions use the product partial order.
    //
    // All versions compared with each other must have the same dimension.
    // Immutable once constructed.

    class Version {
      public:
        using Coord = std::uint64_t;

        Version() = default;
        explicit Version(Coord coord);
        Version(std::initializer_list<Coord> coords);
        explicit Version(std::vector<Coord> coords);

        // ---- Lattice --------------------------------------------------------

        bool less_equal(const Version &other) const;
        bool less_than(const Version &other) const;

        // Least upper bound (coordinate-wise max).
        Version join(const Version &other) const;

        // Greatest lower bound (coordinate-wise min).
        Version meet(const Version &other) const;

        // Rounds this version up into the frontier: the meet, over every
        // element f of the frontier, of join(f). Identity for an empty frontier.
        Version advance_by(const Antichain &frontier) const;

        // ---- Scopes ---------------------------------------------------------

        Version extend() const;
        Version truncate() const;
        Version apply_step(Coord step) const;

        // ---- Accessors ------------------------------------------------------

        const std::vector<Coord> &coords() const { return coords_; }
        std::size_t dimension() const { return coords_.size(); }
        std::size_t hash() const;
        std::string to_string() const;

        bool operator==(const Version &other) const { return coords_ == other.coords_; }
        bool operator!=(const Version &other) const { return !(*this == other); }

        // Lexicographic; only for deterministic sorting, not the lattice order.
        bool operator<(const Version &other) const { return coords_ < other.coords_; }

      private:
        void check_dimension(const Version &other) const;

        std::vector<Coord> coords_;
    };

} // namespace difftrace::order

template <> struct std::hash<difftrace::order::Version> {
    std::size_t operator()(const difftrace::order::Version &v) const noexcept { return v.hash(); }
};
