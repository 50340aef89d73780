#include "difftrace/order/version.hpp"
#include "difftrace/order/antichain.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace difftrace::order {

    Version::Version(Coord coord) : coords_{coord} {}

    Version::Version(std::initializer_list<Coord> coords) : coords_(coords) {}

    Version::Version(std::vector<Coord> coords) : coords_(std::move(coords)) {}

    void Version::check_dimension(const Version &other) const {
        if (coords_.size() != other.coords_.size()) {
            throw std::invalid_argument("Version dimensions must match");
        }
    }

    bool Version::less_equal(const Version &other) const {
        check_dimension(other);
        for (std::size_t i = 0; i < coords_.size(); ++i) {
            if (coords_[i] > other.coords_[i])
                return false;
        }
        return true;
    }

    bool Version::less_than(const Version &other) const { return less_equal(other) && *this != other; }

    Version Version::join(const Version &other) const {
        check_dimension(other);
        std::vector<Coord> out(coords_.size());
        for (std::size_t i = 0; i < coords_.size(); ++i)
            out[i] = std::max(coords_[i], other.coords_[i]);
        return Version(std::move(out));
    }

    Version Version::meet(const Version &other) const {
        check_dimension(other);
        std::vector<Coord> out(coords_.size());
        for (std::size_t i = 0; i < coords_.size(); ++i)
            out[i] = std::min(coords_[i], other.coords_[i]);
        return Version(std::move(out));
    }

    Version Version::advance_by(const Antichain &frontier) const {
        if (frontier.empty())
            return *this;
        const auto &elems = frontier.elements();
        Version result = join(elems.front());
        for (std::size_t i = 1; i < elems.size(); ++i)
            result = result.meet(join(elems[i]));
        return result;
    }

    Version Version::extend() const {
        std::vector<Coord> out = coords_;
        out.push_back(0);
        return Version(std::move(out));
    }

    Version Version::truncate() const {
        if (coords_.empty()) {
            throw std::invalid_argument("Cannot truncate a zero-dimensional version");
        }
        std::vector<Coord> out(coords_.begin(), coords_.end() - 1);
        return Version(std::move(out));
    }

    Version Version::apply_step(Coord step) const {
        if (step == 0) {
            throw std::invalid_argument("Step must be positive");
        }
        if (coords_.empty()) {
            throw std::invalid_argument("Cannot step a zero-dimensional version");
        }
        std::vector<Coord> out = coords_;
        out.back() += step;
        return Version(std::move(out));
    }

    std::size_t Version::hash() const {
        // boost::hash_combine mixing
        std::size_t seed = coords_.size();
        for (Coord c : coords_)
            seed ^= std::hash<Coord>{}(c) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        return seed;
    }

    std::string Version::to_string() const {
        std::ostringstream oss;
        oss << "Version([";
        for (std::size_t i = 0; i < coords_.size(); ++i) {
            if (i > 0)
                oss << ",";
            oss << coords_[i];
        }
        oss << "])";
        return oss.str();
    }

} // namespace difftrace::order
