#include "difftrace/order/antichain.hpp"
#include <algorithm>
#include <sstream>

namespace difftrace::order {

    Antichain::Antichain(std::initializer_list<Version> elements) {
        for (const auto &e : elements)
            insert(e);
    }

    Antichain::Antichain(const std::vector<Version> &elements) {
        for (const auto &e : elements)
            insert(e);
    }

    void Antichain::insert(const Version &element) {
        for (const auto &e : elements_) {
            if (e.less_equal(element))
                return;
        }
        std::erase_if(elements_, [&](const Version &x) { return element.less_equal(x); });
        elements_.push_back(element);
    }

    bool Antichain::less_equal(const Antichain &other) const {
        for (const auto &o : other.elements_) {
            if (!less_equal_version(o))
                return false;
        }
        return true;
    }

    bool Antichain::less_than(const Antichain &other) const { return less_equal(other) && *this != other; }

    bool Antichain::less_equal_version(const Version &version) const {
        return std::any_of(elements_.begin(), elements_.end(),
                           [&](const Version &e) { return e.less_equal(version); });
    }

    Antichain Antichain::meet(const Antichain &other) const {
        Antichain out;
        for (const auto &e : elements_)
            out.insert(e);
        for (const auto &e : other.elements_)
            out.insert(e);
        return out;
    }

    Antichain Antichain::extend() const {
        Antichain out;
        for (const auto &e : elements_)
            out.insert(e.extend());
        return out;
    }

    Antichain Antichain::truncate() const {
        Antichain out;
        for (const auto &e : elements_)
            out.insert(e.truncate());
        return out;
    }

    Antichain Antichain::apply_step(Version::Coord step) const {
        Antichain out;
        for (const auto &e : elements_)
            out.insert(e.apply_step(step));
        return out;
    }

    bool Antichain::operator==(const Antichain &other) const {
        if (elements_.size() != other.elements_.size())
            return false;
        auto a = elements_;
        auto b = other.elements_;
        std::sort(a.begin(), a.end());
        std::sort(b.begin(), b.end());
        return a == b;
    }

    std::string Antichain::to_string() const {
        std::ostringstream oss;
        oss << "Antichain([";
        for (std::size_t i = 0; i < elements_.size(); ++i) {
            if (i > 0)
                oss << ",";
            oss << "[";
            const auto &coords = elements_[i].coords();
            for (std::size_t j = 0; j < coords.size(); ++j) {
                if (j > 0)
                    oss << ",";
                oss << coords[j];
            }
            oss << "]";
        }
        oss << "])";
        return oss.str();
    }

} // namespace difftrace::order
