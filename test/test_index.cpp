#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <difftrace/difftrace.hpp>
#include <doctest/doctest.h>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

using namespace difftrace::trace;
using difftrace::order::Antichain;
using difftrace::order::Version;

using Entries = std::vector<Entry<int>>;

namespace {

    bool contains_version(const std::vector<Version> &versions, const Version &v) {
        return std::find(versions.begin(), versions.end(), v) != versions.end();
    }

} // namespace

TEST_CASE("Index basic operations") {
    Index<std::string, int> index;

    SUBCASE("add and reconstruct values") {
        index.add_value("key1", Version{1}, {10, 1});
        index.add_value("key1", Version{1}, {20, 2});
        CHECK(index.reconstruct_at("key1", Version{1}) == Entries{{10, 1}, {20, 2}});
    }

    SUBCASE("unknown key reconstructs to nothing") {
        CHECK(index.reconstruct_at("nonexistent", Version{1}).empty());
        CHECK(index.versions("nonexistent").empty());
        CHECK_FALSE(index.has("nonexistent"));
    }

    SUBCASE("versions lists every recorded version once") {
        index.add_value("key1", Version{1}, {10, 1});
        index.add_value("key1", Version{2}, {20, 1});
        index.add_value("key1", Version{1}, {30, 1});
        auto versions = index.versions("key1");
        CHECK(versions.size() == 2);
        CHECK(contains_version(versions, Version{1}));
        CHECK(contains_version(versions, Version{2}));
    }

    SUBCASE("keys, has and size") {
        index.add_value("a", Version{0}, {1, 1});
        index.add_value("b", Version{0}, {2, 1});
        CHECK(index.size() == 2);
        CHECK(index.has("a"));
        CHECK(index.has("b"));
        auto keys = index.keys();
        std::sort(keys.begin(), keys.end());
        CHECK(keys == std::vector<std::string>{"a", "b"});
        CHECK(index.entry_count() == 2);
    }

    SUBCASE("no frontier before the first compaction") { CHECK_FALSE(index.compaction_frontier().has_value()); }
}

TEST_CASE("Index reconstruction filters by the partial order") {
    Index<std::string, int> index;

    SUBCASE("only versions <= the requested one contribute") {
        index.add_value("k", Version{1}, {10, 1});
        index.add_value("k", Version{2}, {20, 1});
        index.add_value("k", Version{3}, {30, 1});
        CHECK(index.reconstruct_at("k", Version{0}).empty());
        CHECK(index.reconstruct_at("k", Version{1}) == Entries{{10, 1}});
        CHECK(index.reconstruct_at("k", Version{2}) == Entries{{10, 1}, {20, 1}});
        CHECK(index.reconstruct_at("k", Version{9}) == Entries{{10, 1}, {20, 1}, {30, 1}});
    }

    SUBCASE("incomparable versions are excluded") {
        index.add_value("k", Version{1, 0}, {10, 1});
        index.add_value("k", Version{0, 1}, {20, 1});
        index.add_value("k", Version{1, 1}, {30, 1});
        CHECK(index.reconstruct_at("k", Version{1, 0}) == Entries{{10, 1}});
        CHECK(index.reconstruct_at("k", Version{0, 1}) == Entries{{20, 1}});
        CHECK(index.reconstruct_at("k", Version{1, 1}) == Entries{{10, 1}, {20, 1}, {30, 1}});
        CHECK(index.reconstruct_at("k", Version{0, 0}).empty());
    }

    SUBCASE("entries are not consolidated") {
        index.add_value("k", Version{1}, {10, 1});
        index.add_value("k", Version{1}, {10, -1});
        index.add_value("k", Version{1}, {10, 1});
        CHECK(index.reconstruct_at("k", Version{1}) == Entries{{10, 1}, {10, -1}, {10, 1}});
    }

    SUBCASE("keys do not bleed into each other") {
        index.add_value("a", Version{1}, {1, 1});
        index.add_value("b", Version{1}, {2, 1});
        CHECK(index.reconstruct_at("a", Version{1}) == Entries{{1, 1}});
        CHECK(index.reconstruct_at("b", Version{1}) == Entries{{2, 1}});
    }
}

TEST_CASE("Index append") {
    Index<std::string, int> index;
    Index<std::string, int> other;

    SUBCASE("appends data from another index") {
        index.add_value("key1", Version{1}, {10, 1});
        other.add_value("key1", Version{1}, {20, 1});
        other.add_value("key2", Version{1}, {30, 1});

        index.append(other);

        CHECK(index.reconstruct_at("key1", Version{1}) == Entries{{10, 1}, {20, 1}});
        CHECK(index.reconstruct_at("key2", Version{1}) == Entries{{30, 1}});
        CHECK(other.reconstruct_at("key1", Version{1}) == Entries{{20, 1}});
    }

    SUBCASE("append composes with reconstruction") {
        index.add_value("k", Version{1}, {1, 1});
        index.add_value("k", Version{2}, {2, 1});
        index.add_value("j", Version{1}, {3, 1});
        other.add_value("k", Version{1}, {4, -1});
        other.add_value("k", Version{3}, {5, 2});
        other.add_value("m", Version{2}, {6, 1});

        const std::vector<std::string> keys{"k", "j", "m"};
        const std::vector<Version> points{Version{1}, Version{2}, Version{3}};
        std::vector<Entries> expected;
        for (const auto &k : keys) {
            for (const auto &v : points) {
                auto mine = index.reconstruct_at(k, v);
                auto theirs = other.reconstruct_at(k, v);
                mine.insert(mine.end(), theirs.begin(), theirs.end());
                expected.push_back(mine);
            }
        }

        index.append(other);

        std::size_t i = 0;
        for (const auto &k : keys) {
            for (const auto &v : points) {
                CHECK(index.reconstruct_at(k, v) == expected[i]);
                ++i;
            }
        }
    }

    SUBCASE("append keeps duplicate entries") {
        index.add_value("k", Version{1}, {7, 1});
        other.add_value("k", Version{1}, {7, 1});
        index.append(other);
        CHECK(index.reconstruct_at("k", Version{1}) == Entries{{7, 1}, {7, 1}});
    }

    SUBCASE("appending an index to itself doubles it") {
        index.add_value("k", Version{1}, {7, 1});
        index.append(index);
        CHECK(index.reconstruct_at("k", Version{1}) == Entries{{7, 1}, {7, 1}});
    }

    SUBCASE("append does not check source versions against the frontier") {
        index.add_value("k", Version{1}, {1, 1});
        index.compact(Antichain{Version{5}});
        other.add_value("k", Version{2}, {2, 1});
        CHECK_NOTHROW(index.append(other));
        CHECK(index.reconstruct_at("k", Version{5}) == Entries{{1, 1}, {2, 1}});
    }
}

TEST_CASE("Index rejects stale access") {
    Index<std::string, int> index;
    index.add_value("key1", Version{1}, {10, 1});
    index.compact(Antichain{Version{2}});

    SUBCASE("reconstruct below the frontier") {
        CHECK_THROWS_AS(index.reconstruct_at("key1", Version{1}), difftrace::core::StaleVersionAccess);
    }

    SUBCASE("write below the frontier") {
        CHECK_THROWS_AS(index.add_value("key1", Version{1}, {10, 1}), difftrace::core::StaleVersionAccess);
        CHECK(index.reconstruct_at("key1", Version{2}) == Entries{{10, 1}});
    }

    SUBCASE("unknown keys are still validated") {
        CHECK_THROWS_AS(index.reconstruct_at("missing", Version{0}), difftrace::core::StaleVersionAccess);
    }

    SUBCASE("points at or beyond the frontier are accepted") {
        CHECK_NOTHROW(index.reconstruct_at("key1", Version{2}));
        CHECK_NOTHROW(index.add_value("key1", Version{3}, {11, 1}));
    }

    SUBCASE("violations are invariant errors") {
        CHECK_THROWS_AS(index.reconstruct_at("key1", Version{0}), difftrace::core::InvariantViolation);
        CHECK_THROWS_AS(index.reconstruct_at("key1", Version{0}), std::logic_error);
    }

    SUBCASE("message names the offending version") {
        try {
            index.reconstruct_at("key1", Version{1});
            FAIL("expected StaleVersionAccess");
        } catch (const difftrace::core::StaleVersionAccess &e) {
            CHECK(std::string(e.what()).find("Invalid version") != std::string::npos);
            CHECK(e.requested() == "Version([1])");
            CHECK(e.frontier() == "Antichain([[2]])");
        }
    }
}

TEST_CASE("Index with non-string keys and distinct value types") {
    Index<int, std::string> index;
    index.add_value(7, Version{0, 0}, {"x", 1});
    index.add_value(7, Version{0, 1}, {"y", 2});
    CHECK(index.reconstruct_at(7, Version{0, 1}) == std::vector<Entry<std::string>>{{"x", 1}, {"y", 2}});
    CHECK(index.to_string().find("Version([0,1])") != std::string::npos);
}
