#include <difftrace/difftrace.hpp>
#include <iostream>
#include <map>
#include <string>

using namespace difftrace::trace;
using difftrace::core::Logger;
using difftrace::core::LogLevel;
using difftrace::core::StaleVersionAccess;
using difftrace::core::ThreadPool;
using difftrace::order::Antichain;
using difftrace::order::Version;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static void section(const char *title) {
    std::cout << "\n";
    std::cout << "━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━\n";
    std::cout << "  " << title << "\n";
    std::cout << "━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━\n";
}

template <typename V> static void print_at(const Index<std::string, V> &index, const std::string &key, const Version &v) {
    std::cout << "  " << key << " @ " << v.to_string() << ":";
    auto entries = Collection<V>(index.reconstruct_at(key, v)).consolidate();
    if (entries.empty())
        std::cout << " (empty)";
    for (const auto &[value, mult] : entries)
        std::cout << " (" << value << ", " << mult << ")";
    std::cout << "\n";
}

// ---------------------------------------------------------------------------
// DEMO 1: Orders joined with prices, updated over time
// ---------------------------------------------------------------------------
// Each index records changes per (product, epoch). Joining the two yields the
// changes to (product, (quantity, price)) at the join of the input versions.

void demo_join() {
    section("DEMO 1: Incremental Join");

    Index<std::string, int> orders;
    Index<std::string, double> prices;

    orders.add_value("apple", Version{0}, {3, 1});
    orders.add_value("pear", Version{0}, {5, 1});
    prices.add_value("apple", Version{0}, {0.5, 1});
    prices.add_value("pear", Version{1}, {0.8, 1});

    // Epoch 2: apple price changes from 0.5 to 0.6.
    prices.add_value("apple", Version{2}, {0.5, -1});
    prices.add_value("apple", Version{2}, {0.6, 1});

    for (const auto &[version, records] : orders.join(prices)) {
        std::cout << "  " << version.to_string() << ":\n";
        for (const auto &[record, mult] : records) {
            const auto &[product, pair] = record;
            std::cout << "    " << product << " qty=" << pair.first << " price=" << pair.second << "  x" << mult << "\n";
        }
    }
}

// ---------------------------------------------------------------------------
// DEMO 2: Compaction
// ---------------------------------------------------------------------------
// Once no reader needs epochs before 3, history is folded forward and netted.

void demo_compaction() {
    section("DEMO 2: Compaction");

    Index<std::string, int> stock;
    stock.set_observer([](const CompactionStats &s) {
        std::cout << "  compacted " << s.keys_compacted << "/" << s.keys_visited << " keys, "
                  << s.versions_collapsed << " versions collapsed, entries " << s.entries_before << " -> "
                  << s.entries_after << (s.parallel ? " (parallel)" : "") << "\n";
    });

    for (Version::Coord t = 0; t < 5; ++t) {
        stock.add_value("bolts", Version{t}, {100, 1});
        if (t > 0)
            stock.add_value("bolts", Version{t}, {100, -1});
    }
    stock.add_value("nuts", Version{1}, {40, 1});
    stock.add_value("nuts", Version{2}, {40, -1});

    std::cout << "  entries before: " << stock.entry_count() << "\n";
    ThreadPool pool(2);
    stock.compact(Antichain{Version{3}}, {}, ExecutionContext(&pool, 1));
    std::cout << "  entries after:  " << stock.entry_count() << "\n";

    print_at(stock, "bolts", Version{3});
    print_at(stock, "bolts", Version{4});
    print_at(stock, "nuts", Version{3});

    try {
        stock.reconstruct_at("bolts", Version{1});
    } catch (const StaleVersionAccess &e) {
        std::cout << "  rejected: " << e.what() << "\n";
    }
}

// ---------------------------------------------------------------------------
// DEMO 3: Partially ordered versions
// ---------------------------------------------------------------------------
// Versions (epoch, iteration) from a nested loop. Compacting to the frontier
// {(1,0)} moves (0,2) to (1,2) but leaves it distinct from (1,0).

void demo_partial_order() {
    section("DEMO 3: Partially Ordered Versions");

    Index<std::string, int> reach;
    reach.add_value("n1", Version{0, 0}, {1, 1});
    reach.add_value("n1", Version{0, 2}, {2, 1});
    reach.add_value("n1", Version{1, 0}, {3, 1});

    reach.compact(Antichain{Version{1, 0}});
    for (const auto &v : reach.versions("n1"))
        print_at(reach, "n1", v);
}

int main() {
    // Route compaction summaries through the logger as well.
    Logger::instance().set_level(LogLevel::Debug);

    demo_join();
    demo_compaction();
    demo_partial_order();
    return 0;
}
