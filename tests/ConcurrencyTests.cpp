#include "TransactionStore.hpp"
#include "txnlens/services/CustomerService.hpp"
#include "txnlens/services/StatisticsService.hpp"
#include "TestSupport.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace txnlens;
using testsupport::expect;
using testsupport::makeTxn;

namespace {

constexpr int kRecords = 2000;
constexpr int kCustomers = 20;

// A snapshot is consistent when every index agrees with the record map.
bool consistent(const Snapshot& snap) {
    std::size_t indexed = 0;
    for (const auto& customer : snap.attributeValues(Attribute::Customer)) {
        for (const Transaction* txn : snap.byAttribute(Attribute::Customer, customer)) {
            if (!txn || txn->clientId != customer) return false;
            ++indexed;
        }
    }
    if (indexed != snap.size()) return false;

    std::size_t flagged = 0;
    for (const auto& kv : snap.records()) {
        if (kv.second.isFraud()) ++flagged;
    }
    return flagged == snap.fraudCount() && snap.fraudulent().size() == flagged;
}

} // namespace

static void testReadersSeeWholeSnapshots() {
    TransactionStore store;
    {
        auto bulk = store.beginBulkLoad();
        for (int i = 0; i < kRecords; ++i) {
            bulk.add(makeTxn("T" + std::to_string(i), "C" + std::to_string(i % kCustomers), 1.0 + i,
                             "2023-01-01 00:00:00", i % 10 == 0 ? "Bad CVV" : ""));
        }
        bulk.commit();
    }

    std::atomic<bool> done{false};
    std::atomic<int> failures{0};
    std::atomic<long> reads{0};

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&store, &done, &failures, &reads]() {
            CustomerService customers(store);
            std::size_t lastSize = static_cast<std::size_t>(kRecords);
            while (!done.load()) {
                auto snap = store.snapshot();
                if (!consistent(*snap)) ++failures;
                // deletes only ever shrink the store
                if (snap->size() > lastSize) ++failures;
                lastSize = snap->size();

                auto top = customers.top(3);
                for (const auto& c : top) {
                    if (c.transactionCount == 0) ++failures;
                }
                ++reads;
            }
        });
    }

    std::thread writer([&store]() {
        for (int i = 0; i < kRecords; i += 2) {
            store.remove("T" + std::to_string(i));
        }
    });

    writer.join();
    done = true;
    for (auto& t : readers) t.join();

    expect(failures.load() == 0, "readers observed a torn snapshot");
    expect(reads.load() > 0, "readers ran");
    expect(store.size() == static_cast<std::size_t>(kRecords / 2), "half the records deleted");
    expect(consistent(*store.snapshot()), "final snapshot consistent");
    // every multiple of 10 is even, so all flagged records are gone
    expect(store.snapshot()->fraudCount() == 0, "flagged records deleted");
}

static void testConcurrentWritersSerialize() {
    TransactionStore store;
    std::vector<std::thread> writers;
    for (int w = 0; w < 4; ++w) {
        writers.emplace_back([&store, w]() {
            for (int i = 0; i < 100; ++i) {
                store.add(makeTxn("W" + std::to_string(w) + "-" + std::to_string(i), "C" + std::to_string(w), 5.0,
                                  "2023-06-01 00:00:00"));
            }
        });
    }
    for (auto& t : writers) t.join();

    expect(store.size() == 400, "no lost writes");
    auto snap = store.snapshot();
    expect(consistent(*snap), "indexes consistent after concurrent adds");
    StatisticsService stats(store);
    expect(stats.overview().totalCount == 400, "statistics see every write");
}

int main() {
    testReadersSeeWholeSnapshots();
    testConcurrentWritersSerialize();
    std::cout << "All tests passed." << std::endl;
    return 0;
}
