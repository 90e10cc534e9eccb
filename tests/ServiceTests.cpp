#include "TransactionStore.hpp"
#include "txnlens/services/CustomerService.hpp"
#include "txnlens/services/FraudService.hpp"
#include "txnlens/services/HealthService.hpp"
#include "txnlens/services/StatisticsService.hpp"
#include "txnlens/services/TransactionService.hpp"
#include "TestSupport.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

using namespace txnlens;
using testsupport::expect;
using testsupport::makeTxn;
using testsupport::near;

// T1/T2 for C001, T3 for C002 flagged as fraud.
static void seedExample(TransactionStore& store) {
    store.add(makeTxn("1", "C001", 100, "2023-01-01 00:00:00"));
    store.add(makeTxn("2", "C001", 200, "2023-01-02 00:00:00"));
    store.add(makeTxn("3", "C002", 150, "2023-01-03 00:00:00", "Fraud"));
}

static void testExampleScenario() {
    TransactionStore store;
    seedExample(store);
    CustomerService customers(store);
    FraudService fraud(store);
    TransactionService transactions(store);

    auto c1 = customers.details("C001");
    expect(c1.transactionCount == 2 && near(c1.totalAmount, 300) && near(c1.averageAmount, 150), "C001 details");

    auto summary = fraud.summary();
    expect(summary.totalFraudCount == 1, "one fraud");
    expect(near(summary.fraudRate, 1.0 / 3.0), "fraud rate one third");
    expect(near(summary.totalFraudAmount, 150), "fraud amount");

    auto top = customers.top(1);
    expect(top.size() == 1 && top[0].customerId == "C001" && top[0].transactionCount == 2 && near(top[0].totalAmount, 300),
           "top customer is C001");

    expect(transactions.remove("1").ok(), "delete 1");
    expect(store.all().size() == 2, "two records left");
    expect(customers.details("C001").transactionCount == 1, "C001 down to one transaction");

    auto again = transactions.remove("1");
    expect(!again && again.error().code == ErrorCode::NotFound, "second delete is NotFound");
}

static void testTransactionLookupAndListings() {
    TransactionStore store;
    seedExample(store);
    store.add(makeTxn("4", "C003", 75, "2023-01-04 10:00:00", "", "Online Transaction", "5812", "Denver", "M200"));
    TransactionService svc(store);

    auto got = svc.get("2");
    expect(got.ok() && got.value().amount == 200, "get by id");
    auto missing = svc.get("nope");
    expect(!missing && missing.error().code == ErrorCode::NotFound, "unknown id is NotFound");

    auto list = svc.list(1, 2);
    expect(list.ok() && list.value().data.size() == 2, "first page of two");
    expect(list.value().data[0].id == "4" && list.value().data[1].id == "3", "newest first");
    expect(list.value().pagination.totalPages == 2 && list.value().pagination.hasNextPage, "two pages");

    auto recent = svc.recent(1);
    expect(recent.ok() && recent.value().data.size() == 1 && recent.value().data[0].id == "4", "recent returns newest");
    expect(!svc.recent(0), "recent limit validated");

    auto c1 = svc.byCustomer("C001", 1, 50);
    expect(c1.ok() && c1.value().data.size() == 2 && c1.value().data[0].id == "2", "customer listing newest first");
    auto none = svc.byCustomer("C999", 1, 50);
    expect(none.ok() && none.value().data.empty() && none.value().pagination.totalCount == 0, "unknown customer empty page");

    auto m = svc.byMerchant("M200", 1, 50);
    expect(m.ok() && m.value().data.size() == 1 && m.value().data[0].id == "4", "merchant listing");

    auto types = svc.channelTypes();
    expect(types.size() == 2, "two channel types");
    expect(types[0].type == "Swipe Transaction" && types[0].count == 3, "swipe most common");
    expect(types[1].type == "Online Transaction" && types[1].count == 1, "online second");
}

static void testStatistics() {
    TransactionStore store;
    StatisticsService stats(store);

    auto emptyOverview = stats.overview();
    expect(emptyOverview.totalCount == 0 && emptyOverview.totalAmount == 0 && emptyOverview.averageAmount == 0,
           "empty overview zeros");
    expect(emptyOverview.minDate == emptyOverview.maxDate, "empty overview dates equal");
    auto emptyDist = stats.amountDistribution();
    expect(emptyDist.buckets.size() == 4, "four buckets even when empty");
    for (const auto& b : emptyDist.buckets) expect(b.count == 0 && b.percentage == 0, "empty bucket zero");

    store.add(makeTxn("a", "C1", 0, "2023-05-01 09:00:00", "", "Swipe Transaction", "5411"));
    store.add(makeTxn("b", "C1", 99.99, "2023-05-01 23:59:59", "", "Swipe Transaction", "5411"));
    store.add(makeTxn("c", "C2", 100, "2023-05-02 00:00:00", "", "Swipe Transaction", "5812"));
    store.add(makeTxn("d", "C2", 999.5, "2023-04-30 12:00:00", "", "Swipe Transaction", "5411"));
    store.add(makeTxn("e", "C3", 1000, "2023-05-02 13:00:00", "", "Swipe Transaction", "4829"));
    store.add(makeTxn("f", "C3", 8000, "2023-05-03 13:00:00", "", "Swipe Transaction", "5812"));

    auto overview = stats.overview();
    expect(overview.totalCount == 6, "overview count");
    expect(near(overview.totalAmount, 10199.49, 1e-6), "overview total");
    expect(near(overview.averageAmount, 10199.49 / 6, 1e-6), "overview average");
    expect(overview.minDate == testsupport::at("2023-04-30 12:00:00"), "overview min date");
    expect(overview.maxDate == testsupport::at("2023-05-03 13:00:00"), "overview max date");

    auto dist = stats.amountDistribution();
    expect(dist.buckets[0].range == "0-100" && dist.buckets[0].count == 2, "0-100 holds 0 and 99.99");
    expect(dist.buckets[1].range == "100-500" && dist.buckets[1].count == 1, "100 goes to 100-500");
    expect(dist.buckets[2].range == "500-1000" && dist.buckets[2].count == 1, "999.5 in 500-1000");
    expect(dist.buckets[3].range == "1000+" && dist.buckets[3].count == 2, "1000 and 8000 in 1000+");
    double pctSum = 0;
    for (const auto& b : dist.buckets) pctSum += b.percentage;
    expect(near(pctSum, 100.0, 1e-9), "percentages sum to 100");
    expect(near(dist.buckets[0].percentage, 2.0 / 6.0 * 100.0), "bucket percentage");

    auto byType = stats.byCategoryCode();
    expect(byType.size() == 3, "three MCCs");
    expect(byType[0].type == "5411" && byType[0].count == 3, "5411 most frequent");
    expect(near(byType[0].averageAmount, (0 + 99.99 + 999.5) / 3, 1e-9), "5411 average");
    for (std::size_t i = 1; i < byType.size(); ++i) expect(byType[i - 1].count >= byType[i].count, "by-type sorted by count");

    auto daily = stats.daily();
    expect(daily.size() == 4, "four distinct days");
    expect(daily[0].date == "2023-04-30" && daily[1].date == "2023-05-01" && daily[3].date == "2023-05-03", "days ascending");
    expect(daily[1].count == 2 && near(daily[1].totalAmount, 99.99, 1e-9), "same-day records grouped");
    expect(daily[2].count == 2 && near(daily[2].averageAmount, 550), "May 2 average");

    // pure function of state
    auto again = stats.byCategoryCode();
    expect(again.size() == byType.size() && again[0].type == byType[0].type && again[0].count == byType[0].count, "idempotent");
}

static void testFraudByChannelAndPredict() {
    TransactionStore store;
    store.add(makeTxn("1", "C1", 10, "2023-01-01 00:00:00", "Bad CVV", "Online Transaction"));
    store.add(makeTxn("2", "C1", 10, "2023-01-01 00:00:00", "", "Online Transaction"));
    store.add(makeTxn("3", "C2", 10, "2023-01-01 00:00:00", "", "Swipe Transaction"));
    store.add(makeTxn("4", "C2", 10, "2023-01-01 00:00:00", "Bad PIN", "Chip Transaction"));
    store.add(makeTxn("5", "C2", 10, "2023-01-01 00:00:00", "", "Swipe Transaction"));
    FraudService fraud(store);

    auto byType = fraud.byChannelType();
    expect(byType.size() == 3, "three channels");
    std::size_t total = 0;
    for (std::size_t i = 0; i < byType.size(); ++i) {
        total += byType[i].totalCount;
        if (i) expect(byType[i - 1].fraudRate >= byType[i].fraudRate, "sorted by fraud rate");
        expect(near(byType[i].fraudRate, static_cast<double>(byType[i].fraudCount) / byType[i].totalCount), "rate = count/total");
    }
    expect(total == store.size(), "channel totals cover the store");
    expect(byType[0].type == "Chip Transaction" && near(byType[0].fraudRate, 1.0), "chip has rate 1");
    expect(byType[2].type == "Swipe Transaction" && byType[2].fraudCount == 0, "swipe clean");

    auto clean = fraud.predict(makeTxn("p", "C", 50, "2023-01-01 00:00:00"));
    expect(near(clean.fraudScore, 0.0) && clean.reasoning == "No fraud indicators detected", "no indicators");

    auto high = fraud.predict(makeTxn("p", "C", 2500, "2023-01-01 00:00:00"));
    expect(near(high.fraudScore, 0.1) && high.reasoning == "High amount (> 2000)", "high amount tier");

    auto flaggedVeryHigh = fraud.predict(makeTxn("p", "C", 6000, "2023-01-01 00:00:00", "Insufficient Balance"));
    expect(near(flaggedVeryHigh.fraudScore, 1.0), "0.8 + 0.2");
    expect(flaggedVeryHigh.reasoning == "Transaction has error flag; Very high amount (> 5000)", "reasons in check order");

    auto everything = fraud.predict(makeTxn("p", "C", 6000, "2023-01-01 00:00:00", "X", ""));
    expect(near(everything.fraudScore, 1.0), "score clamped to 1");
    expect(everything.reasoning == "Transaction has error flag; Very high amount (> 5000); Missing transaction type",
           "all three reasons");

    auto noChannel = fraud.predict(makeTxn("p", "C", 5000, "2023-01-01 00:00:00", "", ""));
    expect(near(noChannel.fraudScore, 0.2) && noChannel.reasoning == "High amount (> 2000); Missing transaction type",
           "5000 is high, not very high");

    auto byId = fraud.predictById("1");
    expect(byId.ok() && near(byId.value().fraudScore, 0.8) && byId.value().transactionId == "1", "predict stored record");
    auto unknown = fraud.predictById("zzz");
    expect(!unknown && unknown.error().code == ErrorCode::NotFound, "predict unknown id");

    TransactionStore empty;
    FraudService emptyFraud(empty);
    auto s = emptyFraud.summary();
    expect(s.totalFraudCount == 0 && s.fraudRate == 0 && s.totalFraudAmount == 0, "empty summary zero");
}

static void testCustomers() {
    TransactionStore store;
    std::map<std::string, std::size_t> expectedCounts;
    for (int i = 0; i < 37; ++i) {
        const std::string client = "C" + std::to_string(100 + (i * 7) % 11);
        ++expectedCounts[client];
        store.add(makeTxn("T" + std::to_string(i), client, 10.0 + i, "2023-03-01 00:00:00"));
    }
    CustomerService customers(store);

    std::set<std::string> seen;
    std::string previous;
    for (long long page = 1;; ++page) {
        auto res = customers.listAll(page, 4);
        expect(res.ok(), "listAll ok");
        for (const auto& c : res.value().data) {
            expect(previous.empty() || previous < c.customerId, "customer ids ascending across pages");
            previous = c.customerId;
            expect(c.transactionCount == expectedCounts[c.customerId], "count for " + c.customerId);
            seen.insert(c.customerId);
        }
        if (!res.value().pagination.hasNextPage) break;
    }
    expect(seen.size() == expectedCounts.size(), "every customer listed once");

    auto bad = customers.listAll(1, 5000);
    expect(!bad && bad.error().code == ErrorCode::InvalidPagination, "limit too large");

    for (const auto& kv : expectedCounts) {
        auto d = customers.details(kv.first);
        expect(d.transactionCount == kv.second, "details count");
        expect(near(d.averageAmount, d.totalAmount / static_cast<double>(d.transactionCount)), "average = total / count");
    }

    auto ghost = customers.details("ghost");
    expect(ghost.customerId == "ghost" && ghost.transactionCount == 0 && ghost.totalAmount == 0 && ghost.averageAmount == 0,
           "unknown customer is zero-valued");

    auto top = customers.top(5);
    expect(top.size() == 5, "top five");
    for (std::size_t i = 1; i < top.size(); ++i) expect(top[i - 1].transactionCount >= top[i].transactionCount, "top sorted");
    expect(customers.top(500).size() == expectedCounts.size(), "top capped at distinct customers");
    expect(customers.top(0).empty(), "top zero is empty");
}

static void testHealthAndMetadata() {
    TransactionStore store;
    HealthService health(store);

    auto h = health.checkHealth();
    expect(h.status == "healthy" && h.responseTimeMs >= 0, "healthy on an empty store");

    auto before = Clock::now();
    auto emptyMeta = health.metadata();
    expect(emptyMeta.totalTransactionCount == 0 && emptyMeta.apiVersion == "1.0.0", "empty metadata");
    expect(emptyMeta.minDate == emptyMeta.maxDate && emptyMeta.minDate >= before, "empty dates are now");

    {
        auto bulk = store.beginBulkLoad();
        bulk.add(makeTxn("1", "C1", 5, "2022-12-31 23:00:00"));
        bulk.add(makeTxn("2", "C1", 5, "2023-06-01 01:00:00"));
        bulk.commit();
    }
    auto loaded = health.checkHealth();
    expect(loaded.status == "healthy", "health check reads back a stored record");
    store.remove("1");
    store.remove("2");
    expect(health.checkHealth().status == "healthy", "healthy again once emptied");
    {
        auto bulk = store.beginBulkLoad();
        bulk.add(makeTxn("1", "C1", 5, "2022-12-31 23:00:00"));
        bulk.add(makeTxn("2", "C1", 5, "2023-06-01 01:00:00", "Bad PIN"));
        bulk.commit();
    }
    expect(health.checkHealth().status == "healthy", "healthy with flagged records");

    auto meta = health.metadata();
    expect(meta.totalTransactionCount == 2, "metadata count");
    expect(meta.minDate == testsupport::at("2022-12-31 23:00:00"), "metadata min");
    expect(meta.maxDate == testsupport::at("2023-06-01 01:00:00"), "metadata max");
    expect(meta.dataLoadDate >= before, "load date recorded");
}

int main() {
    testExampleScenario();
    testTransactionLookupAndListings();
    testStatistics();
    testFraudByChannelAndPredict();
    testCustomers();
    testHealthAndMetadata();
    std::cout << "All tests passed." << std::endl;
    return 0;
}
