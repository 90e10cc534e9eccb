#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "TransactionStore.hpp"
#include "txnlens/Error.hpp"
#include "txnlens/Pagination.hpp"
#include "txnlens/algorithms/SearchFilter.hpp"

namespace txnlens {

struct ChannelTypeCount {
    std::string type;
    std::size_t count = 0;
};

// Record-level queries. Every listing is sorted newest first before paging.
class TransactionService {
public:
    explicit TransactionService(TransactionStore& store);

    Result<Page<Transaction>> list(long long page, long long limit) const;

    // NotFound when the id is unknown.
    Result<Transaction> get(const std::string& id) const;
    Status remove(const std::string& id);

    // Criteria are normalized here; placeholder values never reach the filter.
    Result<Page<Transaction>> search(const algo::SearchCriteria& criteria, long long page, long long limit) const;

    std::vector<ChannelTypeCount> channelTypes() const;

    Result<Page<Transaction>> recent(long long limit) const;
    Result<Page<Transaction>> byCustomer(const std::string& customerId, long long page, long long limit) const;
    Result<Page<Transaction>> byMerchant(const std::string& merchantId, long long page, long long limit) const;

private:
    Result<Page<Transaction>> byIndex(Attribute attribute, const std::string& value, long long page, long long limit) const;

    TransactionStore& store_;
};

} // namespace txnlens
