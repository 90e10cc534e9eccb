#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "TransactionStore.hpp"
#include "txnlens/Error.hpp"
#include "txnlens/Pagination.hpp"

namespace txnlens {

struct CustomerSummary {
    std::string customerId;
    std::size_t transactionCount = 0;
};

struct CustomerDetails {
    std::string customerId;
    std::size_t transactionCount = 0;
    double totalAmount = 0.0;
    double averageAmount = 0.0;
};

struct TopCustomer {
    std::string customerId;
    std::size_t transactionCount = 0;
    double totalAmount = 0.0;
};

class CustomerService {
public:
    explicit CustomerService(const TransactionStore& store);

    // Distinct customer ids in ascending order.
    Result<Page<CustomerSummary>> listAll(long long page, long long limit) const;

    // Unknown customers yield a zero-valued result carrying the requested id.
    CustomerDetails details(const std::string& customerId) const;

    // Most active customers first; ties broken by customer id.
    std::vector<TopCustomer> top(std::size_t n) const;

private:
    const TransactionStore& store_;
};

} // namespace txnlens
