#include "txnlens/services/CustomerService.hpp"

#include <algorithm>
#include <iostream>

namespace txnlens {

CustomerService::CustomerService(const TransactionStore& store) : store_(store) {
}

Result<Page<CustomerSummary>> CustomerService::listAll(long long page, long long limit) const {
    auto req = PaginationService::validateParams(page, limit);
    if (!req) {
        std::cerr << "CustomerService: " << req.error().message << "\n";
        return req.error();
    }

    auto snap = store_.snapshot();
    const auto customers = snap->attributeValues(Attribute::Customer);
    auto bounds = PaginationService::pageBounds(req.value(), customers.size());

    std::vector<CustomerSummary> slice;
    slice.reserve(bounds.second - bounds.first);
    for (std::size_t i = bounds.first; i < bounds.second; ++i) {
        const IdIndex* ids = snap->attributeIndex(Attribute::Customer, customers[i]);
        slice.push_back({customers[i], ids ? ids->size() : 0});
    }
    return PaginationService::buildEnvelope(std::move(slice), req.value(), customers.size());
}

CustomerDetails CustomerService::details(const std::string& customerId) const {
    auto snap = store_.snapshot();
    CustomerDetails out;
    out.customerId = customerId;
    for (const Transaction* txn : snap->byAttribute(Attribute::Customer, customerId)) {
        ++out.transactionCount;
        out.totalAmount += txn->amount;
    }
    if (out.transactionCount > 0) {
        out.averageAmount = out.totalAmount / static_cast<double>(out.transactionCount);
    }
    return out;
}

std::vector<TopCustomer> CustomerService::top(std::size_t n) const {
    auto snap = store_.snapshot();
    std::vector<TopCustomer> ranked;
    for (const auto& customerId : snap->attributeValues(Attribute::Customer)) {
        TopCustomer c;
        c.customerId = customerId;
        for (const Transaction* txn : snap->byAttribute(Attribute::Customer, customerId)) {
            ++c.transactionCount;
            c.totalAmount += txn->amount;
        }
        ranked.push_back(std::move(c));
    }

    const std::size_t keep = std::min(n, ranked.size());
    std::partial_sort(ranked.begin(), ranked.begin() + static_cast<std::ptrdiff_t>(keep), ranked.end(),
        [](const TopCustomer& a, const TopCustomer& b) {
            if (a.transactionCount == b.transactionCount) return a.customerId < b.customerId;
            return a.transactionCount > b.transactionCount;
        });
    ranked.resize(keep);
    return ranked;
}

} // namespace txnlens
