#include "txnlens/IdIndex.hpp"

namespace txnlens {

IdIndex::IdIndex(const IdIndex& other) {
    for (const auto& id : other.order_) append(id);
}

IdIndex& IdIndex::operator=(const IdIndex& other) {
    if (this == &other) return *this;
    order_.clear();
    positions_.clear();
    for (const auto& id : other.order_) append(id);
    return *this;
}

void IdIndex::append(const std::string& id) {
    if (positions_.count(id)) return;
    auto it = order_.insert(order_.end(), id);
    positions_.emplace(id, it);
}

bool IdIndex::remove(const std::string& id) {
    auto it = positions_.find(id);
    if (it == positions_.end()) return false;
    order_.erase(it->second);
    positions_.erase(it);
    return true;
}

} // namespace txnlens
