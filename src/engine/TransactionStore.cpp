//TransactionStore.cpp
#include "TransactionStore.hpp"

#include <iostream>

namespace txnlens {

const char* attributeName(Attribute attribute) {
    switch (attribute) {
    case Attribute::Customer: return "customer";
    case Attribute::Merchant: return "merchant";
    case Attribute::CategoryCode: return "mcc";
    case Attribute::ChannelType: return "use_chip";
    }
    return "unknown";
}

// -----------------------------------------------------------
// Snapshot
// -----------------------------------------------------------
Snapshot::AttributeIndex& Snapshot::indexFor(Attribute attribute) {
    switch (attribute) {
    case Attribute::Customer: return byCustomer_;
    case Attribute::Merchant: return byMerchant_;
    case Attribute::CategoryCode: return byCategoryCode_;
    case Attribute::ChannelType: return byChannelType_;
    }
    return byCustomer_;
}

const Snapshot::AttributeIndex& Snapshot::indexFor(Attribute attribute) const {
    return const_cast<Snapshot*>(this)->indexFor(attribute);
}

const std::string& Snapshot::keyFor(Attribute attribute, const Transaction& txn) {
    switch (attribute) {
    case Attribute::Customer: return txn.clientId;
    case Attribute::Merchant: return txn.merchantId;
    case Attribute::CategoryCode: return txn.mcc;
    case Attribute::ChannelType: return txn.useChip;
    }
    return txn.clientId;
}

void Snapshot::add(Transaction txn) {
    // last write wins: drop the previous record's index membership first
    auto existing = records_.find(txn.id);
    if (existing != records_.end()) {
        unindex(existing->second);
    }

    for (Attribute a : {Attribute::Customer, Attribute::Merchant, Attribute::CategoryCode, Attribute::ChannelType}) {
        indexFor(a)[keyFor(a, txn)].append(txn.id);
    }
    if (txn.isFraud()) {
        fraudList_.append(txn.id);
    }
    if (!minDate_ || txn.date < *minDate_) minDate_ = txn.date;
    if (!maxDate_ || txn.date > *maxDate_) maxDate_ = txn.date;

    const std::string id = txn.id;
    records_[id] = std::move(txn);
}

bool Snapshot::remove(const std::string& id) {
    auto it = records_.find(id);
    if (it == records_.end()) return false;
    unindex(it->second);
    records_.erase(it);
    return true;
}

void Snapshot::unindex(const Transaction& txn) {
    for (Attribute a : {Attribute::Customer, Attribute::Merchant, Attribute::CategoryCode, Attribute::ChannelType}) {
        auto& index = indexFor(a);
        auto bucket = index.find(keyFor(a, txn));
        if (bucket == index.end()) continue;
        bucket->second.remove(txn.id);
        if (bucket->second.empty()) index.erase(bucket);
    }
    fraudList_.remove(txn.id);
}

const Transaction* Snapshot::find(const std::string& id) const {
    auto it = records_.find(id);
    if (it == records_.end()) return nullptr;
    return &it->second;
}

const IdIndex* Snapshot::attributeIndex(Attribute attribute, const std::string& value) const {
    const auto& index = indexFor(attribute);
    auto it = index.find(value);
    if (it == index.end()) return nullptr;
    return &it->second;
}

std::vector<const Transaction*> Snapshot::byAttribute(Attribute attribute, const std::string& value) const {
    std::vector<const Transaction*> out;
    const IdIndex* ids = attributeIndex(attribute, value);
    if (!ids) return out;
    out.reserve(ids->size());
    for (const auto& id : *ids) {
        if (const Transaction* txn = find(id)) out.push_back(txn);
    }
    return out;
}

std::vector<std::string> Snapshot::attributeValues(Attribute attribute) const {
    const auto& index = indexFor(attribute);
    std::vector<std::string> out;
    out.reserve(index.size());
    for (const auto& kv : index) out.push_back(kv.first);
    return out;
}

std::vector<const Transaction*> Snapshot::fraudulent() const {
    std::vector<const Transaction*> out;
    out.reserve(fraudList_.size());
    for (const auto& id : fraudList_) {
        if (const Transaction* txn = find(id)) out.push_back(txn);
    }
    return out;
}

// -----------------------------------------------------------
// BulkLoad
// -----------------------------------------------------------
TransactionStore::BulkLoad::BulkLoad(TransactionStore& store)
    : store_(&store), lock_(store.writeMutex_), staging_(std::make_shared<Snapshot>()) {
}

TransactionStore::BulkLoad::BulkLoad(BulkLoad&& other) noexcept
    : store_(other.store_),
      lock_(std::move(other.lock_)),
      staging_(std::move(other.staging_)),
      committed_(other.committed_) {
    other.committed_ = true;
}

TransactionStore::BulkLoad::~BulkLoad() {
    if (!committed_ && staging_) {
        std::cerr << "TransactionStore: bulk load abandoned; discarded " << staging_->size() << " staged records\n";
    }
}

void TransactionStore::BulkLoad::add(Transaction txn) {
    staging_->add(std::move(txn));
}

void TransactionStore::BulkLoad::commit() {
    if (committed_ || !staging_) return;
    staging_->setLoadedAt(Clock::now());
    std::cerr << "TransactionStore: bulk load committed; records=" << staging_->size()
              << " fraud=" << staging_->fraudCount() << "\n";
    store_->publish(std::move(staging_));
    committed_ = true;
    lock_.unlock();
}

// -----------------------------------------------------------
// TransactionStore
// -----------------------------------------------------------
TransactionStore::TransactionStore() : current_(std::make_shared<Snapshot>()) {
}

std::shared_ptr<const Snapshot> TransactionStore::snapshot() const {
    std::lock_guard<std::mutex> lk(snapshotMutex_);
    return current_;
}

void TransactionStore::publish(std::shared_ptr<const Snapshot> next) {
    std::lock_guard<std::mutex> lk(snapshotMutex_);
    current_ = std::move(next);
}

TransactionStore::BulkLoad TransactionStore::beginBulkLoad() {
    return BulkLoad(*this);
}

void TransactionStore::add(Transaction txn) {
    std::lock_guard<std::mutex> lk(writeMutex_);
    auto next = std::make_shared<Snapshot>(*snapshot());
    next->add(std::move(txn));
    publish(std::move(next));
}

bool TransactionStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lk(writeMutex_);
    auto current = snapshot();
    if (!current->find(id)) return false;
    auto next = std::make_shared<Snapshot>(*current);
    next->remove(id);
    publish(std::move(next));
    return true;
}

std::optional<Transaction> TransactionStore::get(const std::string& id) const {
    auto snap = snapshot();
    if (const Transaction* txn = snap->find(id)) return *txn;
    return std::nullopt;
}

std::vector<Transaction> TransactionStore::all() const {
    auto snap = snapshot();
    std::vector<Transaction> out;
    out.reserve(snap->size());
    for (const auto& kv : snap->records()) out.push_back(kv.second);
    return out;
}

std::vector<Transaction> TransactionStore::byAttribute(Attribute attribute, const std::string& value) const {
    auto snap = snapshot();
    std::vector<Transaction> out;
    for (const Transaction* txn : snap->byAttribute(attribute, value)) out.push_back(*txn);
    return out;
}

std::size_t TransactionStore::size() const {
    return snapshot()->size();
}

} // namespace txnlens
