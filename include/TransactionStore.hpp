//TransactionStore.hpp
#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "txnlens/IdIndex.hpp"
#include "txnlens/Transaction.hpp"

namespace txnlens {

// Secondary index keys.
enum class Attribute { Customer, Merchant, CategoryCode, ChannelType };

const char* attributeName(Attribute attribute);

// Records plus every secondary index over them. Published snapshots are only
// ever read; mutation happens on private copies before publication.
class Snapshot {
public:
    using Records = std::unordered_map<std::string, Transaction>;

    // Insert or overwrite by id, keeping all indexes and date bounds in step.
    void add(Transaction txn);

    // Remove a record from the map and from every index. Date bounds are kept.
    bool remove(const std::string& id);

    const Transaction* find(const std::string& id) const;
    const Records& records() const { return records_; }
    std::size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

    // Records sharing an attribute value, in index insertion order.
    std::vector<const Transaction*> byAttribute(Attribute attribute, const std::string& value) const;
    const IdIndex* attributeIndex(Attribute attribute, const std::string& value) const;
    std::vector<std::string> attributeValues(Attribute attribute) const;

    std::vector<const Transaction*> fraudulent() const;
    std::size_t fraudCount() const { return fraudList_.size(); }

    std::optional<Timestamp> minDate() const { return minDate_; }
    std::optional<Timestamp> maxDate() const { return maxDate_; }
    std::optional<Timestamp> loadedAt() const { return loadedAt_; }
    void setLoadedAt(Timestamp ts) { loadedAt_ = ts; }

private:
    using AttributeIndex = std::map<std::string, IdIndex>;

    Records records_;
    AttributeIndex byCustomer_;
    AttributeIndex byMerchant_;
    AttributeIndex byCategoryCode_;
    AttributeIndex byChannelType_;
    IdIndex fraudList_;
    std::optional<Timestamp> minDate_;
    std::optional<Timestamp> maxDate_;
    std::optional<Timestamp> loadedAt_;

    AttributeIndex& indexFor(Attribute attribute);
    const AttributeIndex& indexFor(Attribute attribute) const;
    static const std::string& keyFor(Attribute attribute, const Transaction& txn);
    void unindex(const Transaction& txn);
};

// Owner of the current snapshot. Readers grab a snapshot and never block;
// writers serialize among themselves and publish a new snapshot when done.
class TransactionStore {
public:
    // Exclusive loading phase. Records are staged into a fresh snapshot and
    // replace the store contents only on commit(); an uncommitted scope
    // leaves the store as it was.
    class BulkLoad {
    public:
        BulkLoad(BulkLoad&& other) noexcept;
        BulkLoad& operator=(BulkLoad&&) = delete;
        BulkLoad(const BulkLoad&) = delete;
        BulkLoad& operator=(const BulkLoad&) = delete;
        ~BulkLoad();

        void add(Transaction txn);
        std::size_t size() const { return staging_ ? staging_->size() : 0; }
        void commit();

    private:
        friend class TransactionStore;
        explicit BulkLoad(TransactionStore& store);

        TransactionStore* store_;
        std::unique_lock<std::mutex> lock_;
        std::shared_ptr<Snapshot> staging_;
        bool committed_ = false;
    };

    TransactionStore();

    std::shared_ptr<const Snapshot> snapshot() const;

    BulkLoad beginBulkLoad();

    // Single-record mutations. Each publishes a new snapshot before returning.
    void add(Transaction txn);
    bool remove(const std::string& id);

    std::optional<Transaction> get(const std::string& id) const;
    std::vector<Transaction> all() const;
    std::vector<Transaction> byAttribute(Attribute attribute, const std::string& value) const;
    std::size_t size() const;

private:
    void publish(std::shared_ptr<const Snapshot> next);

    mutable std::mutex snapshotMutex_;
    std::mutex writeMutex_;
    std::shared_ptr<const Snapshot> current_;
};

} // namespace txnlens
