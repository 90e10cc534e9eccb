#pragma once

#include <cstddef>
#include <list>
#include <string>
#include <unordered_map>

namespace txnlens {

// Insertion-ordered list of transaction ids with O(1) append and O(1) removal
// by id. Appending an id that is already present is a no-op.
class IdIndex {
public:
    using const_iterator = std::list<std::string>::const_iterator;

    IdIndex() = default;
    IdIndex(const IdIndex& other);
    IdIndex& operator=(const IdIndex& other);
    IdIndex(IdIndex&&) = default;
    IdIndex& operator=(IdIndex&&) = default;

    void append(const std::string& id);
    bool remove(const std::string& id);
    bool contains(const std::string& id) const { return positions_.count(id) > 0; }

    std::size_t size() const { return order_.size(); }
    bool empty() const { return order_.empty(); }

    const_iterator begin() const { return order_.begin(); }
    const_iterator end() const { return order_.end(); }

private:
    std::list<std::string> order_;
    std::unordered_map<std::string, std::list<std::string>::iterator> positions_;
};

} // namespace txnlens
