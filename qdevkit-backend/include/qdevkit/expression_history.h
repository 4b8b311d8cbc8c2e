#pragma once

#include "api_export.h"
#include <string>
#include <vector>

namespace qdevkit {

// Most-recent-first list of distinct expressions with LRU eviction.
// Persisted as {"version": 1, "history": [...]}.
class QDEVKIT_API ExpressionHistory {
public:
    static constexpr size_t kDefaultCapacity = 20;

    explicit ExpressionHistory(size_t capacity = kDefaultCapacity);

    // Move (or insert) the trimmed expression to the front, evicting the
    // oldest past capacity. Blank text is ignored.
    void Add(const std::string& text);
    void Clear();

    const std::vector<std::string>& Items() const { return items_; }
    size_t Size() const { return items_.size(); }
    size_t Capacity() const { return capacity_; }
    void SetCapacity(size_t capacity);

    // A missing file is an empty history. A corrupt one is logged and
    // yields an empty history; returns false in that case.
    bool Load(const std::string& path);
    bool Save(const std::string& path) const;

    // ~/.qdevkit_jsonpath_history.json
    static std::string DefaultPath();

private:
    std::vector<std::string> items_;
    size_t capacity_;
};

} // namespace qdevkit
