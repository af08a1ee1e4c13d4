#include "FrequencyTable.h"

#include <cstddef>
#include <deque>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace corpuscount {

void FrequencyTable::Add(std::string_view item, count_t n) {
    auto it = index_.find(item);
    if (it != index_.end()) {
        entries_[it->second].count += n;
        return;
    }

    entries_.push_back(CountedItem{std::string{item}, n});
    index_.emplace(entries_.back().item, entries_.size() - 1);
}

count_t FrequencyTable::Count(std::string_view item) const {
    auto it = index_.find(item);
    if (it == index_.end()) {
        return 0;
    }
    return entries_[it->second].count;
}

count_t FrequencyTable::Total() const {
    count_t total = 0;
    for (const auto& entry : entries_) {
        total += entry.count;
    }
    return total;
}

void FrequencyTable::Prune(count_t minCount) {
    if (minCount == 0) {
        return;
    }

    std::deque<CountedItem> kept;
    for (auto& entry : entries_) {
        if (entry.count >= minCount) {
            kept.push_back(std::move(entry));
        }
    }

    // Moved strings may have changed address, the index is rebuilt from scratch
    entries_ = std::move(kept);
    Reindex();
}

std::vector<CountedItem> FrequencyTable::Release() {
    std::vector<CountedItem> items;
    items.reserve(entries_.size());
    for (auto& entry : entries_) {
        items.push_back(std::move(entry));
    }
    index_.clear();
    entries_.clear();
    return items;
}

void FrequencyTable::Reindex() {
    index_.clear();
    index_.reserve(entries_.size());
    for (size_t i = 0; i < entries_.size(); ++i) {
        index_.emplace(entries_[i].item, i);
    }
}

}  // namespace corpuscount
