#ifndef COUNT_FREQUENCYTABLE_H
#define COUNT_FREQUENCYTABLE_H

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace corpuscount {

using count_t = uint64_t;

struct CountedItem {
    std::string item;
    count_t count{0};

    bool operator==(const CountedItem&) const = default;
};

/**
 * Accumulates occurrence counts per item. Entries are enumerated in the order
 * their items were first inserted; sorting relies on this for tie-breaking.
 *
 * The index holds views into the entry strings, so entries live in a deque
 * (stable addresses on push_back) and the table is move-only.
 */
class FrequencyTable {
public:
    FrequencyTable() = default;

    FrequencyTable(const FrequencyTable&) = delete;
    FrequencyTable& operator=(const FrequencyTable&) = delete;
    FrequencyTable(FrequencyTable&&) = default;
    FrequencyTable& operator=(FrequencyTable&&) = default;

    void Increment(std::string_view item) { Add(item, 1); }
    void Add(std::string_view item, count_t n);

    // Returns 0 for unknown items
    count_t Count(std::string_view item) const;
    bool Contains(std::string_view item) const { return index_.count(item) != 0; }

    const std::deque<CountedItem>& Entries() const { return entries_; }
    size_t Size() const { return entries_.size(); }
    bool Empty() const { return entries_.empty(); }
    count_t Total() const;

    /**
     * Drops entries whose count is below `minCount`. Survivors keep their
     * relative order.
     */
    void Prune(count_t minCount);

    // Moves the entries out in first-seen order, leaving the table empty
    std::vector<CountedItem> Release();

private:
    void Reindex();

    std::deque<CountedItem> entries_;
    std::unordered_map<std::string_view, size_t> index_;
};

}  // namespace corpuscount

#endif  // COUNT_FREQUENCYTABLE_H
