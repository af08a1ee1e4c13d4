#include "Filter.h"

#include <algorithm>
#include <utility>
#include <vector>

namespace corpuscount {

FrequencyTable FilterByCount(FrequencyTable table, count_t minCount) {
    table.Prune(minCount);
    return table;
}

std::vector<CountedItem> SortByCount(FrequencyTable table) {
    auto items = table.Release();
    std::stable_sort(items.begin(), items.end(), [](const CountedItem& a, const CountedItem& b) {
        return a.count > b.count;
    });
    return items;
}

}  // namespace corpuscount
