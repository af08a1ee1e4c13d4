#ifndef COUNT_FILTER_H
#define COUNT_FILTER_H

#include "FrequencyTable.h"

#include <vector>

namespace corpuscount {

/**
 * Keeps the entries with count >= minCount. A threshold of 0 keeps everything.
 * Applying the same threshold twice gives the same table.
 */
FrequencyTable FilterByCount(FrequencyTable table, count_t minCount);

/**
 * Orders entries by descending count. Equal counts stay in first-seen order
 * (stable sort over the table's enumeration order).
 */
std::vector<CountedItem> SortByCount(FrequencyTable table);

}  // namespace corpuscount

#endif  // COUNT_FILTER_H
