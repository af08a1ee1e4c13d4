#ifndef COUNT_OUTPUT_H
#define COUNT_OUTPUT_H

#include "FrequencyTable.h"
#include "data/Writer.h"

#include <string>
#include <vector>

namespace corpuscount {

// Writes one "item\tcount\n" line per entry, in the given order
template<data::Writer W>
void WriteCounts(const std::vector<CountedItem>& items, W& writer) {
    std::string line;
    for (const auto& entry : items) {
        line.clear();
        line.append(entry.item);
        line.push_back('\t');
        line.append(std::to_string(entry.count));
        line.push_back('\n');
        writer.Write(line.data(), line.size());
    }
}

}  // namespace corpuscount

#endif  // COUNT_OUTPUT_H
