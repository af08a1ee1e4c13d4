#include "NGrams.h"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace corpuscount {

std::vector<size_t> CharOffsets(std::string_view s) {
    std::vector<size_t> offsets;
    offsets.reserve(s.size() + 1);
    for (size_t i = 0; i < s.size(); ++i) {
        // Skip UTF-8 continuation bytes (10xxxxxx)
        if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) {
            offsets.push_back(i);
        }
    }
    offsets.push_back(s.size());
    return offsets;
}

NGramExtractor::NGramExtractor(size_t minN, size_t maxN, bool bracket) : minN_(minN), maxN_(maxN), bracket_(bracket) {
    if (minN_ == 0) {
        throw std::invalid_argument("minimum n-gram length cannot be zero");
    }
    if (minN_ > maxN_) {
        throw std::invalid_argument("maximum n-gram length must not be smaller than the minimum");
    }
}

void NGramExtractor::CountInto(std::string_view token, count_t occurrences, FrequencyTable& table) const {
    ForEach(token, [&](std::string_view ngram) { table.Add(ngram, occurrences); });
}

}  // namespace corpuscount
