#ifndef COUNT_NGRAMS_H
#define COUNT_NGRAMS_H

#include "FrequencyTable.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace corpuscount {

constexpr char BRACKET_BEGIN = '<';
constexpr char BRACKET_END = '>';

constexpr size_t DEFAULT_MIN_N = 3;
constexpr size_t DEFAULT_MAX_N = 6;

/**
 * Byte offsets of each UTF-8 character in `s`, followed by `s.size()` as a
 * sentinel. Character i spans [offsets[i], offsets[i + 1]).
 */
std::vector<size_t> CharOffsets(std::string_view s);

/**
 * Produces the character n-grams of a token, for every n in [min_n, max_n].
 * With bracketing the token is wrapped in '<' and '>' first, so n-grams can
 * mark word boundaries. Characters are UTF-8 code points, never split.
 *
 * Emission order: all n-grams of length min_n from left to right, then all of
 * length min_n + 1, and so on.
 */
class NGramExtractor {
public:
    // Throws std::invalid_argument unless 1 <= minN <= maxN
    NGramExtractor(size_t minN, size_t maxN, bool bracket);

    template<typename Fn>
    void ForEach(std::string_view token, Fn&& fn) const {
        std::string bracketed;
        std::string_view word = token;
        if (bracket_) {
            bracketed.reserve(token.size() + 2);
            bracketed.push_back(BRACKET_BEGIN);
            bracketed.append(token);
            bracketed.push_back(BRACKET_END);
            word = bracketed;
        }

        auto offsets = CharOffsets(word);
        size_t length = offsets.size() - 1;
        for (size_t n = minN_; n <= maxN_ && n <= length; ++n) {
            for (size_t p = 0; p + n <= length; ++p) {
                fn(word.substr(offsets[p], offsets[p + n] - offsets[p]));
            }
        }
    }

    /**
     * Credits every n-gram of `token` with `occurrences`, the number of times
     * the token was seen. Equivalent to extracting once per occurrence.
     */
    void CountInto(std::string_view token, count_t occurrences, FrequencyTable& table) const;

private:
    size_t minN_;
    size_t maxN_;
    bool bracket_;
};

}  // namespace corpuscount

#endif  // COUNT_NGRAMS_H
