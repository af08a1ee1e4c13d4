#ifndef COUNT_PIPELINE_H
#define COUNT_PIPELINE_H

#include "FrequencyTable.h"
#include "NGrams.h"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace corpuscount {

enum class FilterOrder {
    // Count n-grams over every token, then filter both tables independently
    CountFirst,
    // Filter tokens first; only surviving tokens contribute n-grams
    FilterFirst
};

enum class Stage {
    ReadInput,
    TokenizeAndCountTokens,
    CountNGramsBeforeFilter,
    FilterTokensThenCountNGrams,
    FilterTokenTable,
    FilterNGramTable,
    EmitTokenOutput,
    EmitNGramOutput,
    Done
};

std::string_view StageName(Stage stage);

// Logs entry into `stage` at debug level
void LogStage(Stage stage);

struct CountOptions {
    count_t token_min = 0;  // 0 disables filtering
    count_t ngram_min = 0;
    size_t min_n = DEFAULT_MIN_N;
    size_t max_n = DEFAULT_MAX_N;
    bool bracket = true;
    bool count_ngrams = false;
    FilterOrder order = FilterOrder::CountFirst;
};

struct CountResult {
    std::vector<CountedItem> tokens;
    // Empty unless n-gram counting was requested
    std::optional<std::vector<CountedItem>> ngrams;

    count_t token_occurrences{0};
    size_t distinct_tokens{0};
    count_t ngram_occurrences{0};
    size_t distinct_ngrams{0};
};

/**
 * Counts tokens and, optionally, character n-grams of a corpus held in memory.
 *
 * N-grams are derived from the distinct tokens, each credited with the
 * token's corpus count. This matches extracting per occurrence, including the
 * first-seen order of n-grams, at a fraction of the work.
 */
class CountPipeline {
public:
    // Throws std::invalid_argument for an invalid n-gram length range
    explicit CountPipeline(const CountOptions& options);

    CountResult Run(std::string_view corpus) const;

    FrequencyTable CountTokens(std::string_view corpus) const;
    FrequencyTable CountNGrams(const FrequencyTable& tokens) const;

private:
    const CountOptions options_;
    const NGramExtractor extractor_;
};

}  // namespace corpuscount

#endif  // COUNT_PIPELINE_H
