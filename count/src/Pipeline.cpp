#include "Pipeline.h"

#include "Filter.h"
#include "Tokenizer.h"

#include <optional>
#include <string_view>
#include <utility>
#include <spdlog/spdlog.h>

namespace corpuscount {

std::string_view StageName(Stage stage) {
    switch (stage) {
    case Stage::ReadInput:
        return "ReadInput";
    case Stage::TokenizeAndCountTokens:
        return "TokenizeAndCountTokens";
    case Stage::CountNGramsBeforeFilter:
        return "CountNGramsBeforeFilter";
    case Stage::FilterTokensThenCountNGrams:
        return "FilterTokensThenCountNGrams";
    case Stage::FilterTokenTable:
        return "FilterTokenTable";
    case Stage::FilterNGramTable:
        return "FilterNGramTable";
    case Stage::EmitTokenOutput:
        return "EmitTokenOutput";
    case Stage::EmitNGramOutput:
        return "EmitNGramOutput";
    case Stage::Done:
        return "Done";
    }
    return "Unknown";
}

void LogStage(Stage stage) {
    spdlog::debug("pipeline stage: {}", StageName(stage));
}

CountPipeline::CountPipeline(const CountOptions& options)
    : options_(options), extractor_(options.min_n, options.max_n, options.bracket) {}

FrequencyTable CountPipeline::CountTokens(std::string_view corpus) const {
    FrequencyTable tokens;
    Tokenizer tokenizer(corpus);
    std::string_view token;
    while (tokenizer.Next(token)) {
        tokens.Increment(token);
    }
    return tokens;
}

FrequencyTable CountPipeline::CountNGrams(const FrequencyTable& tokens) const {
    FrequencyTable ngrams;
    for (const auto& entry : tokens.Entries()) {
        extractor_.CountInto(entry.item, entry.count, ngrams);
    }
    return ngrams;
}

CountResult CountPipeline::Run(std::string_view corpus) const {
    CountResult result;

    LogStage(Stage::TokenizeAndCountTokens);
    auto tokens = CountTokens(corpus);
    result.token_occurrences = tokens.Total();
    result.distinct_tokens = tokens.Size();

    std::optional<FrequencyTable> ngrams;
    if (options_.count_ngrams) {
        switch (options_.order) {
        case FilterOrder::CountFirst:
            LogStage(Stage::CountNGramsBeforeFilter);
            ngrams = CountNGrams(tokens);
            break;
        case FilterOrder::FilterFirst:
            LogStage(Stage::FilterTokensThenCountNGrams);
            tokens = FilterByCount(std::move(tokens), options_.token_min);
            ngrams = CountNGrams(tokens);
            break;
        }
    }

    // A no-op for filter-first, where the table is already filtered
    LogStage(Stage::FilterTokenTable);
    tokens = FilterByCount(std::move(tokens), options_.token_min);
    spdlog::debug("{} of {} distinct tokens kept (token_min={})",
                  tokens.Size(),
                  result.distinct_tokens,
                  options_.token_min);

    if (ngrams) {
        result.ngram_occurrences = ngrams->Total();
        result.distinct_ngrams = ngrams->Size();

        LogStage(Stage::FilterNGramTable);
        *ngrams = FilterByCount(std::move(*ngrams), options_.ngram_min);
        spdlog::debug("{} of {} distinct n-grams kept (ngram_min={})",
                      ngrams->Size(),
                      result.distinct_ngrams,
                      options_.ngram_min);

        result.ngrams = SortByCount(std::move(*ngrams));
    }

    result.tokens = SortByCount(std::move(tokens));
    return result;
}

}  // namespace corpuscount
