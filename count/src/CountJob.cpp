#include "CountJob.h"

#include "Errors.h"
#include "Output.h"
#include "Util.h"

#include <chrono>
#include <cstdio>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace corpuscount {

namespace {

void EmitCounts(const std::vector<CountedItem>& items, data::FileWriter& writer) {
    try {
        WriteCounts(items, writer);
        writer.Close();
    } catch (const std::runtime_error& e) {
        throw IoError(e.what());
    }
    spdlog::debug("wrote {} lines to {}", items.size(), writer.Name());
}

}  // namespace

std::string ReadCorpus(const std::optional<std::string>& path) {
    try {
        if (path) {
            return ReadFile(path->c_str());
        }
        return ReadStream(stdin, "<stdin>");
    } catch (const std::runtime_error& e) {
        throw IoError(std::string{"can't read corpus: "} + e.what());
    }
}

data::FileWriter OpenDestination(const std::optional<std::string>& path) {
    if (!path) {
        return data::FileWriter{stdout, "<stdout>"};
    }
    try {
        return data::FileWriter{path->c_str()};
    } catch (const std::runtime_error& e) {
        throw IoError(e.what());
    }
}

CountResult RunCountJob(const CountConfig& config) {
    auto options = config.ToOptions();
    if (!options.count_ngrams && config.ngram_min > 0) {
        spdlog::warn("ngram_min is set but no n-gram output is configured, n-grams will not be counted");
    }
    spdlog::debug("options: token_min={} ngram_min={} min_n={} max_n={} bracket={} filter_first={}",
                  options.token_min,
                  options.ngram_min,
                  options.min_n,
                  options.max_n,
                  options.bracket,
                  config.filter_first);

    auto startTime = std::chrono::steady_clock::now();

    // Open outputs first so an unwritable destination fails before the corpus is read
    auto tokenOut = OpenDestination(config.token_counts_path);
    std::optional<data::FileWriter> ngramOut;
    if (options.count_ngrams) {
        ngramOut.emplace(OpenDestination(config.ngram_counts_path));
    }

    LogStage(Stage::ReadInput);
    auto corpus = ReadCorpus(config.corpus_path);
    spdlog::info("read {} bytes from {}", corpus.size(), config.corpus_path.value_or("<stdin>"));

    CountPipeline pipeline(options);
    auto result = pipeline.Run(corpus);

    spdlog::info("counted {} tokens, {} distinct, {} after filtering",
                 result.token_occurrences,
                 result.distinct_tokens,
                 result.tokens.size());
    if (result.ngrams) {
        spdlog::info("counted {} n-grams, {} distinct, {} after filtering",
                     result.ngram_occurrences,
                     result.distinct_ngrams,
                     result.ngrams->size());
    }

    LogStage(Stage::EmitTokenOutput);
    EmitCounts(result.tokens, tokenOut);

    if (ngramOut) {
        LogStage(Stage::EmitNGramOutput);
        EmitCounts(*result.ngrams, *ngramOut);
    }

    auto elapsedMs =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime).count();
    LogStage(Stage::Done);
    spdlog::info("completed in {} ms", elapsedMs);

    return result;
}

}  // namespace corpuscount
