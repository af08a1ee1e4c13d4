#ifndef COUNT_CONFIG_H
#define COUNT_CONFIG_H

#include "NGrams.h"
#include "Pipeline.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace corpuscount {

struct CountConfig {
    std::string log_level = "info";

    // Unset paths mean stdin / stdout
    std::optional<std::string> corpus_path;
    std::optional<std::string> token_counts_path;
    // Unset disables n-gram counting
    std::optional<std::string> ngram_counts_path;

    count_t token_min = 0;
    count_t ngram_min = 0;

    size_t min_n = DEFAULT_MIN_N;
    size_t max_n = DEFAULT_MAX_N;

    bool bracket = true;
    bool filter_first = false;

    bool show_help = false;

    CountOptions ToOptions() const;
};

/**
 * Sets one option by name. Names are shared by the command line and config
 * files (`min_n`, `token_counts`, ...). Throws ConfigError on unknown names
 * and unparsable values.
 */
void ApplyOption(CountConfig& config, std::string_view key, std::string_view value);

/**
 * Applies a `key = value` file on top of `config`. Blank lines and lines
 * starting with '#' are skipped.
 */
void LoadConfigFromFile(const std::string& path, CountConfig& config);

/**
 * Builds the configuration from argv. A `--config` file is applied first and
 * the remaining options override it, wherever they appear.
 */
CountConfig ParseCommandLine(int argc, const char* const* argv);

// Rejects configurations the pipeline cannot run with
void ValidateConfig(const CountConfig& config);

std::string Usage(std::string_view program);

}  // namespace corpuscount

#endif  // COUNT_CONFIG_H
