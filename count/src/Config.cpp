#include "Config.h"

#include "Errors.h"
#include "Util.h"

#include <cctype>
#include <exception>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>
#include <spdlog/spdlog.h>

namespace corpuscount {

using namespace std::string_view_literals;

namespace {

struct OptionSpec {
    std::string_view name;
    char shortName;
    bool takesValue;
};

constexpr OptionSpec COMMAND_LINE_OPTIONS[] = {
    {"corpus"sv, 'c', true},
    {"token_counts"sv, 't', true},
    {"ngram_counts"sv, 'n', true},
    {"token_min"sv, '\0', true},
    {"ngram_min"sv, '\0', true},
    {"min_n"sv, '\0', true},
    {"max_n"sv, '\0', true},
    {"no_bracket"sv, '\0', false},
    {"filter_first"sv, '\0', false},
    {"config"sv, '\0', true},
    {"log_level"sv, '\0', true},
    {"quiet"sv, 'q', false},
    {"help"sv, 'h', false},
};

// Two paths name the same file if they resolve to one inode, or, when either
// does not exist yet, to the same normalized absolute path
bool SameFile(const std::string& a, const std::string& b) {
    std::error_code ec;
    if (std::filesystem::exists(a, ec) && std::filesystem::exists(b, ec)) {
        bool same = std::filesystem::equivalent(a, b, ec);
        if (!ec) {
            return same;
        }
    }
    auto canonicalA = std::filesystem::weakly_canonical(std::filesystem::absolute(a, ec), ec);
    if (ec) {
        return a == b;
    }
    auto canonicalB = std::filesystem::weakly_canonical(std::filesystem::absolute(b, ec), ec);
    if (ec) {
        return a == b;
    }
    return canonicalA == canonicalB;
}

const OptionSpec* FindLongOption(std::string_view name) {
    for (const auto& spec : COMMAND_LINE_OPTIONS) {
        if (spec.name == name) {
            return &spec;
        }
    }
    return nullptr;
}

const OptionSpec* FindShortOption(char c) {
    for (const auto& spec : COMMAND_LINE_OPTIONS) {
        if (spec.shortName != '\0' && spec.shortName == c) {
            return &spec;
        }
    }
    return nullptr;
}

count_t ParseCount(std::string_view key, std::string_view value) {
    auto invalid = [&]() {
        return ConfigError(std::string{key} + " must be a non-negative integer, got '" + std::string{value} + "'");
    };

    if (value.empty() || !std::isdigit(static_cast<unsigned char>(value.front()))) {
        throw invalid();
    }

    size_t pos = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(std::string{value}, &pos);
    } catch (const std::out_of_range&) {
        throw ConfigError(std::string{key} + " is out of range: " + std::string{value});
    } catch (const std::invalid_argument&) {
        throw invalid();
    }
    if (pos != value.size()) {
        throw invalid();
    }
    return static_cast<count_t>(parsed);
}

bool ParseBool(std::string_view key, std::string_view value) {
    auto lower = ToLowerCase(value);
    if (lower == "true"sv || lower == "1"sv || lower == "yes"sv || lower == "on"sv) {
        return true;
    }
    if (lower == "false"sv || lower == "0"sv || lower == "no"sv || lower == "off"sv) {
        return false;
    }
    throw ConfigError(std::string{key} + " must be true or false, got '" + std::string{value} + "'");
}

std::string RequirePath(std::string_view key, std::string_view value) {
    if (value.empty()) {
        throw ConfigError(std::string{key} + " requires a non-empty path");
    }
    return std::string{value};
}

bool IsKnownLogLevel(const std::string& name) {
    return spdlog::level::from_str(name) != spdlog::level::off || name == "off";
}

}  // namespace

CountOptions CountConfig::ToOptions() const {
    CountOptions options;
    options.token_min = token_min;
    options.ngram_min = ngram_min;
    options.min_n = min_n;
    options.max_n = max_n;
    options.bracket = bracket;
    options.count_ngrams = ngram_counts_path.has_value();
    options.order = filter_first ? FilterOrder::FilterFirst : FilterOrder::CountFirst;
    return options;
}

void ApplyOption(CountConfig& config, std::string_view key, std::string_view value) {
    if (key == "corpus"sv) {
        config.corpus_path = RequirePath(key, value);
    } else if (key == "token_counts"sv) {
        config.token_counts_path = RequirePath(key, value);
    } else if (key == "ngram_counts"sv) {
        config.ngram_counts_path = RequirePath(key, value);
    } else if (key == "token_min"sv) {
        config.token_min = ParseCount(key, value);
    } else if (key == "ngram_min"sv) {
        config.ngram_min = ParseCount(key, value);
    } else if (key == "min_n"sv) {
        config.min_n = ParseCount(key, value);
    } else if (key == "max_n"sv) {
        config.max_n = ParseCount(key, value);
    } else if (key == "bracket"sv) {
        config.bracket = ParseBool(key, value);
    } else if (key == "no_bracket"sv) {
        config.bracket = !ParseBool(key, value);
    } else if (key == "filter_first"sv) {
        config.filter_first = ParseBool(key, value);
    } else if (key == "log_level"sv) {
        config.log_level = ToLowerCase(value);
    } else if (key == "quiet"sv) {
        if (ParseBool(key, value)) {
            config.log_level = "warn";
        }
    } else if (key == "help"sv) {
        config.show_help = ParseBool(key, value);
    } else {
        throw ConfigError("unknown option: " + std::string{key});
    }
}

void LoadConfigFromFile(const std::string& path, CountConfig& config) {
    std::string fileData;
    try {
        fileData = ReadFile(path.c_str());
    } catch (const std::runtime_error& e) {
        throw ConfigError(std::string{"cannot load config: "} + e.what());
    }

    auto lines = GetLines(fileData);

    size_t lineNumber = 0;
    for (auto line : lines) {
        ++lineNumber;
        line = Trim(line);
        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto eqPos = line.find('=');
        if (eqPos == std::string_view::npos) {
            throw ConfigError(path + " line " + std::to_string(lineNumber) + ": missing '='");
        }

        auto key = Trim(line.substr(0, eqPos));
        auto value = Trim(line.substr(eqPos + 1));

        try {
            ApplyOption(config, key, value);
        } catch (const ConfigError& e) {
            throw ConfigError(path + " line " + std::to_string(lineNumber) + ": " + e.what());
        }
    }

    spdlog::debug("loaded {} config lines from {}", lineNumber, path);
}

CountConfig ParseCommandLine(int argc, const char* const* argv) {
    std::vector<std::pair<std::string, std::string>> options;
    std::optional<std::string> configPath;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);
        const OptionSpec* spec = nullptr;
        std::optional<std::string_view> inlineValue;

        if (arg.starts_with("--") && arg.size() > 2) {
            auto name = arg.substr(2);
            auto eqPos = name.find('=');
            if (eqPos != std::string_view::npos) {
                inlineValue = name.substr(eqPos + 1);
                name = name.substr(0, eqPos);
            }
            spec = FindLongOption(name);
            if (spec == nullptr) {
                throw ConfigError("unknown option: --" + std::string{name});
            }
        } else if (arg.size() == 2 && arg[0] == '-' && arg[1] != '-') {
            spec = FindShortOption(arg[1]);
            if (spec == nullptr) {
                throw ConfigError("unknown option: " + std::string{arg});
            }
        } else {
            throw ConfigError("unexpected argument: " + std::string{arg});
        }

        std::string value;
        if (spec->takesValue) {
            if (inlineValue) {
                value = *inlineValue;
            } else if (i + 1 < argc) {
                value = argv[++i];
            } else {
                throw ConfigError("option --" + std::string{spec->name} + " requires a value");
            }
        } else {
            if (inlineValue) {
                throw ConfigError("option --" + std::string{spec->name} + " does not take a value");
            }
            value = "true";
        }

        if (spec->name == "config"sv) {
            configPath = RequirePath(spec->name, value);
        } else {
            options.emplace_back(spec->name, std::move(value));
        }
    }

    CountConfig config;
    if (configPath) {
        LoadConfigFromFile(*configPath, config);
    }
    for (const auto& [key, value] : options) {
        ApplyOption(config, key, value);
    }
    return config;
}

void ValidateConfig(const CountConfig& config) {
    if (config.min_n == 0) {
        throw ConfigError("the minimum n-gram length cannot be zero");
    }
    if (config.min_n > config.max_n) {
        throw ConfigError("the maximum n-gram length (" + std::to_string(config.max_n) +
                          ") must be equal to or greater than the minimum length (" + std::to_string(config.min_n) +
                          ")");
    }
    if (!IsKnownLogLevel(config.log_level)) {
        throw ConfigError("unknown log level: " + config.log_level);
    }
    // Outputs are truncated before the corpus is read
    if (config.corpus_path) {
        for (const auto& output : {config.token_counts_path, config.ngram_counts_path}) {
            if (output && SameFile(*config.corpus_path, *output)) {
                throw ConfigError("counts cannot be written over the corpus: " + *output);
            }
        }
    }
    if (config.token_counts_path && config.ngram_counts_path &&
        SameFile(*config.token_counts_path, *config.ngram_counts_path)) {
        throw ConfigError("token and n-gram counts cannot be written to the same file: " + *config.token_counts_path);
    }
}

std::string Usage(std::string_view program) {
    std::string usage = "Usage: ";
    usage.append(program);
    usage.append(R"( [options]

Counts whitespace-separated tokens and their character n-grams.

Options:
  -c, --corpus PATH        corpus file (default: stdin)
  -t, --token_counts PATH  token count output (default: stdout)
  -n, --ngram_counts PATH  n-gram count output (n-grams are only counted if set)
      --token_min N        drop tokens seen fewer than N times (default: no filtering)
      --ngram_min N        drop n-grams seen fewer than N times (default: no filtering)
      --min_n N            minimum n-gram length (default: 3)
      --max_n N            maximum n-gram length (default: 6)
      --no_bracket         do not wrap tokens in '<' and '>' before extracting n-grams
      --filter_first       filter tokens before counting n-grams
      --config PATH        read options from a key = value file
      --log_level LEVEL    trace, debug, info, warn, error, critical or off (default: info)
  -q, --quiet              only log warnings and errors
  -h, --help               show this message
)");
    return usage;
}

}  // namespace corpuscount
