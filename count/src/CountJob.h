#ifndef COUNT_COUNTJOB_H
#define COUNT_COUNTJOB_H

#include "Config.h"
#include "Pipeline.h"
#include "data/Writer.h"

#include <optional>
#include <string>

namespace corpuscount {

/**
 * @brief Reads the corpus from `path`, or from stdin when unset.
 * Throws IoError naming the source on failure.
 */
std::string ReadCorpus(const std::optional<std::string>& path);

/**
 * @brief Opens an output destination, or borrows stdout when unset.
 * Throws IoError naming the destination on failure.
 */
data::FileWriter OpenDestination(const std::optional<std::string>& path);

/**
 * @brief Runs a full count: open outputs, read the corpus, count, write the
 * token and (if configured) n-gram tables. The configuration must have
 * passed ValidateConfig.
 */
CountResult RunCountJob(const CountConfig& config);

}  // namespace corpuscount

#endif  // COUNT_COUNTJOB_H
