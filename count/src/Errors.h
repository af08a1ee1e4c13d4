#ifndef COUNT_ERRORS_H
#define COUNT_ERRORS_H

#include <stdexcept>

namespace corpuscount {

// Invalid or contradictory options. Raised before any input is read.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Unreadable corpus or unwritable destination. The message names the path.
class IoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace corpuscount

#endif  // COUNT_ERRORS_H
