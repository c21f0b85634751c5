//
// Created by Giuseppe Francione on 14/01/26.
//

#ifndef LFSKIT_ERRORS_HPP
#define LFSKIT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace lfskit {

/**
 * @brief Base class for every error raised by lfskit itself.
 *
 * Failures coming from the wrapped readers/writers or from user callbacks
 * are propagated untouched and are not required to derive from this.
 */
class LfsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Invalid configuration detected before any I/O took place
 * (e.g. a relative progress log destination).
 */
class ConfigurationError : public LfsError {
public:
    using LfsError::LfsError;
};

/**
 * @brief Failure creating, opening, writing or syncing the progress log.
 *
 * The message carries the event name and the log destination.
 */
class ProgressLogError : public LfsError {
public:
    ProgressLogError(const std::string& event,
                     const std::string& destination,
                     const std::string& cause)
        : LfsError("Error writing Git LFS " + event + " progress to " + destination + ": " + cause),
          event_(event), destination_(destination) {}

    [[nodiscard]] const std::string& event() const noexcept { return event_; }
    [[nodiscard]] const std::string& destination() const noexcept { return destination_; }

private:
    std::string event_;
    std::string destination_;
};

/**
 * @brief Malformed glob pattern (unterminated class, dangling escape, ...).
 */
class BadPatternError : public LfsError {
public:
    explicit BadPatternError(const std::string& pattern)
        : LfsError("syntax error in pattern: " + pattern) {}
};

} // namespace lfskit

#endif // LFSKIT_ERRORS_HPP
