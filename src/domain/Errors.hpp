/**
 * @file Errors.hpp
 * @brief Exception types shared across layers.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace radview::domain {

/**
 * @class NotFoundError
 * @brief A requested entity does not exist. Callers branch on this type.
 */
class NotFoundError : public std::runtime_error {
public:
    NotFoundError(std::string kind, const std::string& message)
        : std::runtime_error(message), m_kind(std::move(kind)) {}

    /** @brief Entity kind, e.g. "patch", "issue", "repository". */
    const std::string& kind() const { return m_kind; }

private:
    std::string m_kind;
};

/**
 * @class HintedError
 * @brief Failure with a remediation hint kept apart from the message.
 */
class HintedError : public std::runtime_error {
public:
    HintedError(const std::string& message, std::string hint)
        : std::runtime_error(message), m_hint(std::move(hint)) {}

    const std::string& hint() const { return m_hint; }

private:
    std::string m_hint;
};

/** @brief Repository or reference store failure. */
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** @brief Malformed or unusable configuration. */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace radview::domain
