/**
 * @file HttpError.hpp
 * @brief Transport-level failure raised by HttpClient implementations.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace logoscout::infrastructure {

/**
 * @class HttpError
 * @brief Connection, TLS, timeout or cancellation failure. HTTP statuses are not errors at this level.
 */
class HttpError : public std::runtime_error {
public:
    enum class Kind { Connection, Timeout, Cancelled, InvalidUrl, Other };

    HttpError(Kind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    Kind kind() const { return m_kind; }

private:
    Kind m_kind;
};

} // namespace logoscout::infrastructure
