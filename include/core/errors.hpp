/**
 * @file errors.hpp
 * @brief Exception types raised by the analytics engine.
 */

#ifndef PERFRISK_CORE_ERRORS_HPP
#define PERFRISK_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace perfrisk
{

    /**
     * @class ValidationError
     * @brief Fatal input error (empty equity curve, non-positive values,
     *        malformed fills, export with no records).
     *
     * Derives from std::invalid_argument so callers that only care about
     * bad input can catch the standard type.
     */
    class ValidationError : public std::invalid_argument
    {
    public:
        explicit ValidationError(const std::string &message)
            : std::invalid_argument(message) {}
    };

} // namespace perfrisk

#endif // PERFRISK_CORE_ERRORS_HPP
