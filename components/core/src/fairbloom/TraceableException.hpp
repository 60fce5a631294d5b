#ifndef FAIRBLOOM_TRACEABLEEXCEPTION_HPP
#define FAIRBLOOM_TRACEABLEEXCEPTION_HPP

#include <exception>

#include "ErrorCode.hpp"

namespace fairbloom {
/**
 * Base class for exceptions that record the error code and the source location of the throw site
 */
class TraceableException : public std::exception {
public:
    // Constructors
    TraceableException(ErrorCode error_code, char const* const filename, int line_number)
            : m_error_code(error_code),
              m_filename(filename),
              m_line_number(line_number) {}

    // Methods
    [[nodiscard]] auto get_error_code() const -> ErrorCode { return m_error_code; }

    [[nodiscard]] auto get_filename() const -> char const* { return m_filename; }

    [[nodiscard]] auto get_line_number() const -> int { return m_line_number; }

    [[nodiscard]] auto what() const noexcept -> char const* override {
        return "fairbloom::TraceableException";
    }

private:
    // Variables
    ErrorCode m_error_code;
    char const* m_filename;
    int m_line_number;
};
}  // namespace fairbloom

// Define a version of __FILE__ that's relative to the source directory
#ifdef SOURCE_PATH_SIZE
    #define __FILENAME__ ((__FILE__) + SOURCE_PATH_SIZE)
#else
    // We don't know the source path size, so just default to __FILE__
    #define __FILENAME__ __FILE__
#endif

#endif  // FAIRBLOOM_TRACEABLEEXCEPTION_HPP
