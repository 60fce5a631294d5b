#ifndef FAIRBLOOM_FILTER_FILE_HPP
#define FAIRBLOOM_FILTER_FILE_HPP

#include <string>
#include <utility>

#include "../TraceableException.hpp"
#include "FilterComponent.hpp"

namespace fairbloom::filter {
class FilterFileOperationFailed : public TraceableException {
public:
    // Constructors
    FilterFileOperationFailed(
            ErrorCode error_code,
            char const* const filename,
            int line_number,
            std::string message
    )
            : TraceableException(error_code, filename, line_number),
              m_message(std::move(message)) {}

    // Methods
    [[nodiscard]] auto what() const noexcept -> char const* override { return m_message.c_str(); }

private:
    std::string m_message;
};

/**
 * Serializes a filter component into the given file, replacing its content
 * @param path
 * @param component
 * @throw FilterFileOperationFailed with ErrorCodeFailure if the file can't be written
 */
void write_filter_file(std::string const& path, FilterComponent const& component);

/**
 * @param path
 * @param factory Factory given to auto-growing aggregates found in the file
 * @return The deserialized filter component
 * @throw FilterFileOperationFailed with ErrorCodeFileNotFound if the file doesn't exist
 * @throw FilterFileOperationFailed with ErrorCodeFailure if the file can't be read
 * @throw FilterFileOperationFailed with ErrorCodeCorrupt if the file isn't a JSON document
 * @throw FilterComponent::OperationFailed (or one of the filter exceptions) if the document isn't
 * a valid filter component
 */
[[nodiscard]] auto read_filter_file(std::string const& path, FilterFactory const& factory = {})
        -> FilterComponent;
}  // namespace fairbloom::filter

#endif  // FAIRBLOOM_FILTER_FILE_HPP
