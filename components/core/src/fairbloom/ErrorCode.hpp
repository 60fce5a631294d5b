#ifndef FAIRBLOOM_ERRORCODE_HPP
#define FAIRBLOOM_ERRORCODE_HPP

namespace fairbloom {
typedef enum {
    ErrorCodeSuccess = 0,
    // Invalid size, hash list, probability or item count
    ErrorCodeBadParam,
    // A closed-form formula is undefined for the given arguments
    ErrorCodeUndefined,
    // Filters (or serialized filters) whose configurations cannot be combined
    ErrorCodeIncompatible,
    // An aggregate without any attached filter
    ErrorCodeUnderflow,
    // An aggregate whose filters are all ineligible for insertion
    ErrorCodeOverflow,
    ErrorCodeCorrupt,
    ErrorCodeUnsupported,
    ErrorCodeFileNotFound,
    ErrorCodeFailure,
} ErrorCode;
}  // namespace fairbloom

#endif  // FAIRBLOOM_ERRORCODE_HPP
