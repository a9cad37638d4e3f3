#ifndef EDI_X12_PROTOCOL_X12_TYPES_H
#define EDI_X12_PROTOCOL_X12_TYPES_H

/**
 * @file x12_types.h
 * @brief X12 interchange protocol constants and error codes
 *
 * Defines the constants and error codes used when locating the control
 * characters of an X12 EDI interchange.
 *
 * ISA Header Layout (fixed width, 106 bytes):
 *   - Bytes 0-2:  Segment tag "ISA"
 *   - Byte  3:    Element separator
 *   - Bytes 4-103: ISA01 through ISA15 with their element separators
 *   - Byte  104:  Sub-element separator (ISA16)
 *   - Byte  105:  Segment terminator
 *
 * @see ASC X12 Interchange Control Structures (ISA/IEA)
 */

#include <cstddef>
#include <string>

#include <kcenon/common/patterns/result.h>

namespace edi::x12 {

// =============================================================================
// Result Type Aliases
// =============================================================================

/**
 * @brief Result type alias for X12 operations
 */
template<typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief VoidResult type alias for operations with no return value
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error info type alias
 */
using error_info = kcenon::common::error_info;

// =============================================================================
// X12 Protocol Constants
// =============================================================================

/** Default segment terminator character */
constexpr char X12_SEGMENT_TERMINATOR = '~';

/** Default element separator character */
constexpr char X12_ELEMENT_SEPARATOR = '*';

/** Default sub-element (component) separator character */
constexpr char X12_SUB_ELEMENT_SEPARATOR = ':';

/** Segment tag that opens every interchange */
constexpr const char* X12_ISA_TAG = "ISA";

/** Minimum number of header bytes needed to reach the segment terminator */
constexpr std::size_t ISA_MIN_LENGTH = 106;

/** Offset of the element separator within the ISA header */
constexpr std::size_t ISA_ELEMENT_SEPARATOR_INDEX = 3;

/** Offset of the sub-element separator (ISA16) within the ISA header */
constexpr std::size_t ISA_SUB_ELEMENT_SEPARATOR_INDEX = 104;

/** Offset of the segment terminator within the ISA header */
constexpr std::size_t ISA_SEGMENT_TERMINATOR_INDEX = 105;

// =============================================================================
// Error Codes (-1000 to -1009)
// =============================================================================

/**
 * @brief X12 specific error codes
 *
 * Allocated range: -1000 to -1009
 */
enum class x12_error : int {
    /** Header is too short to reach the segment terminator offset */
    invalid_header_length = -1000,

    /** Header does not begin with the ISA segment tag */
    missing_isa_tag = -1001,

    /** Two or more delimiters share the same character */
    ambiguous_delimiters = -1002,

    /** Header bytes could not be read from their source */
    io_error = -1003
};

/**
 * @brief Convert x12_error to error code integer
 */
[[nodiscard]] constexpr int to_error_code(x12_error error) noexcept {
    return static_cast<int>(error);
}

/**
 * @brief Get human-readable description of X12 error
 */
[[nodiscard]] constexpr const char* to_string(x12_error error) noexcept {
    switch (error) {
        case x12_error::invalid_header_length:
            return "header must be at least 106 bytes to extract delimiters";
        case x12_error::missing_isa_tag:
            return "header does not start with the ISA segment tag";
        case x12_error::ambiguous_delimiters:
            return "delimiters are not pairwise distinct";
        case x12_error::io_error:
            return "failed to read interchange header";
        default:
            return "Unknown X12 error";
    }
}

/**
 * @brief Convert x12_error to error_info for Result<T>
 *
 * @param error X12 error code
 * @param details Optional additional details
 * @return error_info for use with Result<T>
 */
[[nodiscard]] inline error_info to_error_info(
    x12_error error,
    const std::string& details = "") {
    return error_info{
        static_cast<int>(error),
        to_string(error),
        "x12",
        details
    };
}

}  // namespace edi::x12

#endif  // EDI_X12_PROTOCOL_X12_TYPES_H
