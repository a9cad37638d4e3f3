#ifndef EDI_X12_PROTOCOL_DELIMITERS_H
#define EDI_X12_PROTOCOL_DELIMITERS_H

/**
 * @file delimiters.h
 * @brief X12 interchange delimiter set
 *
 * Holds the three control characters that govern the syntax of an X12
 * interchange and extracts them from the fixed-width ISA header.
 *
 * X12 Delimiters:
 *   - Segment terminator:    ends a segment (default ~)
 *   - Element separator:     separates data elements (default *)
 *   - Sub-element separator: separates components of a composite (default :)
 */

#include "x12_types.h"

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

namespace edi::x12 {

/**
 * @brief Immutable set of X12 delimiters
 *
 * Construction never validates; call are_valid() before handing the set
 * to a tokenizer.
 *
 * @example Extracting From an Interchange
 * ```cpp
 * auto result = delimiters::from_isa(raw_interchange);
 * if (!result) {
 *     std::cerr << to_string(result.error()) << std::endl;
 *     return;
 * }
 * if (!result->are_valid()) {
 *     // Reject the interchange, splitting would be ambiguous
 * }
 * char terminator = result->segment_terminator();
 * ```
 */
class delimiters {
public:
    /**
     * @brief Construct the conventional default set (~ * :)
     */
    constexpr delimiters() noexcept = default;

    /**
     * @brief Construct from explicit characters
     * @param segment_terminator Character used to terminate segments
     * @param element_separator Character used to separate elements
     * @param sub_element_separator Character used to separate sub-elements
     */
    constexpr delimiters(char segment_terminator,
                         char element_separator,
                         char sub_element_separator) noexcept
        : segment_terminator_(segment_terminator),
          element_separator_(element_separator),
          sub_element_separator_(sub_element_separator) {}

    /**
     * @brief Extract delimiters from an ISA header
     *
     * Reads the element separator at offset 3, the sub-element separator
     * at offset 104 and the segment terminator at offset 105. Anything past
     * offset 105 is ignored and the segment tag is not checked.
     *
     * @param isa_segment Raw header bytes (at least 106)
     * @return Extracted delimiters or x12_error::invalid_header_length
     */
    [[nodiscard]] static std::expected<delimiters, x12_error> from_isa(
        std::string_view isa_segment) noexcept;

    /**
     * @brief Extract delimiters from raw ISA header bytes
     */
    [[nodiscard]] static std::expected<delimiters, x12_error> from_isa(
        std::span<const uint8_t> isa_segment) noexcept;

    /**
     * @brief Conventional default delimiters (~ * :)
     */
    [[nodiscard]] static constexpr delimiters default_delimiters() noexcept {
        return delimiters{};
    }

    [[nodiscard]] constexpr char segment_terminator() const noexcept {
        return segment_terminator_;
    }

    [[nodiscard]] constexpr char element_separator() const noexcept {
        return element_separator_;
    }

    [[nodiscard]] constexpr char sub_element_separator() const noexcept {
        return sub_element_separator_;
    }

    /**
     * @brief Check that all three delimiters are distinct
     *
     * Reusing a character for two roles makes tokenization ambiguous.
     */
    [[nodiscard]] constexpr bool are_valid() const noexcept {
        return segment_terminator_ != element_separator_ &&
               segment_terminator_ != sub_element_separator_ &&
               element_separator_ != sub_element_separator_;
    }

    /**
     * @brief Check if the set uses the default characters
     */
    [[nodiscard]] constexpr bool is_default() const noexcept {
        return *this == delimiters{};
    }

    /**
     * @brief Render the set for logs, e.g. segment='~' element='*' sub_element=':'
     *
     * Non-printable characters are rendered as 0xNN.
     */
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] constexpr bool operator==(const delimiters&) const noexcept = default;

private:
    char segment_terminator_ = X12_SEGMENT_TERMINATOR;
    char element_separator_ = X12_ELEMENT_SEPARATOR;
    char sub_element_separator_ = X12_SUB_ELEMENT_SEPARATOR;
};

}  // namespace edi::x12

#endif  // EDI_X12_PROTOCOL_DELIMITERS_H
