/**
 * @file delimiters.cpp
 * @brief X12 delimiter extraction implementation
 */

#include "edi/x12/protocol/delimiters.h"

#include <cstdio>

namespace edi::x12 {

namespace {

void append_character(std::string& out, char c) {
    auto code = static_cast<unsigned char>(c);
    if (code >= 0x21 && code <= 0x7E) {
        out += '\'';
        out += c;
        out += '\'';
        return;
    }

    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "0x%02X", static_cast<unsigned>(code));
    out += buffer;
}

}  // namespace

// =============================================================================
// delimiters Implementation
// =============================================================================

std::expected<delimiters, x12_error> delimiters::from_isa(
    std::string_view isa_segment) noexcept {
    if (isa_segment.size() < ISA_MIN_LENGTH) {
        return std::unexpected(x12_error::invalid_header_length);
    }

    return delimiters{isa_segment[ISA_SEGMENT_TERMINATOR_INDEX],
                      isa_segment[ISA_ELEMENT_SEPARATOR_INDEX],
                      isa_segment[ISA_SUB_ELEMENT_SEPARATOR_INDEX]};
}

std::expected<delimiters, x12_error> delimiters::from_isa(
    std::span<const uint8_t> isa_segment) noexcept {
    return from_isa(std::string_view(
        reinterpret_cast<const char*>(isa_segment.data()), isa_segment.size()));
}

std::string delimiters::to_string() const {
    std::string result;
    result.reserve(48);

    result += "segment=";
    append_character(result, segment_terminator_);
    result += " element=";
    append_character(result, element_separator_);
    result += " sub_element=";
    append_character(result, sub_element_separator_);

    return result;
}

}  // namespace edi::x12
