#ifndef EDI_X12_PROTOCOL_ISA_INSPECTOR_H
#define EDI_X12_PROTOCOL_ISA_INSPECTOR_H

/**
 * @file isa_inspector.h
 * @brief Reads an interchange header and reports its delimiters
 *
 * The inspector sits between a byte source (file, stream) and
 * delimiters::from_isa(). It adds the optional checks that the bare
 * extractor leaves to its caller: the ISA segment tag and pairwise
 * distinct delimiters.
 */

#include "delimiters.h"
#include "x12_types.h"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>

namespace edi::x12 {

// =============================================================================
// Inspector Options
// =============================================================================

/**
 * @brief Inspector configuration options
 */
struct inspector_options {
    /** Reject headers that do not begin with "ISA" */
    bool require_isa_tag = false;

    /** Reject headers whose delimiters are not pairwise distinct */
    bool require_valid_delimiters = false;

    /**
     * Maximum number of bytes read from a file or stream. Values above the
     * largest std::streamsize are treated as that maximum; memory grows with
     * the bytes actually read, not with this limit.
     */
    std::size_t read_limit = 4096;
};

// =============================================================================
// Inspection Report
// =============================================================================

/**
 * @brief Outcome of inspecting one interchange header
 */
struct inspection_report {
    /** Delimiters found at the fixed ISA offsets */
    delimiters found;

    /** Whether the header started with "ISA" */
    bool has_isa_tag = false;

    /** Result of found.are_valid() */
    bool delimiters_valid = false;

    /** Number of header bytes that were available */
    std::size_t header_size = 0;
};

// =============================================================================
// ISA Inspector
// =============================================================================

/**
 * @brief Interchange header inspector
 *
 * @example Inspecting a File
 * ```cpp
 * inspector_options opts;
 * opts.require_isa_tag = true;
 *
 * isa_inspector inspector(opts);
 * auto header = inspector.read_header(path);
 * if (header.is_err()) {
 *     return;
 * }
 * auto report = inspector.inspect(header.value());
 * ```
 */
class isa_inspector {
public:
    isa_inspector() = default;

    explicit isa_inspector(const inspector_options& options)
        : options_(options) {}

    /**
     * @brief Extract and check the delimiters of a header
     *
     * @param header Raw header bytes
     * @return Report, or invalid_header_length / missing_isa_tag /
     *         ambiguous_delimiters
     */
    [[nodiscard]] std::expected<inspection_report, x12_error> inspect(
        std::string_view header) const;

    /**
     * @brief Read up to read_limit bytes from a stream
     * @return Bytes read, or io_error if the stream is unusable
     */
    [[nodiscard]] Result<std::string> read_header(std::istream& input) const;

    /**
     * @brief Read up to read_limit bytes from a file
     * @return Bytes read, or io_error naming the path
     */
    [[nodiscard]] Result<std::string> read_header(
        const std::filesystem::path& path) const;

    [[nodiscard]] const inspector_options& options() const noexcept {
        return options_;
    }

private:
    inspector_options options_;
};

}  // namespace edi::x12

#endif  // EDI_X12_PROTOCOL_ISA_INSPECTOR_H
