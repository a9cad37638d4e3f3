/**
 * @file isa_inspector.cpp
 * @brief Interchange header inspector implementation
 */

#include "edi/x12/protocol/isa_inspector.h"

#include "edi/x12/integration/logger_adapter.h"

#include <algorithm>
#include <fstream>
#include <istream>
#include <limits>

namespace edi::x12 {

namespace {

constexpr std::size_t READ_CHUNK_SIZE = 4096;

}  // namespace

std::expected<inspection_report, x12_error> isa_inspector::inspect(
    std::string_view header) const {
    auto logger = integration::get_logger();

    auto extracted = delimiters::from_isa(header);
    if (!extracted) {
        logger->warning("ISA header rejected: " + std::string(to_string(extracted.error())) +
                       " (got " + std::to_string(header.size()) + " bytes)");
        return std::unexpected(extracted.error());
    }

    inspection_report report;
    report.found = *extracted;
    report.has_isa_tag = header.starts_with(X12_ISA_TAG);
    report.delimiters_valid = report.found.are_valid();
    report.header_size = header.size();

    if (options_.require_isa_tag && !report.has_isa_tag) {
        logger->warning("ISA header rejected: " +
                       std::string(to_string(x12_error::missing_isa_tag)));
        return std::unexpected(x12_error::missing_isa_tag);
    }

    if (options_.require_valid_delimiters && !report.delimiters_valid) {
        logger->warning("ISA header rejected: " +
                       std::string(to_string(x12_error::ambiguous_delimiters)) +
                       " (" + report.found.to_string() + ")");
        return std::unexpected(x12_error::ambiguous_delimiters);
    }

    logger->debug("Extracted delimiters " + report.found.to_string() +
                 (report.delimiters_valid ? "" : " [ambiguous]"));

    return report;
}

Result<std::string> isa_inspector::read_header(std::istream& input) const {
    if (!input) {
        return Result<std::string>::err(
            to_error_info(x12_error::io_error, "input stream is not readable"));
    }

    // Grow in chunks so a large read_limit is not allocated up front
    const auto limit = std::min<std::size_t>(
        options_.read_limit,
        static_cast<std::size_t>(std::numeric_limits<std::streamsize>::max()));

    std::string buffer;
    while (buffer.size() < limit && input) {
        const auto offset = buffer.size();
        const auto chunk = std::min(limit - offset, READ_CHUNK_SIZE);
        buffer.resize(offset + chunk);
        input.read(buffer.data() + offset, static_cast<std::streamsize>(chunk));
        buffer.resize(offset + static_cast<std::size_t>(input.gcount()));
    }

    if (input.bad()) {
        return Result<std::string>::err(
            to_error_info(x12_error::io_error, "stream error while reading header"));
    }

    integration::get_logger()->trace("Read " + std::to_string(buffer.size()) +
                                     " header bytes");
    return buffer;
}

Result<std::string> isa_inspector::read_header(
    const std::filesystem::path& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Result<std::string>::err(
            to_error_info(x12_error::io_error, "cannot open " + path.string()));
    }

    return read_header(file);
}

}  // namespace edi::x12
