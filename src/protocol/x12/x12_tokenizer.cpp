/**
 * @file x12_tokenizer.cpp
 * @brief X12 tokenizer implementation
 */

#include "edi/x12/protocol/x12/x12_tokenizer.h"

#include <cctype>
#include <sstream>

namespace edi::x12 {

namespace {

bool is_space(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

parse_error collision_error(const x12_delimiters& delimiters) {
    std::ostringstream reason;
    reason << "element '" << delimiters.element_separator
           << "', sub-element '" << delimiters.subelement_separator
           << "' and segment '" << delimiters.segment_terminator
           << "' delimiters must be distinct";

    return parse_error{
        .code = x12_error::delimiter_collision,
        .reason = reason.str(),
        .segment = {},
        .segment_index = std::nullopt,
        .mismatch = std::nullopt};
}

}  // namespace

std::size_t find_header_start(std::string_view data) noexcept {
    std::size_t pos = 0;
    while (pos < data.size() && is_space(data[pos])) {
        ++pos;
    }
    return pos;
}

std::string_view trim(std::string_view value) noexcept {
    while (!value.empty() && is_space(value.front())) {
        value.remove_prefix(1);
    }
    while (!value.empty() && is_space(value.back())) {
        value.remove_suffix(1);
    }
    return value;
}

std::expected<x12_delimiters, parse_error> extract_delimiters(
    std::string_view data) {
    if (data.size() < X12_MIN_HEADER_LENGTH) {
        return std::unexpected(parse_error{
            .code = x12_error::truncated_input,
            .reason = "document is " + std::to_string(data.size()) +
                      " bytes; the interchange header needs at least " +
                      std::to_string(X12_MIN_HEADER_LENGTH),
            .segment = {},
            .segment_index = std::nullopt,
            .mismatch = std::nullopt});
    }

    x12_delimiters delimiters;
    delimiters.element_separator = data[X12_ISA_DELIMITER_OFFSET];
    delimiters.subelement_separator = data[X12_ISA_DELIMITER_OFFSET + 1];
    delimiters.segment_terminator = data[X12_ISA_DELIMITER_OFFSET + 2];

    if (!delimiters.is_distinct()) {
        return std::unexpected(collision_error(delimiters));
    }

    return delimiters;
}

segment_tokens split_elements(std::string_view segment,
                              char element_separator) {
    segment_tokens elements;
    std::size_t start = 0;

    while (true) {
        std::size_t end = segment.find(element_separator, start);
        if (end == std::string_view::npos) {
            elements.push_back(segment.substr(start));
            break;
        }
        elements.push_back(segment.substr(start, end - start));
        start = end + 1;
    }

    return elements;
}

std::expected<std::vector<segment_tokens>, parse_error> tokenize(
    std::string_view data, const x12_delimiters& delimiters) {
    if (!delimiters.is_distinct()) {
        return std::unexpected(collision_error(delimiters));
    }

    std::vector<segment_tokens> segments;
    std::size_t start = 0;

    while (start <= data.size()) {
        std::size_t end = data.find(delimiters.segment_terminator, start);
        if (end == std::string_view::npos) {
            end = data.size();
        }

        auto candidate = trim(data.substr(start, end - start));
        if (!candidate.empty()) {
            segments.push_back(
                split_elements(candidate, delimiters.element_separator));
        }

        start = end + 1;
    }

    return segments;
}

std::expected<std::vector<segment_tokens>, parse_error> tokenize(
    std::string_view data) {
    auto header = data.substr(find_header_start(data));

    auto delimiters = extract_delimiters(header);
    if (!delimiters) {
        return std::unexpected(delimiters.error());
    }

    return tokenize(header, *delimiters);
}

}  // namespace edi::x12
