#ifndef EDI_X12_PROTOCOL_X12_X12_TOKENIZER_H
#define EDI_X12_PROTOCOL_X12_X12_TOKENIZER_H

/**
 * @file x12_tokenizer.h
 * @brief X12 delimiter discovery and segment tokenization
 *
 * Turns raw X12 text into an ordered list of segments, each an ordered
 * list of element views. The tokens view the caller's buffer, which must
 * outlive them.
 */

#include "x12_types.h"

#include <expected>
#include <string_view>
#include <vector>

namespace edi::x12 {

/**
 * @brief Elements of one segment; element 0 is the segment tag
 */
using segment_tokens = std::vector<std::string_view>;

/**
 * @brief Find where the ISA segment starts
 *
 * Leading whitespace is skipped; anything else is treated as the start of
 * the first segment.
 *
 * @param data Raw X12 text
 * @return Offset of the first non-whitespace character
 */
[[nodiscard]] std::size_t find_header_start(std::string_view data) noexcept;

/**
 * @brief Read the three delimiters from the ISA segment
 *
 * The element separator, sub-element separator and segment terminator
 * sit at bytes 103, 104 and 105 of the ISA segment.
 *
 * @param data Raw X12 text beginning with the ISA segment
 * @return Delimiters, or truncated_input / delimiter_collision
 */
[[nodiscard]] std::expected<x12_delimiters, parse_error> extract_delimiters(
    std::string_view data);

/**
 * @brief Split a document into segment tokens
 *
 * Whitespace around each segment is trimmed and empty segments are
 * dropped, which absorbs line breaks placed after the terminator.
 * Sub-element separators are left inside their elements.
 *
 * @param data Raw X12 text
 * @param delimiters Delimiters to split with
 * @return Segment tokens or delimiter_collision
 */
[[nodiscard]] std::expected<std::vector<segment_tokens>, parse_error> tokenize(
    std::string_view data, const x12_delimiters& delimiters);

/**
 * @brief Extract the delimiters, then split the document
 */
[[nodiscard]] std::expected<std::vector<segment_tokens>, parse_error> tokenize(
    std::string_view data);

/**
 * @brief Split one segment on the element separator
 */
[[nodiscard]] segment_tokens split_elements(std::string_view segment,
                                            char element_separator);

/**
 * @brief Strip leading and trailing whitespace
 */
[[nodiscard]] std::string_view trim(std::string_view value) noexcept;

}  // namespace edi::x12

#endif  // EDI_X12_PROTOCOL_X12_X12_TOKENIZER_H
