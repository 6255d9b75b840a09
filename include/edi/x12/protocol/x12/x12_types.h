#ifndef EDI_X12_PROTOCOL_X12_X12_TYPES_H
#define EDI_X12_PROTOCOL_X12_X12_TYPES_H

/**
 * @file x12_types.h
 * @brief ANSI X12 protocol type definitions, constants and error codes
 *
 * Defines the fundamental types shared by the X12 tokenizer, parser,
 * envelope validator and serializer.
 *
 * X12 Document Structure:
 *   - Interchange:      ISA ... IEA
 *   - Functional group: GS ... GE
 *   - Transaction set:  ST ... SE
 *   - Segments:         tag followed by elements, ended by the terminator
 *
 * The three delimiters are not fixed by the standard. They are declared by
 * the sender inside the fixed-width ISA segment.
 */

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace edi::x12 {

// =============================================================================
// X12 Protocol Constants
// =============================================================================

/** Conventional element separator */
constexpr char X12_ELEMENT_SEPARATOR = '*';

/** Conventional sub-element (component) separator */
constexpr char X12_SUBELEMENT_SEPARATOR = '>';

/** Conventional segment terminator */
constexpr char X12_SEGMENT_TERMINATOR = '~';

/** Offset of the element separator inside the ISA segment */
constexpr std::size_t X12_ISA_DELIMITER_OFFSET = 103;

/** Bytes required from the ISA start to reach all three delimiters */
constexpr std::size_t X12_MIN_HEADER_LENGTH = X12_ISA_DELIMITER_OFFSET + 3;

/** Number of elements in an ISA segment, including the tag */
constexpr std::size_t X12_ISA_ELEMENT_COUNT = 16;

/** Minimum number of elements in a GS segment, including the tag */
constexpr std::size_t X12_GS_MIN_ELEMENTS = 9;

/** Minimum number of elements in an ST segment, including the tag */
constexpr std::size_t X12_ST_MIN_ELEMENTS = 3;

/** Minimum number of elements in an IEA/GE/SE trailer, including the tag */
constexpr std::size_t X12_TRAILER_MIN_ELEMENTS = 3;

/** Mandated widths of ISA01 through ISA15 */
constexpr std::array<std::size_t, 15> X12_ISA_FIELD_WIDTHS = {
    2, 10, 2, 10, 2, 15, 2, 15, 6, 4, 1, 5, 9, 1, 1};

/** Transaction name reported when the catalog has no entry */
constexpr std::string_view X12_UNIDENTIFIED_TRANSACTION = "unidentified";

/** Envelope segment tags */
namespace tags {
constexpr std::string_view ISA = "ISA";
constexpr std::string_view IEA = "IEA";
constexpr std::string_view GS = "GS";
constexpr std::string_view GE = "GE";
constexpr std::string_view ST = "ST";
constexpr std::string_view SE = "SE";
}  // namespace tags

// =============================================================================
// X12 Delimiters
// =============================================================================

/**
 * @brief The three format-defining characters of an X12 document
 */
struct x12_delimiters {
    char element_separator = X12_ELEMENT_SEPARATOR;
    char subelement_separator = X12_SUBELEMENT_SEPARATOR;
    char segment_terminator = X12_SEGMENT_TERMINATOR;

    /**
     * @brief Check that no two delimiters share a character
     *
     * Tokenization is only reversible when all three are distinct.
     */
    [[nodiscard]] constexpr bool is_distinct() const noexcept {
        return element_separator != subelement_separator &&
               element_separator != segment_terminator &&
               subelement_separator != segment_terminator;
    }

    [[nodiscard]] bool operator==(const x12_delimiters&) const = default;
};

// =============================================================================
// Error Codes (-1000 to -1009)
// =============================================================================

/**
 * @brief X12 specific error codes
 *
 * Allocated range: -1000 to -1009
 */
enum class x12_error : int {
    /** Document shorter than the minimum header length, or envelope left open */
    truncated_input = -1000,

    /** Two or more delimiters are the same character */
    delimiter_collision = -1001,

    /** Segment has fewer than its minimum required elements */
    malformed_segment = -1002,

    /** Segment implies a nesting level that is not open */
    out_of_order_segment = -1003,

    /** Trailer count or control number disagrees with its opener */
    envelope_mismatch = -1004
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
        case x12_error::truncated_input:
            return "Input is truncated";
        case x12_error::delimiter_collision:
            return "Delimiters are not distinct";
        case x12_error::malformed_segment:
            return "Segment is missing required elements";
        case x12_error::out_of_order_segment:
            return "Segment appears outside its enclosing envelope";
        case x12_error::envelope_mismatch:
            return "Envelope trailer does not match its header";
        default:
            return "Unknown X12 error";
    }
}

// =============================================================================
// Envelope Mismatch Details
// =============================================================================

/**
 * @brief Envelope nesting level a trailer belongs to
 */
enum class envelope_level {
    interchange,
    functional_group,
    transaction
};

/**
 * @brief Which redundant trailer value disagreed
 */
enum class envelope_mismatch_kind {
    /** Declared child count differs from what was parsed */
    count,

    /** Declared control number differs from the opener's */
    control_number
};

[[nodiscard]] constexpr const char* to_string(envelope_level level) noexcept {
    switch (level) {
        case envelope_level::interchange:
            return "interchange";
        case envelope_level::functional_group:
            return "functional group";
        case envelope_level::transaction:
            return "transaction";
        default:
            return "unknown";
    }
}

[[nodiscard]] constexpr const char* to_string(
    envelope_mismatch_kind kind) noexcept {
    switch (kind) {
        case envelope_mismatch_kind::count:
            return "count";
        case envelope_mismatch_kind::control_number:
            return "control number";
        default:
            return "unknown";
    }
}

/**
 * @brief Expected vs. actual values of a failed envelope check
 */
struct envelope_mismatch {
    envelope_level level = envelope_level::transaction;
    envelope_mismatch_kind kind = envelope_mismatch_kind::count;

    /** Value derived from the parsed opener and its children */
    std::string expected;

    /** Value declared by the trailer */
    std::string actual;

    [[nodiscard]] bool operator==(const envelope_mismatch&) const = default;
};

// =============================================================================
// Parse Error
// =============================================================================

/**
 * @brief Detailed parse failure
 *
 * Identifies the offending segment by its raw tokens and its position in
 * the token stream.
 */
struct parse_error {
    x12_error code = x12_error::malformed_segment;

    /** Human-readable reason */
    std::string reason;

    /** Raw tokens of the offending segment (empty when not segment-specific) */
    std::vector<std::string> segment;

    /** 0-based position of the offending segment in the token stream */
    std::optional<std::size_t> segment_index;

    /** Present for envelope_mismatch errors */
    std::optional<envelope_mismatch> mismatch;

    /**
     * @brief Format the error for logs and diagnostics
     *
     * Example: "Envelope trailer does not match its header: transaction
     * segment count mismatch -- expected: 3 received: 99 [SE*99*0001]"
     */
    [[nodiscard]] std::string to_string() const;
};

}  // namespace edi::x12

#endif  // EDI_X12_PROTOCOL_X12_X12_TYPES_H
