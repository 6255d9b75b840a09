#ifndef EDI_X12_PROTOCOL_X12_X12_DOCUMENT_H
#define EDI_X12_PROTOCOL_X12_X12_DOCUMENT_H

/**
 * @file x12_document.h
 * @brief X12 document data model and serialization
 *
 * The tree has four levels:
 *   x12_document -> interchange -> functional_group -> transaction
 *   -> generic_segment
 *
 * Each level owns the next by value. The tree is produced by the parser,
 * or assembled directly by callers that want to emit X12.
 *
 * Serialization never echoes stored trailer values; IEA, GE and SE counts
 * and control numbers are recomputed from the live tree.
 */

#include "x12_types.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace edi::x12 {

// =============================================================================
// Generic Segment
// =============================================================================

/**
 * @brief Any segment other than the six envelope segments
 *
 * Elements are kept as whole strings; sub-element separators are not
 * split.
 */
struct generic_segment {
    /** Segment tag, e.g. "BGN" */
    std::string tag;

    /** Elements following the tag */
    std::vector<std::string> elements;

    /**
     * @brief Get element by index (1-based per X12 convention)
     * @return Element value or empty view if out of range
     */
    [[nodiscard]] std::string_view element(std::size_t index) const noexcept;

    /**
     * @brief Serialize to a terminated X12 segment
     */
    [[nodiscard]] std::string to_x12_string(
        const x12_delimiters& delimiters) const;

    [[nodiscard]] bool operator==(const generic_segment&) const = default;
};

// =============================================================================
// Transaction Set (ST/SE)
// =============================================================================

/**
 * @brief One business document, e.g. one purchase order
 */
struct transaction {
    /** ST01: transaction set identifier code, e.g. "850" */
    std::string transaction_code;

    /** Human-readable name of transaction_code */
    std::string transaction_name{X12_UNIDENTIFIED_TRANSACTION};

    /** ST02: transaction set control number */
    std::string transaction_set_control_number;

    /** ST03: implementation convention reference */
    std::optional<std::string> implementation_convention_reference;

    std::vector<generic_segment> segments;

    /**
     * @brief Segment count the SE trailer must declare
     *
     * Includes the ST and SE segments themselves.
     */
    [[nodiscard]] std::size_t declared_segment_count() const noexcept {
        return segments.size() + 2;
    }

    /**
     * @brief Serialize ST, the body segments and a computed SE
     */
    [[nodiscard]] std::string to_x12_string(
        const x12_delimiters& delimiters) const;

    [[nodiscard]] bool operator==(const transaction&) const = default;
};

// =============================================================================
// Functional Group (GS/GE)
// =============================================================================

/**
 * @brief Transactions of a related business-document type sent together
 */
struct functional_group {
    /** GS01: functional identifier code, e.g. "PO" */
    std::string functional_identifier_code;

    /** GS02 */
    std::string application_sender_code;

    /** GS03 */
    std::string application_receiver_code;

    /** GS04: CCYYMMDD */
    std::string date;

    /** GS05: HHMM[SS[D[D]]] */
    std::string time;

    /** GS06: must match GE02 */
    std::string group_control_number;

    /** GS07: "X" for ASC X12, "T" for TDCC */
    std::string responsible_agency_code;

    /** GS08: version / release / industry identifier */
    std::string version;

    std::vector<transaction> transactions;

    /**
     * @brief Serialize GS, the transactions and a computed GE
     */
    [[nodiscard]] std::string to_x12_string(
        const x12_delimiters& delimiters) const;

    [[nodiscard]] bool operator==(const functional_group&) const = default;
};

// =============================================================================
// Interchange (ISA/IEA)
// =============================================================================

/**
 * @brief Outermost envelope identifying sender and receiver
 *
 * Field values are stored without the fixed-width padding of the ISA
 * segment; serialization pads them back.
 */
struct interchange {
    /** ISA01 */
    std::string authorization_qualifier;

    /** ISA02 */
    std::string authorization_information;

    /** ISA03 */
    std::string security_qualifier;

    /** ISA04 */
    std::string security_information;

    /** ISA05 */
    std::string sender_qualifier;

    /** ISA06 */
    std::string sender_id;

    /** ISA07 */
    std::string receiver_qualifier;

    /** ISA08 */
    std::string receiver_id;

    /** ISA09: YYMMDD */
    std::string date;

    /** ISA10: HHMM */
    std::string time;

    /** ISA11: standards identifier (repetition separator from 00402 on) */
    std::string standards_id;

    /** ISA12: interchange control version number */
    std::string version;

    /** ISA13: must match IEA02 */
    std::string interchange_control_number;

    /** ISA14: "0" or "1" */
    std::string acknowledgment_requested;

    /** ISA15: "T" test, "P" production, "I" information */
    std::string test_indicator;

    std::vector<functional_group> functional_groups;

    /**
     * @brief Serialize ISA, the groups and a computed IEA
     *
     * ISA16 is always the sub-element separator of @p delimiters.
     */
    [[nodiscard]] std::string to_x12_string(
        const x12_delimiters& delimiters) const;

    [[nodiscard]] bool operator==(const interchange&) const = default;
};

// =============================================================================
// X12 Document
// =============================================================================

/**
 * @brief A parsed X12 document
 */
struct x12_document {
    /** Delimiters used throughout the document */
    x12_delimiters delimiters;

    std::vector<interchange> interchanges;

    /**
     * @brief Serialize every interchange with this document's delimiters
     */
    [[nodiscard]] std::string to_x12_string() const;

    /**
     * @brief Total number of transactions across all interchanges
     */
    [[nodiscard]] std::size_t transaction_count() const noexcept;

    [[nodiscard]] bool operator==(const x12_document&) const = default;
};

/**
 * @brief Serialize a document with its own delimiters
 */
[[nodiscard]] std::string to_x12_string(const x12_document& document);

/**
 * @brief Right-pad a value with spaces to a fixed width
 *
 * Values already at or beyond the width are returned unchanged.
 */
[[nodiscard]] std::string pad_right(std::string_view value, std::size_t width);

}  // namespace edi::x12

#endif  // EDI_X12_PROTOCOL_X12_X12_DOCUMENT_H
