#ifndef EDI_X12_PROTOCOL_X12_X12_PARSER_H
#define EDI_X12_PROTOCOL_X12_X12_PARSER_H

/**
 * @file x12_parser.h
 * @brief ANSI X12 document parser
 *
 * Converts raw X12 text into an x12_document tree:
 *   - Delimiters are discovered from the ISA header
 *   - Segments are routed by tag into interchange / group / transaction
 *   - IEA, GE and SE trailers are cross-checked against their openers
 *
 * The parser can operate in strict or loose mode:
 *   - Strict: trailer counts and control numbers must match
 *   - Loose: trailers are consumed without those checks
 *
 * Ordering, element-count and unclosed-envelope errors are reported in
 * both modes.
 */

#include "x12_document.h"
#include "x12_tokenizer.h"
#include "x12_types.h"

#include "edi/x12/config/transaction_catalog.h"

#include <cstdint>
#include <expected>
#include <memory>
#include <string_view>

namespace edi::x12 {

// =============================================================================
// Parser Options
// =============================================================================

/**
 * @brief Parser configuration options
 */
struct parser_options {
    /** Cross-check IEA/GE/SE trailers (strict mode) */
    bool strict_envelope_validation = true;
};

// =============================================================================
// Parser Result Details
// =============================================================================

/**
 * @brief Detailed information about a parse
 */
struct parse_details {
    /** Number of segments consumed, envelopes included */
    size_t segment_count = 0;

    size_t interchange_count = 0;
    size_t functional_group_count = 0;
    size_t transaction_count = 0;

    /** Trailers consumed without cross-checks (loose mode) */
    size_t unchecked_trailers = 0;

    /** Parse time in microseconds */
    int64_t parse_time_us = 0;

    /** Original document size in bytes */
    size_t original_size = 0;
};

// =============================================================================
// X12 Parser
// =============================================================================

/**
 * @brief ANSI X12 document parser
 *
 * A parser holds only its options and a shared, read-only transaction
 * catalog, so one instance can serve concurrent parse calls.
 *
 * @example Basic Parsing
 * ```cpp
 * x12_parser parser;
 * auto result = parser.parse(raw);
 *
 * if (result) {
 *     for (const auto& isa : result->interchanges) { ... }
 * } else {
 *     std::cerr << result.error().to_string() << std::endl;
 * }
 * ```
 *
 * @example Loose Mode With Custom Catalog
 * ```cpp
 * auto catalog = std::make_shared<const config::transaction_catalog>(
 *     *config::transaction_catalog::load_csv("schemas.csv"));
 *
 * x12_parser parser(catalog, parser_options{.strict_envelope_validation = false});
 * auto result = parser.parse(raw);
 * ```
 */
class x12_parser {
public:
    /**
     * @brief Strict parser using the standard transaction catalog
     */
    x12_parser();

    /**
     * @brief Parser with custom options and the standard catalog
     */
    explicit x12_parser(const parser_options& options);

    /**
     * @brief Parser with an injected catalog
     * @param catalog Transaction name lookup; null resolves every code
     *                to "unidentified"
     * @param options Parser configuration
     */
    explicit x12_parser(
        std::shared_ptr<const config::transaction_catalog> catalog,
        const parser_options& options = {});

    ~x12_parser();

    // Non-copyable, movable
    x12_parser(const x12_parser&) = delete;
    x12_parser& operator=(const x12_parser&) = delete;
    x12_parser(x12_parser&&) noexcept;
    x12_parser& operator=(x12_parser&&) noexcept;

    /**
     * @brief Parse an X12 document
     *
     * @param data Raw X12 text
     * @param details Optional pointer to receive parse details
     * @return Parsed document or error
     */
    [[nodiscard]] std::expected<x12_document, parse_error> parse(
        std::string_view data, parse_details* details = nullptr) const;

    /**
     * @brief Assemble already tokenized segments
     *
     * @param segments Tokenizer output
     * @param details Optional pointer to receive parse details
     * @return Document without delimiters set, or error
     */
    [[nodiscard]] std::expected<x12_document, parse_error> assemble(
        const std::vector<segment_tokens>& segments,
        parse_details* details = nullptr) const;

    /**
     * @brief Get current parser options
     */
    [[nodiscard]] const parser_options& options() const noexcept;

    /**
     * @brief Get the transaction catalog in use
     */
    [[nodiscard]] const std::shared_ptr<const config::transaction_catalog>&
    catalog() const noexcept;

private:
    class impl;
    std::unique_ptr<impl> pimpl_;
};

// =============================================================================
// Convenience Entry Points
// =============================================================================

/**
 * @brief Shared, immutable catalog of the standard transaction sets
 */
[[nodiscard]] std::shared_ptr<const config::transaction_catalog>
standard_catalog();

/**
 * @brief Parse with full envelope validation
 */
[[nodiscard]] std::expected<x12_document, parse_error> parse(
    std::string_view data);

/**
 * @brief Parse with full envelope validation and a custom catalog
 */
[[nodiscard]] std::expected<x12_document, parse_error> parse(
    std::string_view data,
    std::shared_ptr<const config::transaction_catalog> catalog);

/**
 * @brief Parse without trailer count / control number checks
 */
[[nodiscard]] std::expected<x12_document, parse_error> loose_parse(
    std::string_view data);

/**
 * @brief Parse without trailer checks, with a custom catalog
 */
[[nodiscard]] std::expected<x12_document, parse_error> loose_parse(
    std::string_view data,
    std::shared_ptr<const config::transaction_catalog> catalog);

}  // namespace edi::x12

#endif  // EDI_X12_PROTOCOL_X12_X12_PARSER_H
