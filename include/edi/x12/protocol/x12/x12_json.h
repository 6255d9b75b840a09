#ifndef EDI_X12_PROTOCOL_X12_X12_JSON_H
#define EDI_X12_PROTOCOL_X12_X12_JSON_H

/**
 * @file x12_json.h
 * @brief JSON export and import of X12 document trees
 *
 * Every node converts to a JSON object keyed by its field names:
 *
 * ```json
 * {
 *   "delimiters": {"element_separator": "*",
 *                  "subelement_separator": ">",
 *                  "segment_terminator": "~"},
 *   "interchanges": [{"sender_id": "...", "functional_groups": [
 *     {"group_control_number": "...", "transactions": [
 *       {"transaction_code": "850", "transaction_name": "Purchase Order",
 *        "segments": [{"tag": "BEG", "elements": ["00", "SA"]}]}]}]}]
 * }
 * ```
 *
 * The per-node to_json / from_json overloads are found by nlohmann::json
 * through argument-dependent lookup, so `nlohmann::json j = document;` and
 * `j.get<interchange>()` both work. The from_json overloads throw
 * nlohmann::json exceptions; document_from_json() converts them to a
 * parse_error.
 */

#include "x12_document.h"
#include "x12_types.h"

#include <nlohmann/json.hpp>

#include <expected>
#include <string_view>

namespace edi::x12 {

// =============================================================================
// Node Conversions (ADL)
// =============================================================================

void to_json(nlohmann::json& json, const x12_delimiters& delimiters);
void from_json(const nlohmann::json& json, x12_delimiters& delimiters);

void to_json(nlohmann::json& json, const generic_segment& segment);
void from_json(const nlohmann::json& json, generic_segment& segment);

void to_json(nlohmann::json& json, const transaction& txn);
void from_json(const nlohmann::json& json, transaction& txn);

void to_json(nlohmann::json& json, const functional_group& group);
void from_json(const nlohmann::json& json, functional_group& group);

void to_json(nlohmann::json& json, const interchange& isa);
void from_json(const nlohmann::json& json, interchange& isa);

void to_json(nlohmann::json& json, const x12_document& document);
void from_json(const nlohmann::json& json, x12_document& document);

// =============================================================================
// Document Export / Import
// =============================================================================

/**
 * @brief Convert a document to a JSON value
 */
[[nodiscard]] nlohmann::json to_json(const x12_document& document);

/**
 * @brief Rebuild a document from a JSON value
 *
 * @return Document, or malformed_segment if the JSON does not describe a
 *         document tree, or delimiter_collision if its delimiters repeat
 */
[[nodiscard]] std::expected<x12_document, parse_error> document_from_json(
    const nlohmann::json& json);

/**
 * @brief Parse JSON text and rebuild a document from it
 */
[[nodiscard]] std::expected<x12_document, parse_error> document_from_json_string(
    std::string_view text);

}  // namespace edi::x12

#endif  // EDI_X12_PROTOCOL_X12_X12_JSON_H
