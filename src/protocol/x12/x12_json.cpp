/**
 * @file x12_json.cpp
 * @brief JSON conversions for X12 document trees
 */

#include "edi/x12/protocol/x12/x12_json.h"

#include <string>
#include <stdexcept>

namespace edi::x12 {

namespace {

nlohmann::json delimiter_value(char c) {
    return std::string(1, c);
}

char delimiter_from(const nlohmann::json& json, const char* key) {
    auto value = json.at(key).get<std::string>();
    if (value.size() != 1) {
        throw std::invalid_argument("delimiter '" + std::string(key) +
                                    "' must be a single character, got \"" +
                                    value + "\"");
    }
    return value.front();
}

parse_error json_error(std::string reason) {
    return parse_error{.code = x12_error::malformed_segment,
                       .reason = std::move(reason),
                       .segment = {},
                       .segment_index = std::nullopt,
                       .mismatch = std::nullopt};
}

}  // namespace

// =============================================================================
// Delimiters
// =============================================================================

void to_json(nlohmann::json& json, const x12_delimiters& delimiters) {
    json = nlohmann::json{
        {"element_separator", delimiter_value(delimiters.element_separator)},
        {"subelement_separator",
         delimiter_value(delimiters.subelement_separator)},
        {"segment_terminator", delimiter_value(delimiters.segment_terminator)},
    };
}

void from_json(const nlohmann::json& json, x12_delimiters& delimiters) {
    delimiters.element_separator = delimiter_from(json, "element_separator");
    delimiters.subelement_separator =
        delimiter_from(json, "subelement_separator");
    delimiters.segment_terminator = delimiter_from(json, "segment_terminator");
}

// =============================================================================
// Segments and Envelopes
// =============================================================================

void to_json(nlohmann::json& json, const generic_segment& segment) {
    json = nlohmann::json{{"tag", segment.tag}, {"elements", segment.elements}};
}

void from_json(const nlohmann::json& json, generic_segment& segment) {
    json.at("tag").get_to(segment.tag);
    json.at("elements").get_to(segment.elements);
}

void to_json(nlohmann::json& json, const transaction& txn) {
    json = nlohmann::json{
        {"transaction_code", txn.transaction_code},
        {"transaction_name", txn.transaction_name},
        {"transaction_set_control_number", txn.transaction_set_control_number},
        {"segments", txn.segments},
    };
    if (txn.implementation_convention_reference) {
        json["implementation_convention_reference"] =
            *txn.implementation_convention_reference;
    } else {
        json["implementation_convention_reference"] = nullptr;
    }
}

void from_json(const nlohmann::json& json, transaction& txn) {
    json.at("transaction_code").get_to(txn.transaction_code);
    txn.transaction_name = json.value(
        "transaction_name", std::string(X12_UNIDENTIFIED_TRANSACTION));
    json.at("transaction_set_control_number")
        .get_to(txn.transaction_set_control_number);

    auto ref = json.find("implementation_convention_reference");
    if (ref != json.end() && !ref->is_null()) {
        txn.implementation_convention_reference = ref->get<std::string>();
    } else {
        txn.implementation_convention_reference.reset();
    }

    json.at("segments").get_to(txn.segments);
}

void to_json(nlohmann::json& json, const functional_group& group) {
    json = nlohmann::json{
        {"functional_identifier_code", group.functional_identifier_code},
        {"application_sender_code", group.application_sender_code},
        {"application_receiver_code", group.application_receiver_code},
        {"date", group.date},
        {"time", group.time},
        {"group_control_number", group.group_control_number},
        {"responsible_agency_code", group.responsible_agency_code},
        {"version", group.version},
        {"transactions", group.transactions},
    };
}

void from_json(const nlohmann::json& json, functional_group& group) {
    json.at("functional_identifier_code")
        .get_to(group.functional_identifier_code);
    json.at("application_sender_code").get_to(group.application_sender_code);
    json.at("application_receiver_code")
        .get_to(group.application_receiver_code);
    json.at("date").get_to(group.date);
    json.at("time").get_to(group.time);
    json.at("group_control_number").get_to(group.group_control_number);
    json.at("responsible_agency_code").get_to(group.responsible_agency_code);
    json.at("version").get_to(group.version);
    json.at("transactions").get_to(group.transactions);
}

void to_json(nlohmann::json& json, const interchange& isa) {
    json = nlohmann::json{
        {"authorization_qualifier", isa.authorization_qualifier},
        {"authorization_information", isa.authorization_information},
        {"security_qualifier", isa.security_qualifier},
        {"security_information", isa.security_information},
        {"sender_qualifier", isa.sender_qualifier},
        {"sender_id", isa.sender_id},
        {"receiver_qualifier", isa.receiver_qualifier},
        {"receiver_id", isa.receiver_id},
        {"date", isa.date},
        {"time", isa.time},
        {"standards_id", isa.standards_id},
        {"version", isa.version},
        {"interchange_control_number", isa.interchange_control_number},
        {"acknowledgment_requested", isa.acknowledgment_requested},
        {"test_indicator", isa.test_indicator},
        {"functional_groups", isa.functional_groups},
    };
}

void from_json(const nlohmann::json& json, interchange& isa) {
    json.at("authorization_qualifier").get_to(isa.authorization_qualifier);
    json.at("authorization_information").get_to(isa.authorization_information);
    json.at("security_qualifier").get_to(isa.security_qualifier);
    json.at("security_information").get_to(isa.security_information);
    json.at("sender_qualifier").get_to(isa.sender_qualifier);
    json.at("sender_id").get_to(isa.sender_id);
    json.at("receiver_qualifier").get_to(isa.receiver_qualifier);
    json.at("receiver_id").get_to(isa.receiver_id);
    json.at("date").get_to(isa.date);
    json.at("time").get_to(isa.time);
    json.at("standards_id").get_to(isa.standards_id);
    json.at("version").get_to(isa.version);
    json.at("interchange_control_number")
        .get_to(isa.interchange_control_number);
    json.at("acknowledgment_requested").get_to(isa.acknowledgment_requested);
    json.at("test_indicator").get_to(isa.test_indicator);
    json.at("functional_groups").get_to(isa.functional_groups);
}

void to_json(nlohmann::json& json, const x12_document& document) {
    json = nlohmann::json{
        {"delimiters", document.delimiters},
        {"interchanges", document.interchanges},
    };
}

void from_json(const nlohmann::json& json, x12_document& document) {
    json.at("delimiters").get_to(document.delimiters);
    json.at("interchanges").get_to(document.interchanges);
}

// =============================================================================
// Document Export / Import
// =============================================================================

nlohmann::json to_json(const x12_document& document) {
    nlohmann::json json;
    to_json(json, document);
    return json;
}

std::expected<x12_document, parse_error> document_from_json(
    const nlohmann::json& json) {
    if (!json.is_object()) {
        return std::unexpected(
            json_error("X12 document JSON must be an object"));
    }

    x12_document document;
    try {
        from_json(json, document);
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(
            json_error(std::string("invalid X12 document JSON: ") + e.what()));
    } catch (const std::invalid_argument& e) {
        return std::unexpected(
            json_error(std::string("invalid X12 document JSON: ") + e.what()));
    }

    const auto& d = document.delimiters;
    if (!d.is_distinct()) {
        return std::unexpected(parse_error{
            .code = x12_error::delimiter_collision,
            .reason = std::string("delimiters must be distinct: element '") +
                      d.element_separator + "', subelement '" +
                      d.subelement_separator + "', segment '" +
                      d.segment_terminator + "'",
            .segment = {},
            .segment_index = std::nullopt,
            .mismatch = std::nullopt});
    }

    return document;
}

std::expected<x12_document, parse_error> document_from_json_string(
    std::string_view text) {
    auto json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded()) {
        return std::unexpected(json_error("input is not valid JSON"));
    }
    return document_from_json(json);
}

}  // namespace edi::x12
