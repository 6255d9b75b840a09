/**
 * @file x12_document.cpp
 * @brief X12 document model and serializer implementation
 */

#include "edi/x12/protocol/x12/x12_document.h"

namespace edi::x12 {

namespace {

/**
 * @brief Append one terminated segment built from a tag and its elements
 */
template <typename Elements>
void append_segment(std::string& out, std::string_view tag,
                    const Elements& elements,
                    const x12_delimiters& delimiters) {
    out += tag;
    for (const auto& element : elements) {
        out += delimiters.element_separator;
        out += element;
    }
    out += delimiters.segment_terminator;
}

void append_trailer(std::string& out, std::string_view tag, std::size_t count,
                    std::string_view control_number,
                    const x12_delimiters& delimiters) {
    out += tag;
    out += delimiters.element_separator;
    out += std::to_string(count);
    out += delimiters.element_separator;
    out += control_number;
    out += delimiters.segment_terminator;
}

}  // namespace

std::string pad_right(std::string_view value, std::size_t width) {
    std::string result(value);
    if (result.size() < width) {
        result.append(width - result.size(), ' ');
    }
    return result;
}

// =============================================================================
// generic_segment Implementation
// =============================================================================

std::string_view generic_segment::element(std::size_t index) const noexcept {
    if (index == 0 || index > elements.size()) {
        return {};
    }
    return elements[index - 1];
}

std::string generic_segment::to_x12_string(
    const x12_delimiters& delimiters) const {
    std::string out;
    append_segment(out, tag, elements, delimiters);
    return out;
}

// =============================================================================
// transaction Implementation
// =============================================================================

std::string transaction::to_x12_string(const x12_delimiters& delimiters) const {
    std::string out;

    std::vector<std::string_view> header = {transaction_code,
                                            transaction_set_control_number};
    if (implementation_convention_reference.has_value()) {
        header.push_back(*implementation_convention_reference);
    }
    append_segment(out, tags::ST, header, delimiters);

    for (const auto& segment : segments) {
        append_segment(out, segment.tag, segment.elements, delimiters);
    }

    append_trailer(out, tags::SE, declared_segment_count(),
                   transaction_set_control_number, delimiters);
    return out;
}

// =============================================================================
// functional_group Implementation
// =============================================================================

std::string functional_group::to_x12_string(
    const x12_delimiters& delimiters) const {
    std::string out;

    const std::string_view header[] = {
        functional_identifier_code, application_sender_code,
        application_receiver_code,  date,
        time,                       group_control_number,
        responsible_agency_code,    version};
    append_segment(out, tags::GS, header, delimiters);

    for (const auto& txn : transactions) {
        out += txn.to_x12_string(delimiters);
    }

    append_trailer(out, tags::GE, transactions.size(), group_control_number,
                   delimiters);
    return out;
}

// =============================================================================
// interchange Implementation
// =============================================================================

std::string interchange::to_x12_string(const x12_delimiters& delimiters) const {
    std::string out;

    const std::string_view fields[] = {
        authorization_qualifier, authorization_information,
        security_qualifier,      security_information,
        sender_qualifier,        sender_id,
        receiver_qualifier,      receiver_id,
        date,                    time,
        standards_id,            version,
        interchange_control_number, acknowledgment_requested,
        test_indicator};

    std::vector<std::string> header;
    header.reserve(X12_ISA_ELEMENT_COUNT - 1);
    for (std::size_t i = 0; i < X12_ISA_FIELD_WIDTHS.size(); ++i) {
        header.push_back(pad_right(fields[i], X12_ISA_FIELD_WIDTHS[i]));
    }
    header.emplace_back(1, delimiters.subelement_separator);
    append_segment(out, tags::ISA, header, delimiters);

    for (const auto& group : functional_groups) {
        out += group.to_x12_string(delimiters);
    }

    append_trailer(out, tags::IEA, functional_groups.size(),
                   interchange_control_number, delimiters);
    return out;
}

// =============================================================================
// x12_document Implementation
// =============================================================================

std::string x12_document::to_x12_string() const {
    std::string out;
    for (const auto& isa : interchanges) {
        out += isa.to_x12_string(delimiters);
    }
    return out;
}

std::size_t x12_document::transaction_count() const noexcept {
    std::size_t count = 0;
    for (const auto& isa : interchanges) {
        for (const auto& group : isa.functional_groups) {
            count += group.transactions.size();
        }
    }
    return count;
}

std::string to_x12_string(const x12_document& document) {
    return document.to_x12_string();
}

}  // namespace edi::x12
