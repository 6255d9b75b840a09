/**
 * @file x12_envelope_validator.cpp
 * @brief Envelope trailer validation implementation
 */

#include "edi/x12/protocol/x12/x12_envelope_validator.h"

#include <charconv>
#include <string>

namespace edi::x12 {

namespace {

std::vector<std::string> to_strings(const segment_tokens& tokens) {
    return {tokens.begin(), tokens.end()};
}

/**
 * @brief Check one trailer's count and control number
 *
 * @param level Envelope level the trailer closes
 * @param trailer Trailer tokens, tag first
 * @param expected_count Count derived from the parsed children
 * @param expected_control Control number recorded from the opener
 */
std::expected<void, parse_error> check_trailer(
    envelope_level level, const segment_tokens& trailer,
    std::size_t expected_count, std::string_view expected_control) {
    std::string_view tag = trailer.empty() ? std::string_view{} : trailer[0];

    if (trailer.size() < X12_TRAILER_MIN_ELEMENTS) {
        return std::unexpected(parse_error{
            .code = x12_error::malformed_segment,
            .reason = std::string(tag) + " segment has " +
                      std::to_string(trailer.size()) + " elements; at least " +
                      std::to_string(X12_TRAILER_MIN_ELEMENTS) + " required",
            .segment = to_strings(trailer),
            .segment_index = std::nullopt,
            .mismatch = std::nullopt});
    }

    auto declared_count = trim(trailer[1]);
    auto declared_control = trim(trailer[2]);

    std::size_t count = 0;
    auto [ptr, ec] = std::from_chars(
        declared_count.data(), declared_count.data() + declared_count.size(),
        count);
    if (declared_count.empty() || ec != std::errc{} ||
        ptr != declared_count.data() + declared_count.size()) {
        return std::unexpected(parse_error{
            .code = x12_error::malformed_segment,
            .reason = std::string(tag) + " count '" +
                      std::string(declared_count) + "' is not a number",
            .segment = to_strings(trailer),
            .segment_index = std::nullopt,
            .mismatch = std::nullopt});
    }

    if (count != expected_count) {
        return std::unexpected(parse_error{
            .code = x12_error::envelope_mismatch,
            .reason = std::string(to_string(level)) +
                      " validation failed: incorrect count",
            .segment = to_strings(trailer),
            .segment_index = std::nullopt,
            .mismatch = envelope_mismatch{
                .level = level,
                .kind = envelope_mismatch_kind::count,
                .expected = std::to_string(expected_count),
                .actual = std::string(declared_count)}});
    }

    if (declared_control != expected_control) {
        return std::unexpected(parse_error{
            .code = x12_error::envelope_mismatch,
            .reason = std::string(to_string(level)) +
                      " validation failed: mismatched control number",
            .segment = to_strings(trailer),
            .segment_index = std::nullopt,
            .mismatch = envelope_mismatch{
                .level = level,
                .kind = envelope_mismatch_kind::control_number,
                .expected = std::string(expected_control),
                .actual = std::string(declared_control)}});
    }

    return {};
}

}  // namespace

std::expected<void, parse_error> envelope_validator::validate_interchange(
    const interchange& isa, const segment_tokens& trailer) {
    return check_trailer(envelope_level::interchange, trailer,
                         isa.functional_groups.size(),
                         isa.interchange_control_number);
}

std::expected<void, parse_error> envelope_validator::validate_functional_group(
    const functional_group& group, const segment_tokens& trailer) {
    return check_trailer(envelope_level::functional_group, trailer,
                         group.transactions.size(), group.group_control_number);
}

std::expected<void, parse_error> envelope_validator::validate_transaction(
    const transaction& txn, const segment_tokens& trailer) {
    // SE01 counts the ST and SE segments as well
    return check_trailer(envelope_level::transaction, trailer,
                         txn.declared_segment_count(),
                         txn.transaction_set_control_number);
}

}  // namespace edi::x12
