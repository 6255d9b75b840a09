/**
 * @file x12_parser.cpp
 * @brief X12 document parser implementation
 */

#include "edi/x12/protocol/x12/x12_parser.h"

#include "edi/x12/integration/logger_adapter.h"
#include "edi/x12/protocol/x12/x12_envelope_validator.h"

#include <cctype>
#include <chrono>
#include <sstream>

namespace edi::x12 {

namespace {

std::vector<std::string> to_strings(const segment_tokens& tokens) {
    return {tokens.begin(), tokens.end()};
}

parse_error segment_error(x12_error code, std::string reason,
                          const segment_tokens& tokens, std::size_t index) {
    return parse_error{.code = code,
                       .reason = std::move(reason),
                       .segment = to_strings(tokens),
                       .segment_index = index,
                       .mismatch = std::nullopt};
}

parse_error too_few_elements(const segment_tokens& tokens, std::size_t index,
                             std::size_t required) {
    std::ostringstream reason;
    reason << trim(tokens.front()) << " segment has " << tokens.size()
           << " elements; at least " << required << " required";
    return segment_error(x12_error::malformed_segment, reason.str(), tokens,
                         index);
}

std::string element_at(const segment_tokens& tokens, std::size_t index) {
    return std::string(trim(tokens[index]));
}

/**
 * @brief Tokens of the first segment when the document does not start with ISA
 *
 * Without an ISA there are no declared delimiters. The element separator is
 * the first character after the tag, and the segment ends at the default
 * terminator or at a line break.
 */
segment_tokens leading_segment(std::string_view data) {
    std::size_t tag_end = 0;
    while (tag_end < data.size() &&
           std::isalnum(static_cast<unsigned char>(data[tag_end]))) {
        ++tag_end;
    }
    if (tag_end == 0) {
        return {};
    }

    const char terminators[] = {x12_delimiters{}.segment_terminator, '\r',
                                '\n'};
    auto segment = data.substr(
        0, data.find_first_of(std::string_view(terminators, 3)));
    if (tag_end >= segment.size()) {
        return {segment.substr(0, tag_end)};
    }
    return split_elements(segment, segment[tag_end]);
}

// =============================================================================
// document_assembler
// =============================================================================

/**
 * @brief Folds segment tokens into an x12_document
 *
 * The open interchange, functional group and transaction are tracked as
 * indices into their parent's sequence. A trailer closes only its own level,
 * so every level nested inside it must already be closed. An opener must
 * not arrive while a sibling at its own level is still open.
 */
class document_assembler {
public:
    document_assembler(const config::transaction_catalog* catalog, bool strict,
                       integration::logger_adapter& logger)
        : catalog_(catalog), strict_(strict), logger_(logger) {}

    std::expected<void, parse_error> consume(const segment_tokens& tokens,
                                             std::size_t index) {
        auto tag = trim(tokens.front());

        if (tag == tags::ISA) {
            return open_interchange(tokens, index);
        }
        if (tag == tags::GS) {
            return open_functional_group(tokens, index);
        }
        if (tag == tags::ST) {
            return open_transaction(tokens, index);
        }
        if (tag == tags::IEA) {
            return close_interchange(tokens, index);
        }
        if (tag == tags::GE) {
            return close_functional_group(tokens, index);
        }
        if (tag == tags::SE) {
            return close_transaction(tokens, index);
        }
        return append_segment(tag, tokens, index);
    }

    /**
     * @brief Reject envelopes left open at the end of input
     */
    std::expected<void, parse_error> finish() const {
        if (auto error = unclosed_scope(envelope_level::interchange)) {
            return std::unexpected(std::move(*error));
        }
        return {};
    }

    [[nodiscard]] std::size_t unchecked_trailers() const noexcept {
        return unchecked_trailers_;
    }

    x12_document take() { return std::move(document_); }

private:
    // =========================================================================
    // Openers
    // =========================================================================

    std::expected<void, parse_error> open_interchange(
        const segment_tokens& tokens, std::size_t index) {
        if (auto error = unclosed_scope(envelope_level::interchange, &tokens,
                                        index)) {
            return std::unexpected(std::move(*error));
        }
        if (tokens.size() < X12_ISA_ELEMENT_COUNT) {
            return std::unexpected(too_few_elements(tokens, index,
                                                    X12_ISA_ELEMENT_COUNT));
        }

        interchange isa;
        isa.authorization_qualifier = element_at(tokens, 1);
        isa.authorization_information = element_at(tokens, 2);
        isa.security_qualifier = element_at(tokens, 3);
        isa.security_information = element_at(tokens, 4);
        isa.sender_qualifier = element_at(tokens, 5);
        isa.sender_id = element_at(tokens, 6);
        isa.receiver_qualifier = element_at(tokens, 7);
        isa.receiver_id = element_at(tokens, 8);
        isa.date = element_at(tokens, 9);
        isa.time = element_at(tokens, 10);
        isa.standards_id = element_at(tokens, 11);
        isa.version = element_at(tokens, 12);
        isa.interchange_control_number = element_at(tokens, 13);
        isa.acknowledgment_requested = element_at(tokens, 14);
        isa.test_indicator = element_at(tokens, 15);

        document_.interchanges.push_back(std::move(isa));
        open_interchange_ = document_.interchanges.size() - 1;
        return {};
    }

    std::expected<void, parse_error> open_functional_group(
        const segment_tokens& tokens, std::size_t index) {
        if (!open_interchange_) {
            return std::unexpected(segment_error(
                x12_error::out_of_order_segment,
                "GS segment requires an open interchange (ISA)", tokens,
                index));
        }
        if (auto error = unclosed_scope(envelope_level::functional_group,
                                        &tokens, index)) {
            return std::unexpected(std::move(*error));
        }
        if (tokens.size() < X12_GS_MIN_ELEMENTS) {
            return std::unexpected(
                too_few_elements(tokens, index, X12_GS_MIN_ELEMENTS));
        }

        functional_group group;
        group.functional_identifier_code = element_at(tokens, 1);
        group.application_sender_code = element_at(tokens, 2);
        group.application_receiver_code = element_at(tokens, 3);
        group.date = element_at(tokens, 4);
        group.time = element_at(tokens, 5);
        group.group_control_number = element_at(tokens, 6);
        group.responsible_agency_code = element_at(tokens, 7);
        group.version = element_at(tokens, 8);

        auto& groups = current_interchange().functional_groups;
        groups.push_back(std::move(group));
        open_group_ = groups.size() - 1;
        return {};
    }

    std::expected<void, parse_error> open_transaction(
        const segment_tokens& tokens, std::size_t index) {
        if (!open_group_) {
            return std::unexpected(segment_error(
                x12_error::out_of_order_segment,
                "ST segment requires an open functional group (GS)", tokens,
                index));
        }
        if (auto error =
                unclosed_scope(envelope_level::transaction, &tokens, index)) {
            return std::unexpected(std::move(*error));
        }
        if (tokens.size() < X12_ST_MIN_ELEMENTS) {
            return std::unexpected(
                too_few_elements(tokens, index, X12_ST_MIN_ELEMENTS));
        }

        transaction txn;
        txn.transaction_code = element_at(tokens, 1);
        txn.transaction_set_control_number = element_at(tokens, 2);
        if (tokens.size() > X12_ST_MIN_ELEMENTS) {
            txn.implementation_convention_reference = element_at(tokens, 3);
        }
        txn.transaction_name =
            catalog_ ? catalog_->lookup(txn.transaction_code)
                     : std::string(X12_UNIDENTIFIED_TRANSACTION);

        auto& transactions = current_group().transactions;
        transactions.push_back(std::move(txn));
        open_transaction_ = transactions.size() - 1;
        return {};
    }

    // =========================================================================
    // Trailers
    // =========================================================================

    std::expected<void, parse_error> close_interchange(
        const segment_tokens& tokens, std::size_t index) {
        if (!open_interchange_) {
            return std::unexpected(segment_error(
                x12_error::out_of_order_segment,
                "IEA segment without an open interchange (ISA)", tokens,
                index));
        }
        if (auto error = unclosed_scope(envelope_level::functional_group,
                                        &tokens, index)) {
            return std::unexpected(std::move(*error));
        }

        auto checked = validate(tokens, index, [&] {
            return envelope_validator::validate_interchange(
                current_interchange(), tokens);
        });
        if (!checked) {
            return checked;
        }

        open_interchange_.reset();
        return {};
    }

    std::expected<void, parse_error> close_functional_group(
        const segment_tokens& tokens, std::size_t index) {
        if (!open_group_) {
            return std::unexpected(segment_error(
                x12_error::out_of_order_segment,
                "GE segment without an open functional group (GS)", tokens,
                index));
        }
        if (auto error =
                unclosed_scope(envelope_level::transaction, &tokens, index)) {
            return std::unexpected(std::move(*error));
        }

        auto checked = validate(tokens, index, [&] {
            return envelope_validator::validate_functional_group(
                current_group(), tokens);
        });
        if (!checked) {
            return checked;
        }

        open_group_.reset();
        return {};
    }

    std::expected<void, parse_error> close_transaction(
        const segment_tokens& tokens, std::size_t index) {
        if (!open_transaction_) {
            return std::unexpected(segment_error(
                x12_error::out_of_order_segment,
                "SE segment without an open transaction (ST)", tokens, index));
        }

        auto checked = validate(tokens, index, [&] {
            return envelope_validator::validate_transaction(
                current_transaction(), tokens);
        });
        if (!checked) {
            return checked;
        }

        open_transaction_.reset();
        return {};
    }

    /**
     * @brief Run a trailer check in strict mode, or count it as skipped
     */
    template <typename Check>
    std::expected<void, parse_error> validate(const segment_tokens& tokens,
                                              std::size_t index,
                                              Check&& check) {
        if (!strict_) {
            ++unchecked_trailers_;
            if (logger_.is_enabled(integration::log_level::debug)) {
                std::ostringstream message;
                message << "Loose mode: accepted " << trim(tokens.front())
                        << " trailer at segment " << index
                        << " without envelope checks";
                logger_.debug(message.str());
            }
            return {};
        }

        auto result = check();
        if (!result) {
            auto error = std::move(result.error());
            error.segment_index = index;
            return std::unexpected(std::move(error));
        }
        return {};
    }

    // =========================================================================
    // Body Segments
    // =========================================================================

    std::expected<void, parse_error> append_segment(std::string_view tag,
                                                    const segment_tokens& tokens,
                                                    std::size_t index) {
        if (!open_transaction_) {
            return std::unexpected(segment_error(
                x12_error::out_of_order_segment,
                std::string(tag) + " segment requires an open transaction (ST)",
                tokens, index));
        }

        generic_segment segment;
        segment.tag = std::string(tag);
        segment.elements.reserve(tokens.size() - 1);
        for (std::size_t i = 1; i < tokens.size(); ++i) {
            segment.elements.push_back(element_at(tokens, i));
        }

        current_transaction().segments.push_back(std::move(segment));
        return {};
    }

    // =========================================================================
    // Unclosed Scopes
    // =========================================================================

    /**
     * @brief Innermost open scope at or below @p outermost, as an error
     *
     * @param outermost Shallowest level to check
     * @param closer Segment that ended the scope early (null at end of input)
     * @param index Position of @p closer
     */
    std::optional<parse_error> unclosed_scope(
        envelope_level outermost, const segment_tokens* closer = nullptr,
        std::size_t index = 0) const {
        std::ostringstream reason;
        if (open_transaction_) {
            reason << "transaction "
                   << current_transaction().transaction_set_control_number
                   << " was not closed by an SE segment";
        } else if (outermost != envelope_level::transaction && open_group_) {
            reason << "functional group "
                   << current_group().group_control_number
                   << " was not closed by a GE segment";
        } else if (outermost == envelope_level::interchange &&
                   open_interchange_) {
            reason << "interchange "
                   << current_interchange().interchange_control_number
                   << " was not closed by an IEA segment";
        } else {
            return std::nullopt;
        }

        if (!closer) {
            return parse_error{.code = x12_error::truncated_input,
                               .reason = reason.str(),
                               .segment = {},
                               .segment_index = std::nullopt,
                               .mismatch = std::nullopt};
        }
        reason << " before " << trim(closer->front());
        return segment_error(x12_error::truncated_input, reason.str(), *closer,
                             index);
    }

    // =========================================================================
    // Open Scope Access
    // =========================================================================

    interchange& current_interchange() {
        return document_.interchanges[*open_interchange_];
    }

    const interchange& current_interchange() const {
        return document_.interchanges[*open_interchange_];
    }

    functional_group& current_group() {
        return current_interchange().functional_groups[*open_group_];
    }

    const functional_group& current_group() const {
        return current_interchange().functional_groups[*open_group_];
    }

    transaction& current_transaction() {
        return current_group().transactions[*open_transaction_];
    }

    const transaction& current_transaction() const {
        return current_group().transactions[*open_transaction_];
    }

    const config::transaction_catalog* catalog_;
    bool strict_;
    integration::logger_adapter& logger_;

    x12_document document_;
    std::optional<std::size_t> open_interchange_;
    std::optional<std::size_t> open_group_;
    std::optional<std::size_t> open_transaction_;
    std::size_t unchecked_trailers_ = 0;
};

}  // namespace

// =============================================================================
// x12_parser::impl
// =============================================================================

class x12_parser::impl {
public:
    std::shared_ptr<const config::transaction_catalog> catalog_;
    parser_options options_;

    impl(std::shared_ptr<const config::transaction_catalog> catalog,
         const parser_options& options)
        : catalog_(std::move(catalog)), options_(options) {}

    [[nodiscard]] const char* mode_name() const noexcept {
        return options_.strict_envelope_validation ? "strict" : "loose";
    }
};

// =============================================================================
// x12_parser Implementation
// =============================================================================

x12_parser::x12_parser()
    : pimpl_(std::make_unique<impl>(standard_catalog(), parser_options{})) {}

x12_parser::x12_parser(const parser_options& options)
    : pimpl_(std::make_unique<impl>(standard_catalog(), options)) {}

x12_parser::x12_parser(
    std::shared_ptr<const config::transaction_catalog> catalog,
    const parser_options& options)
    : pimpl_(std::make_unique<impl>(std::move(catalog), options)) {}

x12_parser::~x12_parser() = default;

x12_parser::x12_parser(x12_parser&&) noexcept = default;
x12_parser& x12_parser::operator=(x12_parser&&) noexcept = default;

std::expected<x12_document, parse_error> x12_parser::parse(
    std::string_view data, parse_details* details) const {
    auto& logger = integration::get_logger();
    auto start = std::chrono::steady_clock::now();

    if (logger.is_enabled(integration::log_level::debug)) {
        std::ostringstream message;
        message << "Parsing X12 document (" << data.size() << " bytes, "
                << pimpl_->mode_name() << " mode)";
        logger.debug(message.str());
    }

    auto fail = [&](parse_error error)
        -> std::expected<x12_document, parse_error> {
        logger.warning("X12 parse failed (" +
                       std::to_string(to_error_code(error.code)) + "): " +
                       error.to_string());
        return std::unexpected(std::move(error));
    };

    auto header = data.substr(find_header_start(data));

    // Without an ISA nothing is open, so the first segment is out of order
    if (header.size() >= X12_MIN_HEADER_LENGTH &&
        !header.starts_with(tags::ISA)) {
        auto tokens = leading_segment(header);
        return fail(parse_error{
            .code = x12_error::out_of_order_segment,
            .reason = tokens.empty()
                          ? std::string("document does not begin with an ISA segment")
                          : std::string(tokens.front()) +
                                " segment appears before any ISA segment",
            .segment = to_strings(tokens),
            .segment_index = std::size_t{0},
            .mismatch = std::nullopt});
    }

    auto delimiters = extract_delimiters(header);
    if (!delimiters) {
        return fail(std::move(delimiters.error()));
    }

    auto segments = tokenize(header, *delimiters);
    if (!segments) {
        return fail(std::move(segments.error()));
    }

    auto document = assemble(*segments, details);
    if (!document) {
        return fail(std::move(document.error()));
    }
    document->delimiters = *delimiters;

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
                       std::chrono::steady_clock::now() - start)
                       .count();

    if (details) {
        details->parse_time_us = elapsed;
        details->original_size = data.size();
    }

    if (logger.is_enabled(integration::log_level::debug)) {
        std::ostringstream message;
        message << "Parsed " << document->interchanges.size()
                << " interchange(s), " << document->transaction_count()
                << " transaction(s) from " << segments->size()
                << " segments in " << elapsed << "us";
        logger.debug(message.str());
    }

    return document;
}

std::expected<x12_document, parse_error> x12_parser::assemble(
    const std::vector<segment_tokens>& segments, parse_details* details) const {
    document_assembler assembler(pimpl_->catalog_.get(),
                                 pimpl_->options_.strict_envelope_validation,
                                 integration::get_logger());

    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (segments[i].empty()) {
            continue;
        }
        auto consumed = assembler.consume(segments[i], i);
        if (!consumed) {
            return std::unexpected(std::move(consumed.error()));
        }
    }

    auto finished = assembler.finish();
    if (!finished) {
        return std::unexpected(std::move(finished.error()));
    }

    auto document = assembler.take();

    if (details) {
        details->segment_count = segments.size();
        details->interchange_count = document.interchanges.size();
        details->functional_group_count = 0;
        for (const auto& isa : document.interchanges) {
            details->functional_group_count += isa.functional_groups.size();
        }
        details->transaction_count = document.transaction_count();
        details->unchecked_trailers = assembler.unchecked_trailers();
    }

    return document;
}

const parser_options& x12_parser::options() const noexcept {
    return pimpl_->options_;
}

const std::shared_ptr<const config::transaction_catalog>& x12_parser::catalog()
    const noexcept {
    return pimpl_->catalog_;
}

// =============================================================================
// Convenience Entry Points
// =============================================================================

std::shared_ptr<const config::transaction_catalog> standard_catalog() {
    static const auto catalog = std::make_shared<const config::transaction_catalog>(
        config::transaction_catalog::standard());
    return catalog;
}

std::expected<x12_document, parse_error> parse(std::string_view data) {
    return parse(data, standard_catalog());
}

std::expected<x12_document, parse_error> parse(
    std::string_view data,
    std::shared_ptr<const config::transaction_catalog> catalog) {
    return x12_parser(std::move(catalog)).parse(data);
}

std::expected<x12_document, parse_error> loose_parse(std::string_view data) {
    return loose_parse(data, standard_catalog());
}

std::expected<x12_document, parse_error> loose_parse(
    std::string_view data,
    std::shared_ptr<const config::transaction_catalog> catalog) {
    return x12_parser(std::move(catalog),
                      parser_options{.strict_envelope_validation = false})
        .parse(data);
}

}  // namespace edi::x12
