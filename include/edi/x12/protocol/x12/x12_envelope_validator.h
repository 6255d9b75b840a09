#ifndef EDI_X12_PROTOCOL_X12_X12_ENVELOPE_VALIDATOR_H
#define EDI_X12_PROTOCOL_X12_X12_ENVELOPE_VALIDATOR_H

/**
 * @file x12_envelope_validator.h
 * @brief Cross-checks of IEA/GE/SE trailers against their openers
 *
 * Each trailer repeats information the parser already knows: the number
 * of children appended since the opener, and the opener's control number.
 * The checks compare the two and never modify the tree.
 *
 *   IEA01 == number of functional groups,  IEA02 == ISA13
 *   GE01  == number of transactions,       GE02  == GS06
 *   SE01  == number of segments + 2,       SE02  == ST02
 *
 * The count is checked before the control number. Each failure is
 * reported as envelope_mismatch with the level, the kind of mismatch and
 * the expected and actual values.
 */

#include "x12_document.h"
#include "x12_tokenizer.h"
#include "x12_types.h"

#include <expected>

namespace edi::x12 {

/**
 * @brief Envelope trailer validator
 *
 * @example
 * ```cpp
 * auto result = envelope_validator::validate_transaction(txn, se_tokens);
 * if (!result && result.error().mismatch) {
 *     log(result.error().mismatch->expected, result.error().mismatch->actual);
 * }
 * ```
 */
class envelope_validator {
public:
    /**
     * @brief Validate an IEA trailer against its interchange
     *
     * @param isa Interchange opened by the matching ISA
     * @param trailer IEA tokens, tag first
     * @return Empty on success; malformed_segment or envelope_mismatch
     */
    [[nodiscard]] static std::expected<void, parse_error> validate_interchange(
        const interchange& isa, const segment_tokens& trailer);

    /**
     * @brief Validate a GE trailer against its functional group
     */
    [[nodiscard]] static std::expected<void, parse_error>
    validate_functional_group(const functional_group& group,
                              const segment_tokens& trailer);

    /**
     * @brief Validate an SE trailer against its transaction
     */
    [[nodiscard]] static std::expected<void, parse_error> validate_transaction(
        const transaction& txn, const segment_tokens& trailer);
};

}  // namespace edi::x12

#endif  // EDI_X12_PROTOCOL_X12_X12_ENVELOPE_VALIDATOR_H
