/**
 * @file x12_types.cpp
 * @brief X12 type implementations
 */

#include "edi/x12/protocol/x12/x12_types.h"

#include <sstream>

namespace edi::x12 {

// =============================================================================
// parse_error Implementation
// =============================================================================

std::string parse_error::to_string() const {
    std::ostringstream oss;
    oss << x12::to_string(code);

    if (!reason.empty()) {
        oss << ": " << reason;
    }

    if (mismatch.has_value()) {
        oss << " -- expected: " << mismatch->expected
            << " received: " << mismatch->actual;
    }

    if (segment_index.has_value()) {
        oss << " (segment " << *segment_index << ")";
    }

    if (!segment.empty()) {
        oss << " [";
        for (size_t i = 0; i < segment.size(); ++i) {
            if (i > 0) {
                oss << X12_ELEMENT_SEPARATOR;
            }
            oss << segment[i];
        }
        oss << "]";
    }

    return oss.str();
}

}  // namespace edi::x12
