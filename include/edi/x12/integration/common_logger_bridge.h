#ifndef EDI_X12_INTEGRATION_COMMON_LOGGER_BRIDGE_H
#define EDI_X12_INTEGRATION_COMMON_LOGGER_BRIDGE_H

/**
 * @file common_logger_bridge.h
 * @brief Routes x12_edi logging through common_system's ILogger
 *
 * Available only when the library is built with
 * -DX12_STANDALONE_BUILD=OFF, which links kcenon common_system.
 */

#include "logger_adapter.h"

#include <kcenon/common/interfaces/logger_interface.h>

#include <memory>

namespace edi::x12::integration {

/**
 * @brief Wrap a common_system ILogger in a logger_adapter
 * @param logger Target logger; a null logger discards all messages
 */
[[nodiscard]] std::unique_ptr<logger_adapter> create_logger(
    std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

/**
 * @brief Make an ILogger the global logger used by the parser
 */
void set_default_logger(
    std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

}  // namespace edi::x12::integration

#endif  // EDI_X12_INTEGRATION_COMMON_LOGGER_BRIDGE_H
