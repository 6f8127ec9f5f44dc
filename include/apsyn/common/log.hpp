#pragma once

#include <memory>
#include <spdlog/spdlog.h>

namespace apsyn {

static constexpr const char *kLoggerName = "apsyn";

/**
 * @brief Logger shared by the driver
 *
 * Returns the spdlog logger registered under kLoggerName, creating a colour stdout
 * logger on first use. Register a logger under that name beforehand to redirect output.
 */
[[nodiscard]] std::shared_ptr<spdlog::logger> Logger();

}  // namespace apsyn
