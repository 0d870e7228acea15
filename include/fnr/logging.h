#ifndef FNR_LOGGING_H
#define FNR_LOGGING_H

#include "fnr/validator.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace fnr {

/**
 * Adapt a spdlog logger into a reject callback for check().
 * @param logger Target logger, or nullptr for spdlog's default logger
 * @param level Level each rejection is logged at
 */
RejectCallback makeLoggerSink(std::shared_ptr<spdlog::logger> logger = nullptr,
                              spdlog::level::level_enum level = spdlog::level::info);

} // namespace fnr

#endif // FNR_LOGGING_H
