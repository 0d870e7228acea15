#include "fnr/logging.h"
#include <utility>

namespace fnr {

RejectCallback makeLoggerSink(std::shared_ptr<spdlog::logger> logger,
                              spdlog::level::level_enum level) {
    if (!logger) {
        logger = spdlog::default_logger();
    }

    return [logger = std::move(logger), level](const std::string& reason) {
        logger->log(level, "Identifier rejected: {}", reason);
    };
}

} // namespace fnr
