//
// Created by gregorian-rayne on 1/9/26.
//

#include "cova/core/logging.hpp"
#include "cova/utils/string_utils.hpp"

namespace cova::core {

    Result<redlog::level, Error> parse_log_level(const std::string& name) {
        const std::string lower = string_utils::to_lower(string_utils::trim(name));

        if (lower == "error")    return Result<redlog::level, Error>::success(redlog::level::error);
        if (lower == "warn")     return Result<redlog::level, Error>::success(redlog::level::warn);
        if (lower == "info")     return Result<redlog::level, Error>::success(redlog::level::info);
        if (lower == "verbose")  return Result<redlog::level, Error>::success(redlog::level::verbose);
        if (lower == "trace")    return Result<redlog::level, Error>::success(redlog::level::trace);
        if (lower == "debug")    return Result<redlog::level, Error>::success(redlog::level::debug);
        if (lower == "pedantic") return Result<redlog::level, Error>::success(redlog::level::pedantic);

        return Result<redlog::level, Error>::failure(
            Error::config_error("Unknown log level", name));
    }

    Result<void, Error> configure_logging(const std::string& level_name) {
        auto level = parse_log_level(level_name);
        if (level.is_err()) {
            return Result<void, Error>::failure(level.error());
        }
        redlog::set_level(level.value());
        return Result<void, Error>::success();
    }

}  // namespace cova::core
