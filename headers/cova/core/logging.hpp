//
// Created by gregorian-rayne on 1/9/26.
//

#ifndef COVA_LOGGING_HPP
#define COVA_LOGGING_HPP

/**
 * @file logging.hpp
 * @brief Process-wide log level setup.
 *
 * Components obtain their own named logger with
 * redlog::get_logger("cova.<component>"); this header only maps the
 * configured level names onto redlog levels.
 */

#include "cova/result.hpp"
#include "cova/error.hpp"

#include <redlog.hpp>

#include <string>

namespace cova::core {

    /**
     * Maps a level name (error, warn, info, verbose, trace, debug,
     * pedantic; case-insensitive) to a redlog level.
     */
    [[nodiscard]] Result<redlog::level, Error> parse_log_level(const std::string& name);

    /**
     * Applies a level name globally.
     */
    Result<void, Error> configure_logging(const std::string& level_name);

}  // namespace cova::core

#endif //COVA_LOGGING_HPP
