/**
 * Folio - Configuration
 *
 * Optional JSON settings file:
 *
 *   {
 *     "log_level": "info",
 *     "log_file": "folio.log",
 *     "console_log": true,
 *     "positions": { "page_length": 1024, "strategy": "archive-entry-length" }
 *   }
 *
 * Every key is optional; unknown keys are ignored.
 */

#pragma once

#include "epub_positions.hpp"
#include "logging.hpp"
#include "result.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace folio {

struct Config {
    LogLevel log_level = LogLevel::Warning;
    std::filesystem::path log_file;
    bool console_log = true;
    epub::ReflowablePositions positions;
};

/**
 * Parse configuration JSON text. Wrong value types or unknown enum names
 * give a ParseError.
 */
Result<Config> parse_config(std::string_view text);

/**
 * Load configuration from a file. FileNotFound when it does not exist.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * Configure the global logger from config.
 */
Result<void> apply_logging(const Config& config);

} // namespace folio
