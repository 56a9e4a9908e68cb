/**
 * Folio - Configuration implementation
 */

#include "folio/config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace folio {

Result<Config> parse_config(std::string_view text) {
    Config config;
    try {
        nlohmann::json j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            return Error::parse_error("Configuration must be a JSON object");
        }

        if (j.contains("log_level")) {
            std::string name = j["log_level"].get<std::string>();
            auto level = parse_log_level(name);
            if (!level) {
                return Error::parse_error("Unknown log level: " + name, "log_level");
            }
            config.log_level = *level;
        }
        if (j.contains("log_file")) config.log_file = j["log_file"].get<std::string>();
        if (j.contains("console_log")) config.console_log = j["console_log"].get<bool>();

        if (j.contains("positions")) {
            const nlohmann::json& positions = j["positions"];
            if (!positions.is_object()) {
                return Error::parse_error("Expected an object", "positions");
            }
            if (positions.contains("page_length")) {
                auto page_length = positions["page_length"].get<int64_t>();
                if (page_length <= 0) {
                    return Error::parse_error("Page length must be positive", "positions.page_length");
                }
                config.positions.page_length = static_cast<uint64_t>(page_length);
            }
            if (positions.contains("strategy")) {
                std::string name = positions["strategy"].get<std::string>();
                auto strategy = epub::parse_reflowable_strategy(name);
                if (!strategy) {
                    return Error::parse_error("Unknown positions strategy: " + name, "positions.strategy");
                }
                config.positions.strategy = *strategy;
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return Error::parse_error(std::string("Invalid configuration: ") + e.what());
    }
    return config;
}

Result<Config> load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error::file_not_found(path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto config = parse_config(buffer.str());
    if (!config) {
        Error error = config.error();
        error.context = path.string() + (error.context.empty() ? "" : ", " + error.context);
        return error;
    }
    return config;
}

Result<void> apply_logging(const Config& config) {
    auto& logger = Logger::instance();
    logger.set_level(config.log_level);
    logger.set_console_output(config.console_log);
    if (!config.log_file.empty() && !logger.set_file(config.log_file)) {
        return Error::io_error("Cannot open log file", config.log_file.string());
    }
    return {};
}

} // namespace folio
