#include "Logging.hpp"
#include <memory>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

std::expected<void, std::string> init_logging(const std::string& level, const std::string& file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    std::string file_error;
    if (!file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file));
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("shortcut_overlay", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_pattern(LOG_PATTERN);

    auto lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off") {
        spdlog::set_level(spdlog::level::info);
        spdlog::warn("Unknown log level '{}', using info", level);
    } else {
        spdlog::set_level(lvl);
    }

    if (!file_error.empty()) {
        return std::unexpected("Cannot open log file " + file + ": " + file_error);
    }
    return {};
}
