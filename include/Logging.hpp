#pragma once
#include <expected>
#include <string>

inline constexpr const char* LOG_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";

/**
 * @brief Installs the default logger: colour console sink, plus a file sink when
 * file is not empty. An unknown level name falls back to info.
 * @return Error if the log file cannot be opened. The console logger is installed anyway.
 */
std::expected<void, std::string> init_logging(const std::string& level, const std::string& file);
