#pragma once
#include <windows.h>
#include <string>
#include <string_view>
#include "ForegroundMonitor.hpp"
#include "KeyboardState.hpp"

/// UTF-8 to UTF-16 for the W APIs.
std::wstring to_wide(std::string_view utf8);

/// UTF-16 to UTF-8.
std::string to_utf8(std::wstring_view wide);

/**
 * @class AsyncKeyReader
 * @brief Physical key state from GetAsyncKeyState. A name is down if any of its
 * virtual keys is down (either Shift, either Ctrl, ...).
 */
class AsyncKeyReader : public KeyStateReader {
public:
    std::expected<bool, std::string> is_key_down(std::string_view key) const override;
};

/**
 * @class ForegroundProcessReader
 * @brief Executable name of the process owning the foreground window.
 */
class ForegroundProcessReader : public ProcessReader {
public:
    std::expected<std::optional<std::string>, std::string> foreground_executable() const override;
};
