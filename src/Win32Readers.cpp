#include "Win32Readers.hpp"
#include <filesystem>
#include <iterator>
#include <memory>
#include <type_traits>

namespace {

struct HandleDeleter {
    void operator()(HANDLE h) const { if (h) CloseHandle(h); }
};
using UniqueHandle = std::unique_ptr<std::remove_pointer_t<HANDLE>, HandleDeleter>;

} // namespace

std::wstring to_wide(std::string_view utf8) {
    if (utf8.empty()) return {};
    const int len = MultiByteToWideChar(CP_UTF8, 0, utf8.data(), static_cast<int>(utf8.size()), nullptr, 0);
    std::wstring out(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, utf8.data(), static_cast<int>(utf8.size()), out.data(), len);
    return out;
}

std::string to_utf8(std::wstring_view wide) {
    if (wide.empty()) return {};
    const int len = WideCharToMultiByte(CP_UTF8, 0, wide.data(), static_cast<int>(wide.size()),
                                        nullptr, 0, nullptr, nullptr);
    std::string out(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wide.data(), static_cast<int>(wide.size()), out.data(), len, nullptr, nullptr);
    return out;
}

std::expected<bool, std::string> AsyncKeyReader::is_key_down(std::string_view key) const {
    const auto codes = virtual_keys_for_key_name(key);
    if (codes.empty()) {
        return std::unexpected("No virtual key for '" + std::string(key) + "'");
    }
    for (auto vk : codes) {
        if (GetAsyncKeyState(static_cast<int>(vk)) & 0x8000) {
            return true;
        }
    }
    return false;
}

std::expected<std::optional<std::string>, std::string> ForegroundProcessReader::foreground_executable() const {
    HWND hwnd = GetForegroundWindow();
    if (!hwnd) {
        return std::optional<std::string>{};
    }
    DWORD pid = 0;
    GetWindowThreadProcessId(hwnd, &pid);
    if (pid == 0) {
        return std::optional<std::string>{};
    }

    UniqueHandle process(OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, pid));
    if (!process) {
        process.reset(OpenProcess(PROCESS_QUERY_INFORMATION | PROCESS_VM_READ, FALSE, pid));
    }
    if (!process) {
        // Elevated or protected processes cannot be opened
        return std::optional<std::string>{};
    }

    wchar_t path[MAX_PATH * 2];
    DWORD size = static_cast<DWORD>(std::size(path));
    if (!QueryFullProcessImageNameW(process.get(), 0, path, &size)) {
        return std::unexpected("QueryFullProcessImageNameW failed for pid " + std::to_string(pid) +
                               " (error " + std::to_string(GetLastError()) + ")");
    }
    const auto name = std::filesystem::path(std::wstring_view(path, size)).filename().wstring();
    return std::optional<std::string>(to_utf8(name));
}
