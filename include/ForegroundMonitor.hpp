#pragma once
#include <expected>
#include <functional>
#include <optional>
#include <string>

/**
 * @class ProcessReader
 * @brief Source of the executable name owning the foreground window.
 */
class ProcessReader {
public:
    virtual ~ProcessReader() = default;

    /**
     * @return The executable base name ("notepad.exe"), std::nullopt when the foreground
     *         window has no identifiable process, or an error message.
     */
    virtual std::expected<std::optional<std::string>, std::string> foreground_executable() const = 0;
};

/**
 * @class ForegroundMonitor
 * @brief Reports changes of the focused application. check() is driven by a timer.
 */
class ForegroundMonitor {
public:
    using AppChangedListener = std::function<void(const std::string& app)>;

    explicit ForegroundMonitor(const ProcessReader& reader) : m_reader(reader) {}

    void set_listener(AppChangedListener l) { m_listener = std::move(l); }

    /**
     * @brief Polls the reader once. Notifies the executable name when it changed, or
     * "DEFAULT" when a previously identified app can no longer be identified.
     */
    void check();

    /// Last identified executable name, std::nullopt while none is identified.
    const std::optional<std::string>& current_app() const { return m_current; }

private:
    void forget_current();

    const ProcessReader& m_reader;
    std::optional<std::string> m_current;
    AppChangedListener m_listener;
};
