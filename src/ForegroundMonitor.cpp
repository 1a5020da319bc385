#include "ForegroundMonitor.hpp"
#include "ShortcutStore.hpp"
#include <spdlog/spdlog.h>

void ForegroundMonitor::check() {
    auto exe = m_reader.foreground_executable();
    if (!exe) {
        spdlog::warn("Foreground check failed: {}", exe.error());
        forget_current();
        return;
    }
    if (!*exe || (*exe)->empty()) {
        forget_current();
        return;
    }
    if (m_current == **exe) {
        return;
    }
    m_current = **exe;
    spdlog::debug("Foreground application changed to {}", *m_current);
    if (m_listener) {
        m_listener(*m_current);
    }
}

void ForegroundMonitor::forget_current() {
    if (!m_current) {
        return;
    }
    m_current.reset();
    if (m_listener) {
        m_listener(ShortcutStore::DEFAULT_APP);
    }
}
