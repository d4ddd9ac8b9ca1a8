#pragma once

/**
 * System utilities for the tickguard engine
 *
 * Signal handling for graceful shutdown. Linux-specific implementation.
 */

#include <atomic>
#include <csignal>

namespace tickguard {
namespace util {

// ============================================================================
// Signal Handler
// ============================================================================

namespace detail {
inline std::atomic<bool>* g_running_flag = nullptr;
inline std::atomic<int> g_last_signal{0};
} // namespace detail

/**
 * Graceful shutdown signal handler.
 *
 * Only touches lock-free atomics; the main loop reports the signal.
 * Installed via install_shutdown_handler().
 */
inline void graceful_shutdown_handler(int sig) {
    detail::g_last_signal.store(sig);
    if (detail::g_running_flag) {
        detail::g_running_flag->store(false);
    }
}

/**
 * Install graceful shutdown handler for SIGINT and SIGTERM.
 *
 * @param running Atomic flag to set to false on signal
 */
inline void install_shutdown_handler(std::atomic<bool>& running) {
    detail::g_running_flag = &running;
    std::signal(SIGINT, graceful_shutdown_handler);
    std::signal(SIGTERM, graceful_shutdown_handler);
}

/**
 * Signal that stopped the process, 0 if none.
 */
inline int shutdown_signal() { return detail::g_last_signal.load(); }

} // namespace util
} // namespace tickguard
