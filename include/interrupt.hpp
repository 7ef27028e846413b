/**
 * @file interrupt.hpp
 * @brief Process-wide cancellation flag set by SIGINT and SIGTERM.
 */

#ifndef INTERRUPT_HPP
#define INTERRUPT_HPP

#include <csignal>

extern volatile std::sig_atomic_t gShutdownFlag;

/**
 * @brief Installs handlers that raise gShutdownFlag on SIGINT and SIGTERM.
 */
void installInterruptHandlers();

inline bool shutdownRequested() {
    return gShutdownFlag != 0;
}

#endif // INTERRUPT_HPP
