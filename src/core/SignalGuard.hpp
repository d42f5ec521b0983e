#pragma once

namespace mcp_stdio {

/**
 * @brief Process-wide interrupt flag fed by SIGINT/SIGTERM
 *
 * Handlers are installed without SA_RESTART so a blocking poll() returns
 * EINTR and the waiting code can check requested().
 */
class SignalGuard {
public:
    /**
     * @brief Install SIGINT and SIGTERM handlers
     */
    static void install();

    /**
     * @brief Check whether an interrupt signal has been received
     */
    static bool requested();

    /**
     * @brief Last signal number received (0 if none)
     */
    static int last_signal();

    /**
     * @brief Clear the pending interrupt (used by tests)
     */
    static void reset();
};

} // namespace mcp_stdio
