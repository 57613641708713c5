#pragma once

namespace alertwatch {

/**
 * @brief Process-wide record of the last SIGINT/SIGTERM
 *
 * The handler only stores the signal number in a lock-free atomic, so
 * any thread may poll received() while the handler runs on another.
 */
class ShutdownSignal {
public:
    /// Install the handler for SIGINT and SIGTERM
    static void install();

    /// Signal number received, 0 if none yet
    [[nodiscard]] static int received();

    [[nodiscard]] static bool requested() { return received() != 0; }

    /// Forget a previously received signal
    static void reset();
};

} // namespace alertwatch
