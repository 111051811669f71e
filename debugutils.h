#ifndef DEBUGUTILS_H
#define DEBUGUTILS_H

#include <QDebug>
#include <atomic>

/**
 * @brief Global switch for verbose debug output
 *
 * Square generation runs over thousands of tracks and squares per recording,
 * so per-item messages are only written when this switch is on.
 */
class DebugUtils {
public:
    /**
     * @brief Check if square generation debug messages should be displayed
     * @return True if square debug is enabled
     */
    static bool isSquaresDebugEnabled();

    /**
     * @brief Set the square generation debug state
     * @param enabled True to enable square debug messages
     */
    static void setSquaresDebugEnabled(bool enabled);

    /**
     * @brief Stream used by the SQUARES_DEBUG() macro
     * Usage: SQUARES_DEBUG() << "Your debug message";
     */
    static QDebug squaresDebug();

private:
    static std::atomic<bool> s_squaresDebugEnabled; // Read from worker threads
};

// Convenience macro for square generation debug messages
#define SQUARES_DEBUG() \
    if (!DebugUtils::isSquaresDebugEnabled()) {} else DebugUtils::squaresDebug()

#endif // DEBUGUTILS_H
