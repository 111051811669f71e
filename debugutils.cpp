#include "debugutils.h"

// Static member definition
std::atomic<bool> DebugUtils::s_squaresDebugEnabled{false};

bool DebugUtils::isSquaresDebugEnabled() {
    return s_squaresDebugEnabled.load(std::memory_order_relaxed);
}

void DebugUtils::setSquaresDebugEnabled(bool enabled) {
    s_squaresDebugEnabled.store(enabled, std::memory_order_relaxed);
}

QDebug DebugUtils::squaresDebug() {
    return qDebug();
}
