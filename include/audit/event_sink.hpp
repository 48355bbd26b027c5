#pragma once

#include "audit/session_event.hpp"
#include <string>

namespace sqlsandbox {

/**
 * @brief Abstract interface for session event destinations
 *
 * on_event() is called synchronously from whichever thread handled the
 * request, so implementations must be thread-safe.
 */
class IEventSink {
public:
    virtual ~IEventSink() = default;

    virtual void on_event(const SessionEvent& event) = 0;

    /// Human-readable sink name for logging
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace sqlsandbox
