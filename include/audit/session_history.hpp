#pragma once

#include "audit/event_sink.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sqlsandbox {

/**
 * @brief Bounded in-memory event history per session
 *
 * Keeps the most recent max_events_per_session events of each live session
 * and serializes them as JSON lines. A SESSION_TORN_DOWN event drops the
 * session's history.
 */
class SessionHistory final : public IEventSink {
public:
    explicit SessionHistory(size_t max_events_per_session = 1000);

    void on_event(const SessionEvent& event) override;
    [[nodiscard]] std::string name() const override { return "session_history"; }

    /**
     * @brief Events for a session, oldest first
     */
    [[nodiscard]] std::vector<SessionEvent> events(const std::string& session_id) const;

    /**
     * @brief One JSON object per line, oldest first (empty if unknown)
     */
    [[nodiscard]] std::string to_json_lines(const std::string& session_id) const;

    [[nodiscard]] size_t session_count() const;

    /// Events evicted because a session exceeded its bound
    [[nodiscard]] uint64_t dropped_events() const;

    [[nodiscard]] static std::string to_json(const SessionEvent& event);

private:
    const size_t max_events_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::deque<SessionEvent>> history_;
    uint64_t dropped_ = 0;
};

} // namespace sqlsandbox
