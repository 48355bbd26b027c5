#include "audit/session_history.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlsandbox {

SessionHistory::SessionHistory(size_t max_events_per_session)
    : max_events_(max_events_per_session == 0 ? 1 : max_events_per_session) {}

void SessionHistory::on_event(const SessionEvent& event) {
    std::lock_guard lock(mutex_);

    if (event.type == SessionEventType::SESSION_TORN_DOWN) {
        history_.erase(event.session_id);
        return;
    }

    auto& events = history_[event.session_id];
    events.push_back(event);
    while (events.size() > max_events_) {
        events.pop_front();
        ++dropped_;
    }
}

std::vector<SessionEvent> SessionHistory::events(const std::string& session_id) const {
    std::lock_guard lock(mutex_);
    const auto it = history_.find(session_id);
    if (it == history_.end()) return {};
    return {it->second.begin(), it->second.end()};
}

std::string SessionHistory::to_json_lines(const std::string& session_id) const {
    std::string output;
    for (const auto& event : events(session_id)) {
        output += to_json(event);
        output += '\n';
    }
    return output;
}

size_t SessionHistory::session_count() const {
    std::lock_guard lock(mutex_);
    return history_.size();
}

uint64_t SessionHistory::dropped_events() const {
    std::lock_guard lock(mutex_);
    return dropped_;
}

std::string SessionHistory::to_json(const SessionEvent& event) {
    std::string out;
    out.reserve(192 + event.sql.size());
    out += std::format("{{\"sequence\":{},\"timestamp\":\"{}\",", event.sequence,
                       utils::format_timestamp(event.timestamp));
    out += std::format("\"session_id\":\"{}\",\"problem_id\":{},\"type\":\"{}\",",
                       utils::escape_json(event.session_id), event.problem_id,
                       session_event_type_to_string(event.type));
    if (!event.sql.empty()) {
        out += std::format("\"sql\":\"{}\",", utils::escape_json(event.sql));
    }
    out += std::format("\"success\":{},", utils::booltostr(event.success));
    if (event.error_kind == ErrorKind::NONE) {
        out += "\"error_kind\":null,";
    } else {
        out += std::format("\"error_kind\":\"{}\",", error_kind_to_string(event.error_kind));
    }
    out += std::format("\"row_count\":{},\"truncated\":{},\"elapsed_us\":{}}}",
                       event.row_count, utils::booltostr(event.truncated),
                       event.elapsed.count());
    return out;
}

} // namespace sqlsandbox
