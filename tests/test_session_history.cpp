#include <catch2/catch_test_macros.hpp>
#include "audit/session_history.hpp"

#include <algorithm>

using namespace sqlsandbox;

namespace {

SessionEvent make_event(const std::string& session, SessionEventType type, uint64_t seq) {
    SessionEvent event;
    event.sequence = seq;
    event.session_id = session;
    event.problem_id = 3;
    event.type = type;
    event.success = true;
    return event;
}

} // anonymous namespace

TEST_CASE("SessionHistory: events are kept per session in order", "[history]") {
    SessionHistory history;
    history.on_event(make_event("a", SessionEventType::SESSION_PROVISIONED, 1));
    history.on_event(make_event("b", SessionEventType::SESSION_PROVISIONED, 2));
    history.on_event(make_event("a", SessionEventType::QUERY_EXECUTED, 3));

    const auto events = history.events("a");
    REQUIRE(events.size() == 2);
    CHECK(events[0].sequence == 1);
    CHECK(events[1].type == SessionEventType::QUERY_EXECUTED);
    CHECK(history.session_count() == 2);
    CHECK(history.events("missing").empty());
}

TEST_CASE("SessionHistory: teardown forgets the session", "[history]") {
    SessionHistory history;
    history.on_event(make_event("a", SessionEventType::SESSION_PROVISIONED, 1));
    history.on_event(make_event("a", SessionEventType::SESSION_TORN_DOWN, 2));

    CHECK(history.events("a").empty());
    CHECK(history.session_count() == 0);
}

TEST_CASE("SessionHistory: oldest events are evicted past the bound", "[history]") {
    SessionHistory history(2);
    for (uint64_t seq = 1; seq <= 5; ++seq) {
        history.on_event(make_event("a", SessionEventType::QUERY_EXECUTED, seq));
    }

    const auto events = history.events("a");
    REQUIRE(events.size() == 2);
    CHECK(events[0].sequence == 4);
    CHECK(events[1].sequence == 5);
    CHECK(history.dropped_events() == 3);
}

TEST_CASE("SessionHistory: JSON rendering", "[history]") {
    SECTION("query event") {
        auto event = make_event("s-1", SessionEventType::QUERY_REJECTED, 7);
        event.sql = "DROP TABLE \"customers\"";
        event.success = false;
        event.error_kind = ErrorKind::MUTATION_ATTEMPT;
        event.elapsed = std::chrono::microseconds(42);

        CHECK(SessionHistory::to_json(event) ==
              R"({"sequence":7,"timestamp":"1970-01-01T00:00:00.000Z","session_id":"s-1",)"
              R"("problem_id":3,"type":"QUERY_REJECTED","sql":"DROP TABLE \"customers\"",)"
              R"("success":false,"error_kind":"MUTATION_ATTEMPT","row_count":0,"truncated":false,"elapsed_us":42})");
    }

    SECTION("provision event omits sql") {
        auto event = make_event("s-1", SessionEventType::SESSION_PROVISIONED, 1);
        event.row_count = 7;
        const auto json = SessionHistory::to_json(event);
        CHECK(json.find("\"sql\"") == std::string::npos);
        CHECK(json.find("\"error_kind\":null") != std::string::npos);
        CHECK(json.find("\"row_count\":7") != std::string::npos);
    }

    SECTION("json lines") {
        SessionHistory history;
        history.on_event(make_event("a", SessionEventType::SESSION_PROVISIONED, 1));
        history.on_event(make_event("a", SessionEventType::QUERY_EXECUTED, 2));
        const auto lines = history.to_json_lines("a");
        CHECK(std::count(lines.begin(), lines.end(), '\n') == 2);
    }
}
