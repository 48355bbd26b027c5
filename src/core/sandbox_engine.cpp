#include "core/sandbox_engine.hpp"
#include "core/utils.hpp"
#include "tenant/tenant_session.hpp"

#include <format>
#include <stdexcept>

namespace sqlsandbox {

namespace {

[[nodiscard]] bool never_reached_engine(ErrorKind kind) {
    return kind == ErrorKind::MUTATION_ATTEMPT ||
           kind == ErrorKind::OUT_OF_SCOPE_TABLE ||
           kind == ErrorKind::BUSY;
}

} // anonymous namespace

SandboxEngine::SandboxEngine(SandboxComponents components, SandboxOptions options)
    : c_(std::move(components)),
      options_(options),
      provisioner_(c_.catalog),
      pipeline_(options_.executor) {
    if (!c_.catalog) {
        throw std::invalid_argument("SandboxEngine requires a catalog");
    }
    if (!c_.connection_factory) {
        throw std::invalid_argument("SandboxEngine requires a connection factory");
    }
}

SandboxEngine::~SandboxEngine() {
    teardown_all();
}

// ============================================================================
// Locking
// ============================================================================

bool SandboxEngine::acquire(std::unique_lock<std::timed_mutex>& lock) const {
    if (options_.busy_wait.count() <= 0) {
        return lock.try_lock();
    }
    return lock.try_lock_for(options_.busy_wait);
}

std::string SandboxEngine::not_found_message(const std::string& session_id) {
    return std::format("Session '{}' not found. It may have been torn down.", session_id);
}

std::string SandboxEngine::busy_message() {
    return "Another request is still running in this session. "
           "Wait for it to finish and try again.";
}

// ============================================================================
// Provisioning
// ============================================================================

Result<std::string> SandboxEngine::provision(int64_t problem_id) {
    return provision(utils::generate_uuid(), problem_id);
}

Result<ProvisionedSchema> SandboxEngine::provision_into(
    TenantSession& session, int64_t problem_id) const {
    try {
        return provisioner_.provision(problem_id, session.connection(), session.physical_tables());
    } catch (const std::exception& e) {
        utils::log::error(std::format("Session {}: provisioning problem {} threw: {}",
            session.session_id(), problem_id, e.what()));
        return Result<ProvisionedSchema>::error(ErrorKind::PROVISION_ERROR,
            std::format("Failed to provision problem {}", problem_id));
    }
}

Result<std::string> SandboxEngine::provision(const std::string& session_id, int64_t problem_id) {
    utils::Timer timer;

    SessionEvent event;
    event.session_id = session_id;
    event.problem_id = problem_id;
    event.type = SessionEventType::SESSION_PROVISIONED;

    const auto fail = [&](ErrorKind kind, std::string message) {
        event.success = false;
        event.error_kind = kind;
        event.elapsed = timer.elapsed_us();
        emit(event);
        return Result<std::string>::error(kind, std::move(message));
    };

    // Re-provision an existing session in place
    if (auto existing = registry_.find(session_id)) {
        std::unique_lock lock(existing->mutex(), std::defer_lock);
        if (!acquire(lock)) {
            return fail(ErrorKind::BUSY, busy_message());
        }
        if (existing->is_released()) {
            return fail(ErrorKind::SESSION_NOT_FOUND, not_found_message(session_id));
        }

        auto provisioned = provision_into(*existing, problem_id);
        if (provisioned.is_error()) {
            utils::log::error(std::format("Session {}: re-provisioning problem {} failed: {}",
                session_id, problem_id, provisioned.error_message()));
            existing->release();
            lock.unlock();
            registry_.remove(session_id);
            return fail(provisioned.error_kind(), provisioned.error_message());
        }

        auto& schema = provisioned.value();
        event.row_count = schema.report.total_loaded();
        existing->install(problem_id, std::move(schema.tables),
                          std::move(schema.ns), std::move(schema.report));

        utils::log::info(std::format("Session {} re-provisioned for problem {} ({} rows)",
            session_id, problem_id, event.row_count));
        event.success = true;
        event.elapsed = timer.elapsed_us();
        emit(event);
        return Result<std::string>::ok(session_id);
    }

    // New session; creation is serialized so the session limit holds
    std::lock_guard create_lock(create_mutex_);

    if (registry_.find(session_id)) {
        return fail(ErrorKind::PROVISION_ERROR,
                    std::format("Session '{}' is already being provisioned", session_id));
    }
    if (options_.max_sessions > 0 && registry_.size() >= options_.max_sessions) {
        utils::log::warn(std::format("Session limit reached ({}), refusing problem {}",
            options_.max_sessions, problem_id));
        return fail(ErrorKind::PROVISION_ERROR,
                    std::format("Session limit reached ({} active sessions)", options_.max_sessions));
    }

    auto conn = c_.connection_factory->create(c_.connection_string);
    if (!conn) {
        return fail(ErrorKind::PROVISION_ERROR, "Failed to open an engine database for the session");
    }

    auto session = std::make_shared<TenantSession>(session_id, problem_id, std::move(conn));

    auto provisioned = provision_into(*session, problem_id);
    if (provisioned.is_error()) {
        utils::log::error(std::format("Session {}: provisioning problem {} failed: {}",
            session_id, problem_id, provisioned.error_message()));
        session->release();
        return fail(provisioned.error_kind(), provisioned.error_message());
    }

    auto& schema = provisioned.value();
    event.row_count = schema.report.total_loaded();
    session->install(problem_id, std::move(schema.tables),
                     std::move(schema.ns), std::move(schema.report));

    if (!registry_.add(session)) {
        session->release();
        return fail(ErrorKind::PROVISION_ERROR,
                    std::format("Session '{}' already exists", session_id));
    }

    utils::log::info(std::format("Session {} provisioned for problem {} ({} rows, {} skipped)",
        session_id, problem_id, event.row_count, session->report().total_skipped()));
    event.success = true;
    event.elapsed = timer.elapsed_us();
    emit(event);
    return Result<std::string>::ok(session_id);
}

// ============================================================================
// Queries
// ============================================================================

QueryOutcome SandboxEngine::run(const std::string& session_id, const std::string& sql) {
    utils::Timer timer;
    QueryOutcome outcome;

    const auto session = registry_.find(session_id);
    if (!session) {
        outcome = QueryOutcome::failure(ErrorKind::SESSION_NOT_FOUND, not_found_message(session_id));
        outcome.elapsed = timer.elapsed_us();
        return outcome;
    }

    std::unique_lock lock(session->mutex(), std::defer_lock);
    const bool locked = acquire(lock);
    // Read under the lock: a re-provision may follow the unlock
    const int64_t problem_id = session->problem_id();
    if (!locked) {
        utils::log::info(std::format("Session {} busy, query rejected", session_id));
        outcome = QueryOutcome::failure(ErrorKind::BUSY, busy_message());
    } else if (session->is_released()) {
        outcome = QueryOutcome::failure(ErrorKind::SESSION_NOT_FOUND, not_found_message(session_id));
    } else {
        outcome = pipeline_.run(*session, sql);
    }
    if (lock.owns_lock()) lock.unlock();

    outcome.elapsed = timer.elapsed_us();

    SessionEvent event;
    event.session_id = session_id;
    event.problem_id = problem_id;
    event.type = (!outcome.success && never_reached_engine(outcome.error_kind))
        ? SessionEventType::QUERY_REJECTED
        : SessionEventType::QUERY_EXECUTED;
    event.sql = sql;
    event.success = outcome.success;
    event.error_kind = outcome.error_kind;
    event.row_count = outcome.rows.size();
    event.truncated = outcome.truncated;
    event.elapsed = outcome.elapsed;
    emit(std::move(event));

    return outcome;
}

// ============================================================================
// Teardown
// ============================================================================

bool SandboxEngine::teardown(const std::string& session_id) {
    // Unregister first so new requests see SESSION_NOT_FOUND
    auto session = registry_.remove(session_id);
    if (!session) {
        return false;
    }

    utils::Timer timer;
    int64_t problem_id = 0;
    {
        std::lock_guard lock(session->mutex());
        problem_id = session->problem_id();
        session->release();
    }

    utils::log::info(std::format("Session {} torn down (problem {})",
        session_id, problem_id));

    SessionEvent event;
    event.session_id = session_id;
    event.problem_id = problem_id;
    event.type = SessionEventType::SESSION_TORN_DOWN;
    event.success = true;
    event.elapsed = timer.elapsed_us();
    emit(std::move(event));
    return true;
}

void SandboxEngine::teardown_all() {
    for (const auto& id : registry_.list_sessions()) {
        teardown(id);
    }
}

// ============================================================================
// Introspection
// ============================================================================

Result<std::vector<TableSchema>> SandboxEngine::describe_schema(const std::string& session_id) {
    const auto session = registry_.find(session_id);
    if (!session) {
        return Result<std::vector<TableSchema>>::error(
            ErrorKind::SESSION_NOT_FOUND, not_found_message(session_id));
    }

    std::unique_lock lock(session->mutex(), std::defer_lock);
    if (!acquire(lock)) {
        return Result<std::vector<TableSchema>>::error(ErrorKind::BUSY, busy_message());
    }
    if (session->is_released()) {
        return Result<std::vector<TableSchema>>::error(
            ErrorKind::SESSION_NOT_FOUND, not_found_message(session_id));
    }
    return Result<std::vector<TableSchema>>::ok(session->schema());
}

Result<ProvisionReport> SandboxEngine::provision_report(const std::string& session_id) {
    const auto session = registry_.find(session_id);
    if (!session) {
        return Result<ProvisionReport>::error(
            ErrorKind::SESSION_NOT_FOUND, not_found_message(session_id));
    }

    std::unique_lock lock(session->mutex(), std::defer_lock);
    if (!acquire(lock)) {
        return Result<ProvisionReport>::error(ErrorKind::BUSY, busy_message());
    }
    return Result<ProvisionReport>::ok(session->report());
}

// ============================================================================
// Events
// ============================================================================

void SandboxEngine::emit(SessionEvent event) {
    if (!c_.event_sink) return;

    event.sequence = event_sequence_.fetch_add(1, std::memory_order_relaxed) + 1;
    event.timestamp = utils::now();
    c_.event_sink->on_event(event);
}

} // namespace sqlsandbox
