#pragma once

#include "db/iconnection_factory.hpp"
#include "db/idb_connection.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace sqlsandbox::testing {

/**
 * @brief Holds a query inside execute() until the test opens it
 */
class QueryGate {
public:
    void wait_until_entered() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return entered_; });
    }

    void open() {
        std::lock_guard lock(mutex_);
        open_ = true;
        cv_.notify_all();
    }

    void enter_and_wait() {
        std::unique_lock lock(mutex_);
        entered_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this] { return open_; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool entered_ = false;
    bool open_ = false;
};

/**
 * @brief Scriptable connection: records what it was asked to run
 *
 * Queries containing "block_me" park on the gate (if one is set).
 */
class MockDbConnection : public IDbConnection {
public:
    MockDbConnection() {
        next_result_.success = true;
        next_result_.column_names = {"name"};
        next_result_.column_types = {ColumnTypeInfo(GenericColumnType::TEXT, "TEXT")};
        next_result_.rows = {{Value::text_value("mock")}};
    }

    [[nodiscard]] DbResultSet execute(const std::string& sql, size_t max_rows) override {
        execute_count_.fetch_add(1, std::memory_order_relaxed);
        {
            std::lock_guard lock(mutex_);
            last_sql_ = sql;
            last_max_rows_ = max_rows;
        }
        if (gate_ && sql.find("block_me") != std::string::npos) {
            gate_->enter_and_wait();
        }
        if (!throw_message_.empty()) {
            throw std::runtime_error(throw_message_);
        }
        return next_result_;
    }

    [[nodiscard]] DbResultSet execute_command(const std::string& sql) override {
        std::lock_guard lock(mutex_);
        commands_.push_back(sql);
        DbResultSet result;
        result.success = true;
        return result;
    }

    [[nodiscard]] DbResultSet insert_rows(
        const std::string& /*insert_sql*/, const std::vector<Row>& rows) override {
        DbResultSet result;
        result.success = true;
        result.affected_rows = rows.size();
        return result;
    }

    bool set_query_timeout(uint32_t timeout_ms) override {
        timeout_ms_ = timeout_ms;
        return connected_;
    }

    void set_read_only(bool read_only) override { read_only_ = read_only; }
    [[nodiscard]] bool is_connected() const override { return connected_; }
    void close() override { connected_ = false; }

    // ---- Test controls ----------------------------------------------------

    void set_next_result(DbResultSet result) { next_result_ = std::move(result); }
    void set_throw(std::string message) { throw_message_ = std::move(message); }
    void set_gate(std::shared_ptr<QueryGate> gate) { gate_ = std::move(gate); }
    void set_connected(bool connected) { connected_ = connected; }

    [[nodiscard]] std::string last_sql() const {
        std::lock_guard lock(mutex_);
        return last_sql_;
    }
    [[nodiscard]] size_t last_max_rows() const {
        std::lock_guard lock(mutex_);
        return last_max_rows_;
    }
    [[nodiscard]] std::vector<std::string> commands() const {
        std::lock_guard lock(mutex_);
        return commands_;
    }
    [[nodiscard]] uint64_t execute_count() const {
        return execute_count_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint32_t timeout_ms() const { return timeout_ms_; }
    [[nodiscard]] bool read_only() const { return read_only_; }

private:
    mutable std::mutex mutex_;
    std::string last_sql_;
    size_t last_max_rows_ = 0;
    std::vector<std::string> commands_;

    DbResultSet next_result_;
    std::string throw_message_;
    std::shared_ptr<QueryGate> gate_;

    std::atomic<uint64_t> execute_count_{0};
    std::atomic<uint32_t> timeout_ms_{0};
    std::atomic<bool> read_only_{false};
    std::atomic<bool> connected_{true};
};

/**
 * @brief Hands out MockDbConnections sharing one gate and failure mode
 */
class MockConnectionFactory : public IConnectionFactory {
public:
    explicit MockConnectionFactory(std::shared_ptr<QueryGate> gate = nullptr)
        : gate_(std::move(gate)) {}

    [[nodiscard]] std::unique_ptr<IDbConnection> create(
        const std::string& /*connection_string*/) override {
        create_count_.fetch_add(1, std::memory_order_relaxed);
        if (fail_) return nullptr;
        auto conn = std::make_unique<MockDbConnection>();
        conn->set_gate(gate_);
        if (!throw_message_.empty()) conn->set_throw(throw_message_);
        return conn;
    }

    void set_fail(bool fail) { fail_ = fail; }
    void set_throw(std::string message) { throw_message_ = std::move(message); }

    [[nodiscard]] uint64_t create_count() const {
        return create_count_.load(std::memory_order_relaxed);
    }

private:
    std::shared_ptr<QueryGate> gate_;
    bool fail_ = false;
    std::string throw_message_;
    std::atomic<uint64_t> create_count_{0};
};

} // namespace sqlsandbox::testing
