#include "db_connection_manager.h"

#include <spdlog/spdlog.h>

#include "obs/metrics.h"

namespace claimscan {

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
PooledDbConnectionManager::PooledDbConnectionManager(std::string conn_str,
                                                     size_t pool_size,
                                                     std::chrono::milliseconds acquire_timeout,
                                                     ConnectionInitializer initializer)
    : conn_str_(std::move(conn_str)),
      pool_size_(pool_size),
      acquire_timeout_(acquire_timeout),
      initializer_(std::move(initializer)) {
    spdlog::info("Initializing DB connection pool with size {}", pool_size_);
}

PooledDbConnectionManager::~PooledDbConnectionManager() {
    std::unique_lock<std::mutex> lock(mutex_);
    shutdown_ = true;
    while (!pool_.empty()) {
        pool_.pop();
    }
    cv_.notify_all();
}

auto PooledDbConnectionManager::GetConnection() -> DbConnectionPtr {
    std::unique_lock<std::mutex> lock(mutex_);

    if (!cv_.wait_for(lock, acquire_timeout_, [this]() {
        return !pool_.empty() || in_use_count_ < pool_size_ || shutdown_;
    })) {
        total_timeouts_++;
        obs::EmitCounter("db_pool_timeouts_total", 1, "timeouts", "db_pool");
        spdlog::error("Timeout acquiring DB connection after {}ms. Pool size: {}, In-use: {}",
                      acquire_timeout_.count(), pool_size_, in_use_count_);
        throw std::runtime_error("DB connection acquisition timeout");
    }

    if (shutdown_) {
        throw std::runtime_error("DB connection manager is shutting down");
    }

    std::unique_ptr<pqxx::connection> conn;
    if (!pool_.empty()) {
        conn = std::move(pool_.front());
        pool_.pop();
    } else {
        try {
            conn = std::make_unique<pqxx::connection>(conn_str_);
            if (initializer_) {
                initializer_(*conn);
            }
        } catch (const std::exception& e) {
            spdlog::error("Failed to create new DB connection: {}", e.what());
            cv_.notify_one();
            throw;
        }
    }

    in_use_count_++;
    total_acquires_++;
    obs::EmitGauge("db_pool_in_use", static_cast<double>(in_use_count_), "connections", "db_pool");

    return DbConnectionPtr(conn.release(), [this](pqxx::connection* c) {
        this->ReleaseConnection(c);
    });
}

auto PooledDbConnectionManager::ReleaseConnection(pqxx::connection* conn) -> void {
    std::unique_lock<std::mutex> lock(mutex_);
    in_use_count_--;

    if (shutdown_ || !conn || !conn->is_open()) {
        if (conn && !conn->is_open()) {
            spdlog::warn("Dropping closed/broken DB connection");
        }
        delete conn;
        cv_.notify_one();
        return;
    }

    pool_.push(std::unique_ptr<pqxx::connection>(conn));
    cv_.notify_one();
}

auto PooledDbConnectionManager::GetStats() const -> PoolStats {
    std::unique_lock<std::mutex> lock(mutex_);
    return {
        pool_size_,
        in_use_count_,
        pool_.size(),
        total_acquires_,
        total_timeouts_
    };
}

} // namespace claimscan
