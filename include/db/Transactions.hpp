#pragma once

#include "db/Session.hpp"
#include "db/errors.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

namespace tfs::db {

class Transactions {
  public:
    static inline std::shared_ptr<SessionFactory> factory_;
    static inline config::RetryConfig policy_;

    static void init(std::shared_ptr<SessionFactory> factory, const config::RetryConfig& policy) {
        if (!factory) throw std::invalid_argument("Session factory cannot be null");
        factory_ = std::move(factory);
        policy_ = policy;
    }

    [[nodiscard]] static bool isInitialized() { return static_cast<bool>(factory_); }

    /// Serializable read-write unit of work, committed when func returns.
    /// func may run more than once: anything it generates is attempt-scoped.
    template <typename Func>
    static auto exec(const std::string& ctx, Func&& func) -> decltype(func(std::declval<Txn&>())) {
        return run(ctx, TxMode::ReadWrite, std::forward<Func>(func));
    }

    /// Snapshot read-only unit of work, never committed.
    template <typename Func>
    static auto read(const std::string& ctx, Func&& func) -> decltype(func(std::declval<Txn&>())) {
        return run(ctx, TxMode::ReadOnly, std::forward<Func>(func));
    }

  private:
    template <typename Func>
    static auto run(const std::string& ctx, const TxMode mode, Func&& func) -> decltype(func(std::declval<Txn&>())) {
        if (!factory_) throw std::runtime_error("Transactions not initialized!");

        for (unsigned int attempt = 1;; ++attempt) {
            try {
                log::Registry::db()->trace("[Transactions::run] Starting transaction: {} (attempt {})", ctx, attempt);
                const auto txn = factory_->begin(mode);

                if constexpr (std::is_void_v<decltype(func(*txn))>) {
                    func(*txn);
                    if (mode == TxMode::ReadWrite) txn->commit();
                    log::Registry::db()->trace("[Transactions::run] Transaction finished: {}", ctx);
                    return;
                } else {
                    auto result = func(*txn);
                    if (mode == TxMode::ReadWrite) txn->commit();
                    log::Registry::db()->trace("[Transactions::run] Transaction finished: {}", ctx);
                    return result;
                }
            } catch (const TransientError& e) {
                if (attempt >= policy_.max_attempts) {
                    log::Registry::db()->error("[Transactions::run] '{}' giving up after {} attempts: {}", ctx, attempt, e.what());
                    throw RetriesExhaustedError(ctx, attempt, e.what());
                }
                log::Registry::db()->warn("[Transactions::run] '{}' attempt {} failed, retrying: {}", ctx, attempt, e.what());
                backoff(attempt);
            }
        }
    }

    static void backoff(const unsigned int attempt) {
        if (policy_.initial_backoff_ms == 0) return;
        const unsigned int shift = std::min(attempt - 1, 16u);
        const auto delay = std::min<unsigned long long>(
            static_cast<unsigned long long>(policy_.initial_backoff_ms) << shift, policy_.max_backoff_ms);
        std::this_thread::sleep_for(std::chrono::milliseconds(delay));
    }
};

}
