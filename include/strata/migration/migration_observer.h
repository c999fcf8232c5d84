#pragma once

#include <functional>
#include <string>

namespace strata::migration {

enum class MigrationEventType {
    Pending,     ///< Dry run: migration would be applied or stamped
    Statement,   ///< Dry run: one up statement of a pending migration
    Applying,    ///< About to run the up action
    Applied,     ///< Up action succeeded and the ledger row was written
    Stamped,     ///< Ledger row written without running the up action
    RollingBack, ///< About to run the down action
    RolledBack,  ///< Down action succeeded and the ledger row was deleted
    Failed       ///< The step named failed; detail carries the error
};

constexpr const char* migrationEventTypeToString(MigrationEventType type) {
    switch (type) {
        case MigrationEventType::Pending:
            return "pending";
        case MigrationEventType::Statement:
            return "statement";
        case MigrationEventType::Applying:
            return "applying";
        case MigrationEventType::Applied:
            return "applied";
        case MigrationEventType::Stamped:
            return "stamped";
        case MigrationEventType::RollingBack:
            return "rolling back";
        case MigrationEventType::RolledBack:
            return "rolled back";
        case MigrationEventType::Failed:
            return "failed";
    }
    return "unknown";
}

struct MigrationEvent {
    MigrationEventType type;
    std::string name;
    std::string detail; ///< Statement text or error message, when relevant
    bool dryRun = false;
};

/**
 * @brief Receives progress events from the sequential runner
 */
class IMigrationObserver {
public:
    virtual ~IMigrationObserver() = default;

    virtual void onEvent(const MigrationEvent& event) = 0;
};

/**
 * @brief Publishes runner events to the log
 */
class LoggingMigrationObserver : public IMigrationObserver {
public:
    void onEvent(const MigrationEvent& event) override;
};

/**
 * @brief Forwards events to a callable, convenient for tests and CLIs
 */
class CallbackMigrationObserver : public IMigrationObserver {
public:
    using Callback = std::function<void(const MigrationEvent&)>;

    explicit CallbackMigrationObserver(Callback callback) : callback_(std::move(callback)) {}

    void onEvent(const MigrationEvent& event) override {
        if (callback_) {
            callback_(event);
        }
    }

private:
    Callback callback_;
};

} // namespace strata::migration
