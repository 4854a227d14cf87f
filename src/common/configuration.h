#ifndef WAITINGROOM_CONFIGURATION_H_
#define WAITINGROOM_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace WaitingRoom {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct WaitingRoomConfig {
    struct Event {
        // Partition key of the serving counter issuance log, also the identity checked on reset
        ConfigValue<std::string> event_id{"", "EVENT_ID"};
    } event;

    struct Reconciler {
        // Grace period in seconds before an unconsumed queue position may be expired
        ConfigValue<int64_t> queue_position_expiry_period{900, "QUEUE_POSITION_EXPIRY_PERIOD"};
        ConfigValue<bool> incr_svc_on_queue_pos_expiry{false, "INCR_SVC_ON_QUEUE_POS_EXPIRY"};
        ConfigValue<int64_t> interval_ms{5000, "WAITINGROOM_RECONCILE_INTERVAL_MS"};
    } reconciler;

    struct Tables {
        ConfigValue<std::string> token_table{"TokenTable", "TOKEN_TABLE"};
        ConfigValue<std::string> queue_position_entry_time_table{"QueuePositionEntryTime", "QUEUE_POSITION_ENTRYTIME_TABLE"};
        ConfigValue<std::string> serving_counter_issued_at_table{"ServingCounterIssuedAt", "SERVING_COUNTER_ISSUEDAT_TABLE"};
    } tables;

    struct Reset {
        ConfigValue<int64_t> table_poll_interval_ms{200, "WAITINGROOM_TABLE_POLL_INTERVAL_MS"};
        ConfigValue<int64_t> table_wait_timeout_ms{60000, "WAITINGROOM_TABLE_WAIT_TIMEOUT_MS"};
        // Deadline across the whole delete/recreate sequence of all three tables
        ConfigValue<int64_t> overall_timeout_ms{300000, "WAITINGROOM_RESET_TIMEOUT_MS"};
    } reset;

    struct Events {
        ConfigValue<std::string> event_bus_name{"default", "EVENT_BUS_NAME"};
        ConfigValue<std::string> source{"custom.waitingroom", "WAITINGROOM_EVENT_SOURCE"};
        ConfigValue<std::string> detail_type{"automatic_serving_counter_incr", "WAITINGROOM_EVENT_DETAIL_TYPE"};
    } events;

    struct Server {
        ConfigValue<std::string> listen_address{"0.0.0.0:50061", "WAITINGROOM_LISTEN_ADDRESS"};
    } server;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const WaitingRoomConfig& config() const { return config_; }
    WaitingRoomConfig& config() { return config_; }

    // Helper methods for common access patterns
    std::string getEventId() const { return config_.event.event_id.get(); }
    int64_t getExpiryPeriodSeconds() const { return config_.reconciler.queue_position_expiry_period.get(); }
    bool getIncrementOnExpiry() const { return config_.reconciler.incr_svc_on_queue_pos_expiry.get(); }

    // Drop every loaded value back to the compiled defaults
    void reset() { config_ = WaitingRoomConfig(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    WaitingRoomConfig config_;
    mutable std::vector<std::string> validation_errors_;
};

// Template specializations for getEnvValue
template<>
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace WaitingRoom

#endif // WAITINGROOM_CONFIGURATION_H_
