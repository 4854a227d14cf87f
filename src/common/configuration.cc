#include "configuration.h"
#include <algorithm>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace WaitingRoom {

namespace {

// Reads the "waitingroom:" subtree into config. Keys that are absent keep their current value.
void ApplyRoot(const YAML::Node& root, WaitingRoomConfig& config) {
    if (root["event"]) {
        auto event = root["event"];
        if (event["event_id"]) config.event.event_id.set(event["event_id"].as<std::string>());
    }

    if (root["reconciler"]) {
        auto reconciler = root["reconciler"];
        if (reconciler["queue_position_expiry_period"]) config.reconciler.queue_position_expiry_period.set(reconciler["queue_position_expiry_period"].as<int64_t>());
        if (reconciler["incr_svc_on_queue_pos_expiry"]) config.reconciler.incr_svc_on_queue_pos_expiry.set(reconciler["incr_svc_on_queue_pos_expiry"].as<bool>());
        if (reconciler["interval_ms"]) config.reconciler.interval_ms.set(reconciler["interval_ms"].as<int64_t>());
    }

    if (root["tables"]) {
        auto tables = root["tables"];
        if (tables["token_table"]) config.tables.token_table.set(tables["token_table"].as<std::string>());
        if (tables["queue_position_entry_time_table"]) config.tables.queue_position_entry_time_table.set(tables["queue_position_entry_time_table"].as<std::string>());
        if (tables["serving_counter_issued_at_table"]) config.tables.serving_counter_issued_at_table.set(tables["serving_counter_issued_at_table"].as<std::string>());
    }

    if (root["reset"]) {
        auto reset = root["reset"];
        if (reset["table_poll_interval_ms"]) config.reset.table_poll_interval_ms.set(reset["table_poll_interval_ms"].as<int64_t>());
        if (reset["table_wait_timeout_ms"]) config.reset.table_wait_timeout_ms.set(reset["table_wait_timeout_ms"].as<int64_t>());
        if (reset["overall_timeout_ms"]) config.reset.overall_timeout_ms.set(reset["overall_timeout_ms"].as<int64_t>());
    }

    if (root["events"]) {
        auto events = root["events"];
        if (events["event_bus_name"]) config.events.event_bus_name.set(events["event_bus_name"].as<std::string>());
        if (events["source"]) config.events.source.set(events["source"].as<std::string>());
        if (events["detail_type"]) config.events.detail_type.set(events["detail_type"].as<std::string>());
    }

    if (root["server"]) {
        auto server = root["server"];
        if (server["listen_address"]) config.server.listen_address.set(server["listen_address"].as<std::string>());
    }
}

} // namespace

// Template specializations for environment variable parsing
template<>
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return static_cast<int64_t>(std::stoll(env_val));
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(), ::tolower);
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        if (yaml["waitingroom"]) {
            ApplyRoot(yaml["waitingroom"], config_);
        } else {
            LOG(WARNING) << "Configuration file " << filename << " has no 'waitingroom' section";
        }
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file: " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        if (yaml["waitingroom"]) {
            ApplyRoot(yaml["waitingroom"], config_);
        }
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.event.event_id.get().empty()) {
        validation_errors_.push_back("Event id must be set (EVENT_ID)");
    }

    if (config_.reconciler.queue_position_expiry_period.get() <= 0) {
        validation_errors_.push_back("Queue position expiry period must be positive");
    }

    if (config_.reconciler.interval_ms.get() < 1) {
        validation_errors_.push_back("Reconcile interval must be at least 1ms");
    }

    int64_t poll_ms = config_.reset.table_poll_interval_ms.get();
    int64_t wait_ms = config_.reset.table_wait_timeout_ms.get();
    if (poll_ms < 1 || wait_ms < 1 || config_.reset.overall_timeout_ms.get() < 1) {
        validation_errors_.push_back("Reset poll interval and timeouts must be at least 1ms");
    } else if (poll_ms > wait_ms) {
        validation_errors_.push_back("Table poll interval cannot exceed the table wait timeout");
    }

    if (config_.tables.token_table.get().empty() ||
        config_.tables.queue_position_entry_time_table.get().empty() ||
        config_.tables.serving_counter_issued_at_table.get().empty()) {
        validation_errors_.push_back("Table names must not be empty");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace WaitingRoom
