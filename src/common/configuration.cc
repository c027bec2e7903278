#include "configuration.h"
#include <algorithm>
#include <cstdlib>
#include <thread>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Firehose {

// Global function to get configuration instance
const Configuration& GetConfig() {
    return Configuration::getInstance();
}

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoull(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stod(env_val);
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

int ResolveWorkerCount(int requested, int max_clients) {
    if (requested > 0) {
        return requested;
    }
    int cores = static_cast<int>(std::thread::hardware_concurrency());
    if (cores <= 0) {
        cores = 1;
    }
    return std::max(1, std::min(cores, max_clients));
}

bool IsValidPort(int port, bool allow_ephemeral) {
    return port >= (allow_ephemeral ? 0 : 1) && port <= 65535;
}

int Configuration::getNumWorkers() const {
    return ResolveWorkerCount(config_.ingest.num_workers.get(), config_.ingest.max_clients.get());
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["firehose"]) {
        return;
    }
    auto root = yaml["firehose"];

    // Ingest
    if (root["ingest"]) {
        auto ingest = root["ingest"];
        if (ingest["host"]) config_.ingest.host.set(ingest["host"].as<std::string>());
        if (ingest["port"]) config_.ingest.port.set(ingest["port"].as<int>());
        if (ingest["max_clients"]) config_.ingest.max_clients.set(ingest["max_clients"].as<int>());
        if (ingest["num_workers"]) config_.ingest.num_workers.set(ingest["num_workers"].as<int>());
        if (ingest["read_size"]) config_.ingest.read_size.set(ingest["read_size"].as<size_t>());
        if (ingest["report_interval"]) config_.ingest.report_interval.set(ingest["report_interval"].as<size_t>());
        if (ingest["socket_buffer_bytes"]) config_.ingest.socket_buffer_bytes.set(ingest["socket_buffer_bytes"].as<int>());
        if (ingest["accept_retry_us"]) config_.ingest.accept_retry_us.set(ingest["accept_retry_us"].as<int>());
        if (ingest["queue_poll_ms"]) config_.ingest.queue_poll_ms.set(ingest["queue_poll_ms"].as<int>());
        if (ingest["join_timeout_ms"]) config_.ingest.join_timeout_ms.set(ingest["join_timeout_ms"].as<int>());
        if (ingest["stats_channel_capacity"]) config_.ingest.stats_channel_capacity.set(ingest["stats_channel_capacity"].as<size_t>());
    }

    // Client
    if (root["client"]) {
        auto client = root["client"];
        if (client["host"]) config_.client.host.set(client["host"].as<std::string>());
        if (client["port"]) config_.client.port.set(client["port"].as<int>());
        if (client["num_clients"]) config_.client.num_clients.set(client["num_clients"].as<int>());
        if (client["target_rate"]) config_.client.target_rate.set(client["target_rate"].as<double>());
        if (client["duration_s"]) config_.client.duration_s.set(client["duration_s"].as<double>());
        if (client["unit_size"]) config_.client.unit_size.set(client["unit_size"].as<size_t>());
        if (client["batch_size"]) config_.client.batch_size.set(client["batch_size"].as<size_t>());
        if (client["max_send_retries"]) config_.client.max_send_retries.set(client["max_send_retries"].as<int>());
        if (client["send_retry_pause_us"]) config_.client.send_retry_pause_us.set(client["send_retry_pause_us"].as<int>());
        if (client["stop_timeout_ms"]) config_.client.stop_timeout_ms.set(client["stop_timeout_ms"].as<int>());
        if (client["startup_delay_s"]) config_.client.startup_delay_s.set(client["startup_delay_s"].as<int>());

        if (client["connect"]) {
            auto connect = client["connect"];
            if (connect["max_attempts"]) config_.client.connect.max_attempts.set(connect["max_attempts"].as<int>());
            if (connect["initial_backoff_ms"]) config_.client.connect.initial_backoff_ms.set(connect["initial_backoff_ms"].as<int>());
            if (connect["backoff_multiplier"]) config_.client.connect.backoff_multiplier.set(connect["backoff_multiplier"].as<double>());
            if (connect["max_backoff_ms"]) config_.client.connect.max_backoff_ms.set(connect["max_backoff_ms"].as<int>());
            if (connect["timeout_ms"]) config_.client.connect.timeout_ms.set(connect["timeout_ms"].as<int>());
        }
    }

    // Results
    if (root["results"]) {
        auto results = root["results"];
        if (results["record"]) config_.results.record.set(results["record"].as<bool>());
        if (results["dir"]) config_.results.dir.set(results["dir"].as<std::string>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        applyYAML(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        applyYAML(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    // Port 0 lets the kernel pick (tests)
    if (!IsValidPort(config_.ingest.port.get(), true)) {
        validation_errors_.push_back("Ingest port must be between 0 and 65535");
    }
    if (!IsValidPort(config_.client.port.get(), false)) {
        validation_errors_.push_back("Client port must be between 1 and 65535");
    }

    if (config_.ingest.max_clients.get() < 1) {
        validation_errors_.push_back("Max clients must be at least 1");
    }
    if (config_.ingest.num_workers.get() < 0) {
        validation_errors_.push_back("Number of workers cannot be negative");
    }
    if (config_.ingest.read_size.get() == 0) {
        validation_errors_.push_back("Read size must be positive");
    }
    if (config_.ingest.report_interval.get() == 0) {
        validation_errors_.push_back("Report interval must be positive");
    }
    if (config_.ingest.stats_channel_capacity.get() == 0) {
        validation_errors_.push_back("Stats channel capacity must be positive");
    }

    if (config_.client.num_clients.get() < 1) {
        validation_errors_.push_back("Number of clients must be at least 1");
    }
    if (config_.client.target_rate.get() <= 0.0) {
        validation_errors_.push_back("Target rate must be positive");
    }
    if (config_.client.duration_s.get() <= 0.0) {
        validation_errors_.push_back("Duration must be positive");
    }
    if (config_.client.unit_size.get() == 0 || config_.client.batch_size.get() == 0) {
        validation_errors_.push_back("Unit size and batch size must be positive");
    }
    if (config_.client.max_send_retries.get() < 1) {
        validation_errors_.push_back("Max send retries must be at least 1");
    }
    if (config_.client.connect.max_attempts.get() < 1) {
        validation_errors_.push_back("Connect attempts must be at least 1");
    }
    if (config_.client.connect.backoff_multiplier.get() < 1.0) {
        validation_errors_.push_back("Backoff multiplier must be at least 1.0");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Firehose
