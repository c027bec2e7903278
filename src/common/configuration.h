#ifndef FIREHOSE_CONFIGURATION_H_
#define FIREHOSE_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>
#include <cstddef>

#include "common/config.h"

namespace YAML {
class Node;
}

namespace Firehose {

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
struct FirehoseConfig {
    // Ingestion service
    struct Ingest {
        ConfigValue<std::string> host{"0.0.0.0", "FIREHOSE_INGEST_HOST"};
        ConfigValue<int> port{kDefaultPort, "FIREHOSE_INGEST_PORT"};
        ConfigValue<int> max_clients{kDefaultMaxClients, "FIREHOSE_MAX_CLIENTS"};
        // 0 selects min(core count, max_clients)
        ConfigValue<int> num_workers{0, "FIREHOSE_NUM_WORKERS"};
        ConfigValue<size_t> read_size{kReadSize, "FIREHOSE_READ_SIZE"};
        ConfigValue<size_t> report_interval{kReportInterval, "FIREHOSE_REPORT_INTERVAL"};
        ConfigValue<int> socket_buffer_bytes{kSocketBufferBytes, "FIREHOSE_SOCKET_BUFFER_BYTES"};
        ConfigValue<int> accept_retry_us{static_cast<int>(kAcceptRetryUs), "FIREHOSE_ACCEPT_RETRY_US"};
        ConfigValue<int> queue_poll_ms{static_cast<int>(kQueuePollMs), "FIREHOSE_QUEUE_POLL_MS"};
        ConfigValue<int> join_timeout_ms{static_cast<int>(kWorkerJoinTimeoutMs), "FIREHOSE_JOIN_TIMEOUT_MS"};
        ConfigValue<size_t> stats_channel_capacity{kStatsChannelCapacity, "FIREHOSE_STATS_CHANNEL_CAPACITY"};
    } ingest;

    // Paced transmitters
    struct Client {
        ConfigValue<std::string> host{"localhost", "FIREHOSE_CLIENT_HOST"};
        ConfigValue<int> port{kDefaultPort, "FIREHOSE_CLIENT_PORT"};
        ConfigValue<int> num_clients{1, "FIREHOSE_NUM_CLIENTS"};
        ConfigValue<double> target_rate{kDefaultTargetRate, "FIREHOSE_TARGET_RATE"};
        ConfigValue<double> duration_s{kDefaultDurationSec, "FIREHOSE_DURATION"};
        ConfigValue<size_t> unit_size{kUnitSize, "FIREHOSE_UNIT_SIZE"};
        ConfigValue<size_t> batch_size{kBatchSize, "FIREHOSE_BATCH_SIZE"};
        ConfigValue<int> max_send_retries{kMaxSendRetries, "FIREHOSE_MAX_SEND_RETRIES"};
        ConfigValue<int> send_retry_pause_us{static_cast<int>(kSendRetryPauseUs), "FIREHOSE_SEND_RETRY_PAUSE_US"};
        ConfigValue<int> stop_timeout_ms{static_cast<int>(kTransmitterStopTimeoutMs), "FIREHOSE_CLIENT_STOP_TIMEOUT_MS"};
        ConfigValue<int> startup_delay_s{0, "FIREHOSE_CLIENT_STARTUP_DELAY"};

        struct Connect {
            ConfigValue<int> max_attempts{kConnectMaxAttempts, "FIREHOSE_CONNECT_MAX_ATTEMPTS"};
            ConfigValue<int> initial_backoff_ms{static_cast<int>(kConnectInitialBackoffMs), "FIREHOSE_CONNECT_INITIAL_BACKOFF_MS"};
            ConfigValue<double> backoff_multiplier{kConnectBackoffMultiplier, "FIREHOSE_CONNECT_BACKOFF_MULTIPLIER"};
            ConfigValue<int> max_backoff_ms{static_cast<int>(kConnectMaxBackoffMs), "FIREHOSE_CONNECT_MAX_BACKOFF_MS"};
            ConfigValue<int> timeout_ms{static_cast<int>(kConnectTimeoutMs), "FIREHOSE_CONNECT_TIMEOUT_MS"};
        } connect;
    } client;

    // Result recording
    struct Results {
        ConfigValue<bool> record{false, "FIREHOSE_RECORD_RESULTS"};
        ConfigValue<std::string> dir{"./data/", "FIREHOSE_DATA_DIR"};
    } results;
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
    const FirehoseConfig& config() const { return config_; }
    FirehoseConfig& config() { return config_; }

    // Restore compiled-in defaults (tests)
    void reset() { config_ = FirehoseConfig(); validation_errors_.clear(); }

    // Helper methods for common access patterns
    int getIngestPort() const { return config_.ingest.port.get(); }
    int getMaxClients() const { return config_.ingest.max_clients.get(); }
    int getNumWorkers() const;
    size_t getHandoffQueueCapacity() const {
        return 2 * static_cast<size_t>(config_.ingest.max_clients.get());
    }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    FirehoseConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& root);
};

// Global accessor
const Configuration& GetConfig();

// `requested` workers, or one per core capped at max_clients when requested <= 0
int ResolveWorkerCount(int requested, int max_clients);

// 1..65535; 0 too when the OS may pick an ephemeral port
bool IsValidPort(int port, bool allow_ephemeral);

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Firehose

#endif // FIREHOSE_CONFIGURATION_H_
