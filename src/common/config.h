#ifndef FIREHOSE_COMMON_CONFIG_H_
#define FIREHOSE_COMMON_CONFIG_H_

#include <cstddef>
#include <cstdint>

namespace Firehose {

/// Ingestion service defaults
/// Listen port of the ingestion service
constexpr int kDefaultPort = 8888;
/// Maximum simultaneous connections; also the listen backlog
constexpr int kDefaultMaxClients = 10;
/// Bytes requested per read. One read is one "packet" on the server side.
constexpr size_t kReadSize = 32;
/// A Stats Report is emitted every kReportInterval received packets
constexpr uint64_t kReportInterval = 100;
/// Receive/send buffer size applied to listener and accepted sockets
constexpr int kSocketBufferBytes = 128 * 1024;
/// Accept loop pause when no connection is pending
constexpr int64_t kAcceptRetryUs = 1000;
/// Worker and aggregator queue poll timeout
constexpr int64_t kQueuePollMs = 1000;
/// Bounded wait for workers at shutdown before force-closing connections
constexpr int64_t kWorkerJoinTimeoutMs = 5000;
/// Capacity of the stats-report channel
constexpr size_t kStatsChannelCapacity = 1UL << 16;

/// Paced transmitter defaults
constexpr double kDefaultTargetRate = 10000.0;
constexpr double kDefaultDurationSec = 60.0;
/// Payload bytes per unit on the client side
constexpr size_t kUnitSize = 16;
/// Units per batch (12,864 bytes per batch with 16 byte units)
constexpr size_t kBatchSize = 804;
/// Would-block retries allowed per batch before the batch fails
constexpr int kMaxSendRetries = 3;
constexpr int64_t kSendRetryPauseUs = 1000;
/// Floor of the pacing sleep
constexpr int64_t kMinPacingSleepUs = 100;
/// Bounded wait for a transmitter loop on Stop()
constexpr int64_t kTransmitterStopTimeoutMs = 2000;
/// Log send exceptions once every kErrorLogEvery counted errors
constexpr uint64_t kErrorLogEvery = 1000;

/// Connection establishment
constexpr int kConnectMaxAttempts = 10;
constexpr int64_t kConnectInitialBackoffMs = 500;
constexpr double kConnectBackoffMultiplier = 1.5;
constexpr int64_t kConnectMaxBackoffMs = 2000;
constexpr int64_t kConnectTimeoutMs = 2000;

} // namespace Firehose

#endif // FIREHOSE_COMMON_CONFIG_H_
