#ifndef FIREHOSE_TRANSPORT_CONNECTOR_H_
#define FIREHOSE_TRANSPORT_CONNECTOR_H_

#include <chrono>
#include <memory>
#include <string>

#include "common/cancellation.h"
#include "common/config.h"
#include "transport_channel.h"

namespace Firehose {

/**
 * Bounded exponential backoff for connection establishment.
 * Delay before attempt k+1 is min(initial * multiplier^k, max_backoff).
 */
struct RetryPolicy {
	int max_attempts = kConnectMaxAttempts;
	std::chrono::milliseconds initial_backoff{kConnectInitialBackoffMs};
	double multiplier = kConnectBackoffMultiplier;
	std::chrono::milliseconds max_backoff{kConnectMaxBackoffMs};
	std::chrono::milliseconds connect_timeout{kConnectTimeoutMs};

	// Built from Configuration client.connect.*
	static RetryPolicy FromConfig();

	std::chrono::milliseconds NextBackoff(std::chrono::milliseconds current) const;
};

/**
 * Establishes Transport Channels to one fixed target. Used at transmitter
 * start and again for every reconnect.
 */
class Connector {
public:
	virtual ~Connector() = default;

	/**
	 * Runs one full connect sequence (all retries included).
	 * @return connected channel, or nullptr when the sequence failed
	 */
	virtual std::unique_ptr<TransportChannel> Connect() = 0;

	virtual std::string target() const = 0;
};

class TcpConnector : public Connector {
public:
	TcpConnector(std::string host, uint16_t port, RetryPolicy policy,
			StopToken stop, int socket_buffer_bytes = kSocketBufferBytes);

	std::unique_ptr<TransportChannel> Connect() override;

	std::string target() const override { return host_ + ":" + std::to_string(port_); }

	// Attempts used by the most recent Connect()
	int last_attempts() const { return last_attempts_; }

private:
	enum class AttemptResult { kConnected, kRetryable, kFatal };

	AttemptResult ConnectOnce(ScopedFd& out, int& err);

	// errno values that end the sequence without further attempts
	static bool IsFatalConnectError(int err);

	std::string host_;
	uint16_t port_;
	RetryPolicy policy_;
	StopToken stop_;
	int socket_buffer_bytes_;
	int last_attempts_ = 0;
};

} // namespace Firehose

#endif // FIREHOSE_TRANSPORT_CONNECTOR_H_
