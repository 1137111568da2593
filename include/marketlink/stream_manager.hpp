#pragma once

/// @file stream_manager.hpp
/// @brief Persistent authenticated streaming connection with subscription replay

#include "marketlink/clock.hpp"
#include "marketlink/config.hpp"
#include "marketlink/error.hpp"
#include "marketlink/retry.hpp"
#include "marketlink/signer.hpp"
#include "marketlink/stream_transport.hpp"
#include "marketlink/subscription.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace marketlink {

/// Connection lifecycle
///
/// Disconnected -> Connecting -> Connected -> (Reconnecting -> Connecting)* -> Closed
enum class ConnectionState : std::uint8_t {
	Disconnected,
	Connecting,
	Connected,
	Reconnecting,
	Closed
};

[[nodiscard]] constexpr std::string_view to_string(ConnectionState state) noexcept {
	switch (state) {
		case ConnectionState::Disconnected:
			return "disconnected";
		case ConnectionState::Connecting:
			return "connecting";
		case ConnectionState::Connected:
			return "connected";
		case ConnectionState::Reconnecting:
			return "reconnecting";
		case ConnectionState::Closed:
			return "closed";
	}
	return "unknown";
}

/// Transition table of the connection state machine
[[nodiscard]] constexpr bool is_valid_transition(ConnectionState from, ConnectionState to) noexcept {
	using S = ConnectionState;
	switch (from) {
		case S::Disconnected:
			return to == S::Connecting || to == S::Closed;
		case S::Connecting:
			return to == S::Connected || to == S::Reconnecting || to == S::Closed;
		case S::Connected:
			return to == S::Reconnecting || to == S::Closed;
		case S::Reconnecting:
			return to == S::Connecting || to == S::Closed;
		case S::Closed:
			return false;
	}
	return false;
}

/// Streaming connection configuration
struct StreamConfig {
	std::string url{"wss://demo-api.kalshi.co/trade-api/ws/v2"};
	std::string sign_path{"/trade-api/ws/v2"}; // signed as GET on every handshake
	std::chrono::milliseconds heartbeat_interval{10000}; // ping cadence
	std::chrono::milliseconds heartbeat_timeout{30000};  // silence before reconnecting
	std::chrono::milliseconds poll_interval{50};
	RetryPolicy backoff{.max_attempts = 0,
						.initial_delay = std::chrono::milliseconds{500},
						.max_delay = std::chrono::milliseconds{30000},
						.backoff_multiplier = 2.0,
						.jitter_factor = 0.2};
	std::uint32_t max_handshake_attempts{0}; // consecutive failures allowed, 0 = unlimited

	[[nodiscard]] static StreamConfig for_environment(Environment env) {
		Endpoints endpoints = endpoints_for(env);
		StreamConfig config;
		config.url = endpoints.ws_base_url + endpoints.ws_path;
		config.sign_path = endpoints.ws_path;
		return config;
	}
};

/// Frame counters since construction
struct StreamStats {
	std::uint64_t frames_sent{0};
	std::uint64_t frames_received{0};
	std::uint64_t frames_dropped{0}; // malformed, unknown id or no subscriber
	std::uint64_t replays{0};        // subscribe commands re-sent after a connect
	std::uint64_t reconnects{0};
};

using StateCallback = std::function<void(ConnectionState from, ConnectionState to)>;

/// Keeps one authenticated stream alive and replays subscriptions on every connect
///
/// A dedicated thread owns the transport and runs the state machine. User
/// callbacks (messages, errors, state changes) run on a separate dispatcher
/// thread in the order they were produced. Subscriptions live in the registry
/// until unsubscribed or closed, and are re-sent exactly once, in insertion
/// order, after each successful handshake.
///
/// Example:
/// @code
///   auto signer = std::make_shared<Signer>(std::move(*Signer::from_pem(key_id, pem)));
///   StreamConnectionManager stream(signer, std::make_shared<ClockGuard>(),
///                                  std::make_unique<LwsTransport>(),
///                                  StreamConfig::for_environment(Environment::Demo));
///   stream.on_error([](const StreamError& e) { spdlog::error("{}", e.message); });
///   auto id = stream.subscribe(Channel::Ticker, {"X"}, [](const StreamMessage& m) { ... });
///   stream.start();
/// @endcode
class StreamConnectionManager {
public:
	StreamConnectionManager(std::shared_ptr<const Signer> signer, std::shared_ptr<ClockGuard> clock,
							std::unique_ptr<StreamTransport> transport, StreamConfig config);
	~StreamConnectionManager();

	StreamConnectionManager(const StreamConnectionManager&) = delete;
	StreamConnectionManager& operator=(const StreamConnectionManager&) = delete;
	StreamConnectionManager(StreamConnectionManager&&) noexcept;
	StreamConnectionManager& operator=(StreamConnectionManager&&) noexcept;

	/// Start the connection thread
	/// @return InvalidRequest if already started or closed
	[[nodiscard]] Result<void> start();

	/// Stop the thread, release the socket, drain callbacks, close the registry
	void close();

	/// Record a subscription; sent now if connected, otherwise on the next connect
	[[nodiscard]] Result<CorrelationId> subscribe(Channel channel,
												  std::vector<std::string> market_tickers,
												  MessageCallback callback);

	/// Drop a subscription. Unknown or already removed ids are a no-op.
	void unsubscribe(CorrelationId id);

	/// Add or remove markets on a subscription, live and for later replays
	[[nodiscard]] Result<void> update_markets(CorrelationId id, MarketUpdate action,
											  const std::vector<std::string>& market_tickers);

	/// Send a raw command with a freshly allocated id
	/// @param params_json JSON object for "params"
	/// @return the command id, or NetworkError when not connected
	[[nodiscard]] Result<CorrelationId> send_custom(std::string_view cmd, std::string_view params_json);

	/// Set before start(); later changes apply to errors raised afterwards
	void on_error(ErrorCallback callback);

	void on_state_change(StateCallback callback);

	[[nodiscard]] ConnectionState state() const;

	/// Block until the state is reached or the timeout expires
	[[nodiscard]] bool wait_for_state(ConnectionState target, std::chrono::milliseconds timeout) const;

	[[nodiscard]] StreamStats stats() const;

	[[nodiscard]] const SubscriptionRegistry& registry() const noexcept;

	[[nodiscard]] const StreamConfig& config() const noexcept;

private:
	struct Impl;
	std::unique_ptr<Impl> impl_;
};

} // namespace marketlink
