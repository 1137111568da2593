#pragma once

#include "marketlink/error.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace marketlink {

/// Client-generated id linking a subscription to its acks and events
using CorrelationId = std::uint64_t;

/// Streaming channels available for subscription
enum class Channel : std::uint8_t {
	Ticker,
	OrderbookDelta,
	Trade,
	Fill,
	MarketLifecycle,
	MarketPositions
};

/// Convert channel to string for the wire
[[nodiscard]] constexpr std::string_view to_string(Channel ch) noexcept {
	switch (ch) {
		case Channel::Ticker:
			return "ticker";
		case Channel::OrderbookDelta:
			return "orderbook_delta";
		case Channel::Trade:
			return "trade";
		case Channel::Fill:
			return "fill";
		case Channel::MarketLifecycle:
			return "market_lifecycle_v2";
		case Channel::MarketPositions:
			return "market_positions";
	}
	return "ticker";
}

/// Channel a subscription name or a data message type belongs to
///
/// Several message types share one channel: an orderbook_delta
/// subscription receives orderbook_snapshot and orderbook_delta messages.
[[nodiscard]] std::optional<Channel> channel_from_string(std::string_view name) noexcept;

/// Add or remove markets on an existing subscription
enum class MarketUpdate : std::uint8_t { Add, Remove };

/// Desired subscription state, replayed after every reconnect
struct SubscriptionIntent {
	CorrelationId correlation_id{0};
	Channel channel{Channel::Ticker};
	std::vector<std::string> market_tickers; // empty means every market

	bool operator==(const SubscriptionIntent&) const = default;
};

/// Data or acknowledgement delivered to a subscriber
struct StreamMessage {
	CorrelationId correlation_id{0};
	Channel channel{Channel::Ticker};
	std::string type;                         // wire type, e.g. "ticker", "subscribed"
	std::optional<std::int64_t> sid;          // server subscription id
	std::optional<std::int64_t> seq;
	std::optional<std::string> market_ticker;
	std::string payload;                      // raw JSON text of "msg", may be empty
};

/// Error delivered on the stream's error channel
struct StreamError {
	ErrorCode code{ErrorCode::Unknown};
	std::string message;
	std::optional<CorrelationId> correlation_id;
	std::int64_t exchange_code{0}; // code reported by the exchange, 0 for local errors
};

using MessageCallback = std::function<void(const StreamMessage&)>;

using ErrorCallback = std::function<void(const StreamError&)>;

/// In-memory table of desired subscriptions
///
/// Entries are kept in insertion order and survive reconnects; only the
/// server-assigned sid bindings are dropped when a socket goes away.
/// Correlation ids and command ids come from one counter and are never
/// reused. All members are thread-safe.
class SubscriptionRegistry {
public:
	SubscriptionRegistry() = default;

	SubscriptionRegistry(const SubscriptionRegistry&) = delete;
	SubscriptionRegistry& operator=(const SubscriptionRegistry&) = delete;

	/// Record a new intent
	/// @return its correlation id, or InvalidRequest once closed
	[[nodiscard]] Result<CorrelationId> add(Channel channel, std::vector<std::string> market_tickers,
											MessageCallback callback = {});

	/// Drop an intent. Unknown or already removed ids are a no-op.
	/// @return true if an entry was removed
	bool remove(CorrelationId id);

	/// Every intent, in insertion order
	[[nodiscard]] std::vector<SubscriptionIntent> snapshot() const;

	[[nodiscard]] std::optional<SubscriptionIntent> find(CorrelationId id) const;

	[[nodiscard]] bool contains(CorrelationId id) const;

	/// Subscriber callback for an id, empty if unknown
	[[nodiscard]] MessageCallback callback_for(CorrelationId id) const;

	/// Subscribers of a channel kind, in insertion order
	[[nodiscard]] std::vector<std::pair<CorrelationId, MessageCallback>>
	subscribers_of(Channel channel) const;

	/// Change the market set of a market-scoped intent
	/// @return InvalidRequest for an unknown id, an intent covering every
	///         market, or a removal that would leave no markets
	[[nodiscard]] Result<void> update_markets(CorrelationId id, MarketUpdate action,
											  const std::vector<std::string>& market_tickers);

	/// Associate a server sid with an intent
	/// @return false if the id is unknown
	bool bind_sid(CorrelationId id, std::int64_t sid);

	void unbind_sid(std::int64_t sid);

	[[nodiscard]] std::optional<CorrelationId> resolve_sid(std::int64_t sid) const;

	[[nodiscard]] std::optional<std::int64_t> sid_of(CorrelationId id) const;

	/// Forget all sid bindings, keeping the intents
	void clear_bindings();

	/// Id for a command that is not a subscription (unsubscribe, update, custom)
	[[nodiscard]] CorrelationId next_command_id();

	/// Drop every intent and refuse further adds
	void close();

	[[nodiscard]] bool is_closed() const;

	[[nodiscard]] std::size_t size() const;

private:
	struct Entry {
		SubscriptionIntent intent;
		MessageCallback callback;
		std::optional<std::int64_t> sid;
	};

	mutable std::mutex mutex_;
	// Ids are monotonic, so key order is insertion order
	std::map<CorrelationId, Entry> entries_;
	std::unordered_map<std::int64_t, CorrelationId> sid_index_;
	CorrelationId next_id_{1};
	bool closed_{false};
};

} // namespace marketlink
