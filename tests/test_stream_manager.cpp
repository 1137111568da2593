#include "marketlink/dispatcher.hpp"
#include "marketlink/json.hpp"
#include "marketlink/stream_manager.hpp"

#include "test_keys.hpp"
#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <openssl/evp.h>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace std::chrono_literals;
using marketlink::Channel;
using marketlink::ConnectionState;

namespace {

struct SentFrame {
	int connection;
	std::string text;
};

// Socket double. The manager thread calls the transport; tests inject events.
struct FakeStream {
	std::mutex mutex;
	std::condition_variable cv;
	std::deque<marketlink::Result<void>> open_script; // empty: open succeeds
	std::deque<marketlink::StreamEvent> inbound;
	std::vector<SentFrame> sent;
	marketlink::HeaderList last_headers;
	std::string last_url;
	int opens{0};
	int connections{0};
	int pings{0};
	bool connected{false};
	bool answer_pings{true};
	bool auto_ack{false};
	std::int64_t next_sid{100};

	void inject(marketlink::StreamEvent event) {
		{
			std::lock_guard lock(mutex);
			inbound.push_back(std::move(event));
		}
		cv.notify_all();
	}

	void inject_frame(std::string text) { inject({marketlink::StreamEvent::Kind::Frame, std::move(text)}); }

	void drop_connection() { inject({marketlink::StreamEvent::Kind::Closed, "reset by peer"}); }

	std::vector<SentFrame> frames() {
		std::lock_guard lock(mutex);
		return sent;
	}

	// Frames of one connection with the given command
	std::vector<std::string> commands(int connection, const std::string& cmd) {
		std::vector<std::string> out;
		for (const SentFrame& frame : frames()) {
			if (frame.connection == connection && marketlink::json::get_string(frame.text, "cmd") == cmd) {
				out.push_back(frame.text);
			}
		}
		return out;
	}

	int connection_count() {
		std::lock_guard lock(mutex);
		return connections;
	}
};

class FakeStreamTransport final : public marketlink::StreamTransport {
public:
	explicit FakeStreamTransport(std::shared_ptr<FakeStream> state) : state_(std::move(state)) {}

	marketlink::Result<void> open(const std::string& url, const marketlink::HeaderList& headers) override {
		std::lock_guard lock(state_->mutex);
		++state_->opens;
		state_->last_url = url;
		state_->last_headers = headers;
		if (!state_->open_script.empty()) {
			marketlink::Result<void> scripted = std::move(state_->open_script.front());
			state_->open_script.pop_front();
			if (!scripted) {
				return scripted;
			}
		}
		++state_->connections;
		state_->connected = true;
		state_->inbound.clear();
		return {};
	}

	marketlink::Result<void> send(const std::string& frame) override {
		std::lock_guard lock(state_->mutex);
		if (!state_->connected) {
			return std::unexpected(marketlink::Error::network("Not connected"));
		}
		state_->sent.push_back({state_->connections, frame});
		if (state_->auto_ack && marketlink::json::get_string(frame, "cmd") == "subscribe") {
			std::int64_t id = marketlink::json::get_int(frame, "id").value_or(0);
			state_->inbound.push_back({marketlink::StreamEvent::Kind::Frame,
									   R"({"id":)" + std::to_string(id) +
										   R"(,"type":"subscribed","msg":{"channel":"ticker","sid":)" +
										   std::to_string(state_->next_sid++) + "}}"});
			state_->cv.notify_all();
		}
		return {};
	}

	marketlink::Result<void> ping() override {
		std::lock_guard lock(state_->mutex);
		if (!state_->connected) {
			return std::unexpected(marketlink::Error::network("Not connected"));
		}
		++state_->pings;
		if (state_->answer_pings) {
			state_->inbound.push_back({marketlink::StreamEvent::Kind::Pong, {}});
		}
		return {};
	}

	marketlink::StreamEvent poll(std::chrono::milliseconds timeout) override {
		std::unique_lock lock(state_->mutex);
		state_->cv.wait_for(lock, timeout, [this] { return !state_->inbound.empty(); });
		if (state_->inbound.empty()) {
			return {marketlink::StreamEvent::Kind::Idle, {}};
		}
		marketlink::StreamEvent event = std::move(state_->inbound.front());
		state_->inbound.pop_front();
		if (event.kind == marketlink::StreamEvent::Kind::Closed) {
			state_->connected = false;
		}
		return event;
	}

	void close() override {
		std::lock_guard lock(state_->mutex);
		state_->connected = false;
		state_->inbound.clear();
	}

private:
	std::shared_ptr<FakeStream> state_;
};

struct Inbox {
	std::mutex mutex;
	std::vector<marketlink::StreamMessage> messages;

	marketlink::MessageCallback callback() {
		return [this](const marketlink::StreamMessage& msg) {
			std::lock_guard lock(mutex);
			messages.push_back(msg);
		};
	}

	std::vector<marketlink::StreamMessage> of_type(const std::string& type) {
		std::lock_guard lock(mutex);
		std::vector<marketlink::StreamMessage> out;
		for (const auto& msg : messages) {
			if (msg.type == type) {
				out.push_back(msg);
			}
		}
		return out;
	}

	std::size_t size() {
		std::lock_guard lock(mutex);
		return messages.size();
	}
};

struct ErrorLog {
	std::mutex mutex;
	std::vector<marketlink::StreamError> errors;

	marketlink::ErrorCallback callback() {
		return [this](const marketlink::StreamError& error) {
			std::lock_guard lock(mutex);
			errors.push_back(error);
		};
	}

	std::size_t size() {
		std::lock_guard lock(mutex);
		return errors.size();
	}
};

bool wait_until(const std::function<bool()>& done, std::chrono::milliseconds timeout = 3000ms) {
	auto deadline = std::chrono::steady_clock::now() + timeout;
	while (std::chrono::steady_clock::now() < deadline) {
		if (done()) {
			return true;
		}
		std::this_thread::sleep_for(2ms);
	}
	return done();
}

std::shared_ptr<const marketlink::Signer> stream_signer() {
	static std::shared_ptr<const marketlink::Signer> signer = [] {
		auto result = marketlink::Signer::from_pem("stream-key", test_keys::shared_rsa_pem());
		if (!result) {
			throw std::runtime_error("test key rejected");
		}
		return std::make_shared<const marketlink::Signer>(std::move(*result));
	}();
	return signer;
}

marketlink::StreamConfig fast_config() {
	marketlink::StreamConfig config;
	config.url = "wss://stream.test/trade-api/ws/v2";
	config.heartbeat_interval = 1000ms;
	config.heartbeat_timeout = 5000ms;
	config.poll_interval = 5ms;
	config.backoff.initial_delay = 5ms;
	config.backoff.max_delay = 20ms;
	config.backoff.jitter_factor = 0.0;
	return config;
}

struct StreamHarness {
	std::shared_ptr<FakeStream> fake = std::make_shared<FakeStream>();
	marketlink::StreamConnectionManager manager;

	explicit StreamHarness(marketlink::StreamConfig config = fast_config())
		: manager(stream_signer(), std::make_shared<marketlink::ClockGuard>(),
				  std::make_unique<FakeStreamTransport>(fake), std::move(config)) {}

	void start_and_connect() {
		if (!manager.start().has_value()) {
			throw std::runtime_error("start failed");
		}
		if (!manager.wait_for_state(ConnectionState::Connected, 3000ms)) {
			throw std::runtime_error("never connected");
		}
	}
};

marketlink::CorrelationId id_of(const std::string& frame) {
	return static_cast<marketlink::CorrelationId>(marketlink::json::get_int(frame, "id").value_or(-1));
}

} // namespace

TEST(stream_state_transition_table) {
	using S = ConnectionState;
	ASSERT_TRUE(marketlink::is_valid_transition(S::Disconnected, S::Connecting));
	ASSERT_TRUE(marketlink::is_valid_transition(S::Connecting, S::Connected));
	ASSERT_TRUE(marketlink::is_valid_transition(S::Connected, S::Reconnecting));
	ASSERT_TRUE(marketlink::is_valid_transition(S::Reconnecting, S::Connecting));
	ASSERT_TRUE(marketlink::is_valid_transition(S::Connected, S::Closed));
	ASSERT_FALSE(marketlink::is_valid_transition(S::Disconnected, S::Connected));
	ASSERT_FALSE(marketlink::is_valid_transition(S::Connected, S::Connecting));
	ASSERT_FALSE(marketlink::is_valid_transition(S::Reconnecting, S::Connected));
	ASSERT_FALSE(marketlink::is_valid_transition(S::Closed, S::Connecting));
	ASSERT_EQ(marketlink::to_string(S::Reconnecting), std::string_view("reconnecting"));
}

TEST(stream_config_for_environment) {
	auto prod = marketlink::StreamConfig::for_environment(marketlink::Environment::Production);
	ASSERT_EQ(prod.url, std::string("wss://api.elections.kalshi.com/trade-api/ws/v2"));
	ASSERT_EQ(prod.sign_path, std::string("/trade-api/ws/v2"));
	ASSERT_EQ(prod.max_handshake_attempts, 0u);
}

TEST(stream_handshake_is_signed) {
	StreamHarness h;
	h.start_and_connect();

	marketlink::HeaderList headers;
	{
		std::lock_guard lock(h.fake->mutex);
		headers = h.fake->last_headers;
		ASSERT_EQ(h.fake->last_url, std::string("wss://stream.test/trade-api/ws/v2"));
	}
	std::string key, timestamp, signature;
	for (const auto& [name, value] : headers) {
		if (name == "KALSHI-ACCESS-KEY") key = value;
		if (name == "KALSHI-ACCESS-TIMESTAMP") timestamp = value;
		if (name == "KALSHI-ACCESS-SIGNATURE") signature = value;
	}
	ASSERT_EQ(key, std::string("stream-key"));
	ASSERT_FALSE(timestamp.empty());

	std::vector<unsigned char> raw(signature.size());
	int len = EVP_DecodeBlock(raw.data(), reinterpret_cast<const unsigned char*>(signature.data()),
							  static_cast<int>(signature.size()));
	ASSERT_TRUE(len > 0);
	raw.resize(256); // 2048-bit signature, base64 padding stripped
	auto verified = stream_signer()->verify(std::stoll(timestamp), "GET", "/trade-api/ws/v2", raw);
	ASSERT_TRUE(verified.has_value() && *verified);
	h.manager.close();
}

TEST(stream_replays_subscriptions_in_order_once) {
	StreamHarness h;
	auto a = h.manager.subscribe(Channel::OrderbookDelta, {"A"}, {});
	auto b = h.manager.subscribe(Channel::Ticker, {"B"}, {});
	auto c = h.manager.subscribe(Channel::Trade, {"C"}, {});
	ASSERT_TRUE(a.has_value() && b.has_value() && c.has_value());

	h.start_and_connect();
	ASSERT_TRUE(wait_until([&] { return h.fake->commands(1, "subscribe").size() == 3; }));

	h.fake->drop_connection();
	ASSERT_TRUE(wait_until([&] { return h.fake->commands(2, "subscribe").size() == 3; }));
	std::this_thread::sleep_for(30ms);

	for (int connection = 1; connection <= 2; ++connection) {
		auto subscribes = h.fake->commands(connection, "subscribe");
		ASSERT_EQ(subscribes.size(), 3u);
		ASSERT_EQ(id_of(subscribes[0]), *a);
		ASSERT_EQ(id_of(subscribes[1]), *b);
		ASSERT_EQ(id_of(subscribes[2]), *c);
	}

	auto stats = h.manager.stats();
	ASSERT_EQ(stats.replays, 6u);
	ASSERT_EQ(stats.reconnects, 1u);
	ASSERT_EQ(h.manager.registry().size(), 3u);
	h.manager.close();
}

TEST(stream_reconnect_routes_to_original_callback) {
	StreamHarness h;
	std::mutex transitions_mutex;
	std::vector<std::pair<ConnectionState, ConnectionState>> transitions;
	h.manager.on_state_change([&](ConnectionState from, ConnectionState to) {
		std::lock_guard lock(transitions_mutex);
		transitions.emplace_back(from, to);
	});

	Inbox inbox;
	auto c1 = h.manager.subscribe(Channel::Ticker, {"X"}, inbox.callback());
	ASSERT_TRUE(c1.has_value());

	h.start_and_connect();
	ASSERT_TRUE(wait_until([&] { return h.fake->commands(1, "subscribe").size() == 1; }));

	h.fake->drop_connection();
	ASSERT_TRUE(wait_until([&] { return h.fake->commands(2, "subscribe").size() == 1; }));
	ASSERT_EQ(id_of(h.fake->commands(2, "subscribe")[0]), *c1);

	h.fake->inject_frame(R"({"id":)" + std::to_string(*c1) +
						 R"(,"type":"subscribed","msg":{"channel":"ticker","sid":5}})");
	h.fake->inject_frame(R"({"type":"ticker","sid":5,"seq":1,"msg":{"market_ticker":"X","price":48}})");

	ASSERT_TRUE(wait_until([&] { return inbox.of_type("ticker").size() == 1; }));
	auto ticker = inbox.of_type("ticker")[0];
	ASSERT_EQ(ticker.correlation_id, *c1);
	ASSERT_EQ(ticker.channel, Channel::Ticker);
	ASSERT_EQ(ticker.market_ticker, std::optional<std::string>("X"));
	ASSERT_EQ(inbox.of_type("subscribed").size(), 1u);

	ASSERT_TRUE(wait_until([&] {
		std::lock_guard lock(transitions_mutex);
		return transitions.size() >= 5;
	}));
	{
		std::lock_guard lock(transitions_mutex);
		using S = ConnectionState;
		using Transitions = std::vector<std::pair<S, S>>;
		const Transitions expected{
			{S::Disconnected, S::Connecting},
			{S::Connecting, S::Connected},
			{S::Connected, S::Reconnecting},
			{S::Reconnecting, S::Connecting},
			{S::Connecting, S::Connected},
		};
		ASSERT_EQ(Transitions(transitions.begin(), transitions.begin() + 5), expected);
	}
	h.manager.close();
}

TEST(stream_subscribe_while_connected_sent_once) {
	StreamHarness h;
	h.start_and_connect();
	auto id = h.manager.subscribe(Channel::Fill, {}, {});
	ASSERT_TRUE(id.has_value());
	ASSERT_TRUE(wait_until([&] { return h.fake->commands(1, "subscribe").size() == 1; }));
	std::this_thread::sleep_for(30ms);
	ASSERT_EQ(h.fake->commands(1, "subscribe").size(), 1u);
	ASSERT_EQ(id_of(h.fake->commands(1, "subscribe")[0]), *id);
	h.manager.close();
}

TEST(stream_heartbeat_timeout_forces_reconnect) {
	auto config = fast_config();
	config.heartbeat_interval = 20ms;
	config.heartbeat_timeout = 80ms;
	StreamHarness h(config);
	h.fake->answer_pings = false;

	h.start_and_connect();
	ASSERT_TRUE(wait_until([&] { return h.fake->connection_count() >= 2; }));
	ASSERT_TRUE(h.manager.stats().reconnects >= 1u);
	h.manager.close();
}

TEST(stream_pongs_keep_connection_alive) {
	auto config = fast_config();
	config.heartbeat_interval = 20ms;
	config.heartbeat_timeout = 80ms;
	StreamHarness h(config);

	h.start_and_connect();
	std::this_thread::sleep_for(300ms);
	ASSERT_EQ(h.fake->connection_count(), 1);
	ASSERT_EQ(h.manager.state(), ConnectionState::Connected);
	{
		std::lock_guard lock(h.fake->mutex);
		ASSERT_TRUE(h.fake->pings >= 3);
	}
	h.manager.close();
}

TEST(stream_exhausted_budget_closes) {
	auto config = fast_config();
	config.max_handshake_attempts = 3;
	StreamHarness h(config);
	for (int i = 0; i < 3; ++i) {
		h.fake->open_script.push_back(std::unexpected(marketlink::Error::network("refused")));
	}
	ErrorLog errors;
	h.manager.on_error(errors.callback());
	ASSERT_TRUE(h.manager.subscribe(Channel::Ticker, {"X"}, {}).has_value());

	ASSERT_TRUE(h.manager.start().has_value());
	ASSERT_TRUE(h.manager.wait_for_state(ConnectionState::Closed, 3000ms));
	ASSERT_TRUE(wait_until([&] { return errors.size() == 1; }));
	{
		std::lock_guard lock(errors.mutex);
		ASSERT_EQ(errors.errors[0].code, marketlink::ErrorCode::ConnectionExhausted);
		ASSERT_TRUE(errors.errors[0].message.find("3 handshake attempts") != std::string::npos);
	}
	{
		std::lock_guard lock(h.fake->mutex);
		ASSERT_EQ(h.fake->opens, 3);
	}
	ASSERT_TRUE(h.manager.registry().is_closed());
	auto late = h.manager.subscribe(Channel::Ticker, {"Y"}, {});
	ASSERT_FALSE(late.has_value());
	h.manager.close();
}

TEST(stream_failed_handshakes_retry_until_success) {
	StreamHarness h;
	h.fake->open_script.push_back(std::unexpected(marketlink::Error::network("refused")));
	h.fake->open_script.push_back(std::unexpected(marketlink::Error::network("refused")));
	auto id = h.manager.subscribe(Channel::Trade, {}, {});
	ASSERT_TRUE(id.has_value());

	h.start_and_connect();
	ASSERT_TRUE(wait_until([&] { return h.fake->commands(1, "subscribe").size() == 1; }));
	std::lock_guard lock(h.fake->mutex);
	ASSERT_EQ(h.fake->opens, 3);
}

TEST(stream_malformed_frame_dropped) {
	StreamHarness h;
	Inbox inbox;
	ASSERT_TRUE(h.manager.subscribe(Channel::Trade, {}, inbox.callback()).has_value());
	h.start_and_connect();

	h.fake->inject_frame("{not json");
	h.fake->inject_frame(R"({"type":"trade","msg":{"market_ticker":"KXA","count":3}})");

	ASSERT_TRUE(wait_until([&] { return inbox.of_type("trade").size() == 1; }));
	ASSERT_EQ(h.manager.stats().frames_dropped, 1u);
	ASSERT_EQ(h.manager.state(), ConnectionState::Connected);
	h.manager.close();
}

TEST(stream_unknown_correlation_id_dropped) {
	StreamHarness h;
	Inbox inbox;
	ASSERT_TRUE(h.manager.subscribe(Channel::Ticker, {"X"}, inbox.callback()).has_value());
	h.start_and_connect();

	h.fake->inject_frame(R"({"id":9999,"type":"subscribed","msg":{"channel":"ticker","sid":1}})");
	h.fake->inject_frame(R"({"id":9998,"type":"ticker","msg":{"market_ticker":"X"}})");

	ASSERT_TRUE(wait_until([&] { return h.manager.stats().frames_dropped == 2; }));
	std::this_thread::sleep_for(20ms);
	ASSERT_EQ(inbox.size(), 0u);
	ASSERT_FALSE(h.manager.registry().resolve_sid(1).has_value());
	h.manager.close();
}

TEST(stream_broadcast_to_channel_subscribers) {
	StreamHarness h;
	Inbox first;
	Inbox second;
	Inbox other;
	auto a = h.manager.subscribe(Channel::MarketLifecycle, {}, first.callback());
	auto b = h.manager.subscribe(Channel::MarketLifecycle, {}, second.callback());
	ASSERT_TRUE(h.manager.subscribe(Channel::Fill, {}, other.callback()).has_value());
	h.start_and_connect();

	h.fake->inject_frame(R"({"type":"market_lifecycle_v2","msg":{"market_ticker":"KXA","event_type":"created"}})");
	ASSERT_TRUE(wait_until([&] { return first.size() == 1 && second.size() == 1; }));
	ASSERT_EQ(first.of_type("market_lifecycle_v2")[0].correlation_id, *a);
	ASSERT_EQ(second.of_type("market_lifecycle_v2")[0].correlation_id, *b);
	std::this_thread::sleep_for(20ms);
	ASSERT_EQ(other.size(), 0u);
	h.manager.close();
}

TEST(stream_unsubscribe_sends_sid_and_is_idempotent) {
	StreamHarness h;
	h.fake->auto_ack = true;
	Inbox removed;
	Inbox kept;
	auto gone = h.manager.subscribe(Channel::Ticker, {"A"}, removed.callback());
	auto stay = h.manager.subscribe(Channel::Ticker, {"B"}, kept.callback());
	h.start_and_connect();
	ASSERT_TRUE(wait_until([&] { return h.manager.registry().sid_of(*gone).has_value(); }));
	std::int64_t sid = *h.manager.registry().sid_of(*gone);

	h.manager.unsubscribe(*gone);
	h.manager.unsubscribe(*gone);
	ASSERT_TRUE(wait_until([&] { return h.fake->commands(1, "unsubscribe").size() == 1; }));
	std::string frame = h.fake->commands(1, "unsubscribe")[0];
	ASSERT_TRUE(frame.find("\"sids\":[" + std::to_string(sid) + "]") != std::string::npos);

	// Data still in flight for the retired sid reaches nobody
	h.fake->inject_frame(R"({"type":"ticker","sid":)" + std::to_string(sid) + R"(,"msg":{"market_ticker":"A"}})");
	std::this_thread::sleep_for(40ms);
	ASSERT_EQ(removed.of_type("ticker").size(), 0u);
	ASSERT_EQ(kept.of_type("ticker").size(), 0u);
	ASSERT_TRUE(h.manager.registry().contains(*stay));
	ASSERT_EQ(h.fake->commands(1, "unsubscribe").size(), 1u);
	h.manager.close();
}

TEST(stream_late_ack_for_cancelled_subscription_unsubscribes) {
	StreamHarness h;
	auto id = h.manager.subscribe(Channel::Ticker, {"A"}, {});
	h.start_and_connect();
	ASSERT_TRUE(wait_until([&] { return h.fake->commands(1, "subscribe").size() == 1; }));

	h.manager.unsubscribe(*id);
	h.fake->inject_frame(R"({"id":)" + std::to_string(*id) +
						 R"(,"type":"subscribed","msg":{"channel":"ticker","sid":77}})");

	ASSERT_TRUE(wait_until([&] { return h.fake->commands(1, "unsubscribe").size() == 1; }));
	ASSERT_TRUE(h.fake->commands(1, "unsubscribe")[0].find("[77]") != std::string::npos);
	ASSERT_EQ(h.manager.registry().size(), 0u);
	h.manager.close();
}

TEST(stream_exchange_error_reaches_error_callback) {
	StreamHarness h;
	ErrorLog errors;
	h.manager.on_error(errors.callback());
	auto id = h.manager.subscribe(Channel::Ticker, {"A"}, {});
	h.start_and_connect();

	h.fake->inject_frame(R"({"id":)" + std::to_string(*id) +
						 R"(,"type":"error","msg":{"code":6,"msg":"Already subscribed"}})");
	ASSERT_TRUE(wait_until([&] { return errors.size() == 1; }));
	std::lock_guard lock(errors.mutex);
	ASSERT_EQ(errors.errors[0].exchange_code, 6);
	ASSERT_EQ(errors.errors[0].message, std::string("Already subscribed"));
	ASSERT_EQ(errors.errors[0].correlation_id, std::optional<marketlink::CorrelationId>(*id));
}

TEST(stream_update_markets_live_and_on_replay) {
	StreamHarness h;
	h.fake->auto_ack = true;
	auto id = h.manager.subscribe(Channel::OrderbookDelta, {"A"}, {});
	h.start_and_connect();
	ASSERT_TRUE(wait_until([&] { return h.manager.registry().sid_of(*id).has_value(); }));

	ASSERT_TRUE(h.manager.update_markets(*id, marketlink::MarketUpdate::Add, {"B"}).has_value());
	ASSERT_TRUE(wait_until([&] { return h.fake->commands(1, "update_subscription").size() == 1; }));
	std::string update = h.fake->commands(1, "update_subscription")[0];
	ASSERT_TRUE(update.find("\"add_markets\"") != std::string::npos);

	h.fake->drop_connection();
	ASSERT_TRUE(wait_until([&] { return h.fake->commands(2, "subscribe").size() == 1; }));
	ASSERT_TRUE(h.fake->commands(2, "subscribe")[0].find(R"("market_tickers":["A","B"])") != std::string::npos);

	auto empty = h.manager.update_markets(*id, marketlink::MarketUpdate::Add, {});
	ASSERT_FALSE(empty.has_value());
	auto unknown = h.manager.update_markets(424242, marketlink::MarketUpdate::Add, {"Z"});
	ASSERT_FALSE(unknown.has_value());
	h.manager.close();
}

TEST(stream_removing_last_market_keeps_replay_scoped) {
	StreamHarness h;
	h.fake->auto_ack = true;
	auto id = h.manager.subscribe(Channel::Ticker, {"X"}, {});
	h.start_and_connect();
	ASSERT_TRUE(wait_until([&] { return h.manager.registry().sid_of(*id).has_value(); }));

	auto emptied = h.manager.update_markets(*id, marketlink::MarketUpdate::Remove, {"X"});
	ASSERT_FALSE(emptied.has_value());
	ASSERT_EQ(emptied.error().code, marketlink::ErrorCode::InvalidRequest);

	h.fake->drop_connection();
	ASSERT_TRUE(wait_until([&] { return h.fake->commands(2, "subscribe").size() == 1; }));
	ASSERT_TRUE(h.fake->commands(2, "subscribe")[0].find(R"("market_ticker":"X")") != std::string::npos);
	ASSERT_TRUE(h.fake->commands(1, "update_subscription").empty());
	ASSERT_TRUE(h.fake->commands(2, "update_subscription").empty());
	h.manager.close();
}

TEST(stream_send_custom_requires_connection) {
	StreamHarness h;
	auto early = h.manager.send_custom("list_subscriptions", "{}");
	ASSERT_FALSE(early.has_value());
	ASSERT_EQ(early.error().code, marketlink::ErrorCode::NetworkError);

	h.start_and_connect();
	auto bad = h.manager.send_custom("list_subscriptions", "[1]");
	ASSERT_FALSE(bad.has_value());
	ASSERT_EQ(bad.error().code, marketlink::ErrorCode::InvalidRequest);

	auto id = h.manager.send_custom("list_subscriptions", "{}");
	ASSERT_TRUE(id.has_value());
	ASSERT_TRUE(wait_until([&] { return h.fake->commands(1, "list_subscriptions").size() == 1; }));
	ASSERT_EQ(id_of(h.fake->commands(1, "list_subscriptions")[0]), *id);
	h.manager.close();
}

TEST(stream_close_is_final) {
	StreamHarness h;
	ASSERT_TRUE(h.manager.subscribe(Channel::Ticker, {"A"}, {}).has_value());
	h.start_and_connect();

	h.manager.close();
	ASSERT_EQ(h.manager.state(), ConnectionState::Closed);
	ASSERT_TRUE(h.manager.registry().is_closed());
	ASSERT_FALSE(h.manager.start().has_value());
	ASSERT_FALSE(h.manager.subscribe(Channel::Ticker, {"B"}, {}).has_value());
	{
		std::lock_guard lock(h.fake->mutex);
		ASSERT_FALSE(h.fake->connected);
	}
	h.manager.close();
}

TEST(stream_slow_callback_does_not_block_heartbeat) {
	auto config = fast_config();
	config.heartbeat_interval = 20ms;
	config.heartbeat_timeout = 100ms;
	StreamHarness h(config);
	std::atomic<bool> release{false};
	ASSERT_TRUE(h.manager
					.subscribe(Channel::Trade, {},
							   [&](const marketlink::StreamMessage&) {
								   while (!release) {
									   std::this_thread::sleep_for(5ms);
								   }
							   })
					.has_value());
	h.start_and_connect();

	h.fake->inject_frame(R"({"type":"trade","msg":{"market_ticker":"KXA"}})");
	std::this_thread::sleep_for(300ms);
	ASSERT_EQ(h.fake->connection_count(), 1);
	release = true;
	h.manager.close();
}

TEST(dispatcher_runs_in_order_and_survives_throw) {
	marketlink::CallbackDispatcher dispatcher;
	std::mutex mutex;
	std::vector<int> order;
	for (int i = 0; i < 5; ++i) {
		dispatcher.post([&, i] {
			if (i == 2) {
				throw std::runtime_error("subscriber bug");
			}
			std::lock_guard lock(mutex);
			order.push_back(i);
		});
	}
	dispatcher.wait_idle();
	{
		std::lock_guard lock(mutex);
		ASSERT_EQ(order, (std::vector<int>{0, 1, 3, 4}));
	}
	dispatcher.stop();
	ASSERT_FALSE(dispatcher.post([] {}));
}

TEST(dispatcher_survives_non_standard_throw) {
	marketlink::CallbackDispatcher dispatcher;
	std::atomic<int> ran{0};
	dispatcher.post([] { throw 42; });
	dispatcher.post([&] { ++ran; });
	dispatcher.wait_idle();
	ASSERT_EQ(ran.load(), 1);
}

TEST(dispatcher_destroyed_by_own_task_drains_queue) {
	auto* dispatcher = new marketlink::CallbackDispatcher;
	std::promise<void> gate;
	std::shared_future<void> opened = gate.get_future().share();
	auto ran = std::make_shared<std::atomic<int>>(0);

	// Hold the worker so every task is queued before the delete runs
	dispatcher->post([opened] { opened.wait(); });
	dispatcher->post([dispatcher, ran] {
		delete dispatcher;
		++*ran;
	});
	dispatcher->post([ran] { ++*ran; });
	gate.set_value();

	ASSERT_TRUE(wait_until([&] { return ran->load() == 2; }));
}

TEST(stream_manager_destroyed_inside_callback) {
	auto fake = std::make_shared<FakeStream>();
	auto manager = std::make_shared<std::unique_ptr<marketlink::StreamConnectionManager>>(
		std::make_unique<marketlink::StreamConnectionManager>(
			stream_signer(), std::make_shared<marketlink::ClockGuard>(),
			std::make_unique<FakeStreamTransport>(fake), fast_config()));
	std::atomic<bool> destroyed{false};

	ASSERT_TRUE((*manager)
					->subscribe(Channel::Trade, {},
								[manager, &destroyed](const marketlink::StreamMessage&) {
									if (*manager) {
										manager->reset();
										destroyed = true;
									}
								})
					.has_value());
	ASSERT_TRUE((*manager)->start().has_value());
	ASSERT_TRUE((*manager)->wait_for_state(ConnectionState::Connected, 3000ms));

	fake->inject_frame(R"({"type":"trade","msg":{"market_ticker":"KXA"}})");
	ASSERT_TRUE(wait_until([&] { return destroyed.load(); }));
	std::lock_guard lock(fake->mutex);
	ASSERT_FALSE(fake->connected);
}
