#include "marketlink/stream_manager.hpp"
#include "marketlink/dispatcher.hpp"
#include "marketlink/frame.hpp"
#include "marketlink/json.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <spdlog/spdlog.h>
#include <thread>
#include <unordered_set>

namespace marketlink {

struct StreamConnectionManager::Impl {
	using SteadyClock = std::chrono::steady_clock;

	std::shared_ptr<const Signer> signer;
	std::shared_ptr<ClockGuard> clock;
	std::unique_ptr<StreamTransport> transport;
	StreamConfig config;

	SubscriptionRegistry registry;
	CallbackDispatcher dispatcher;

	// Guards everything below; registry calls nest inside it, never the reverse
	mutable std::mutex mutex;
	mutable std::condition_variable cv;
	ConnectionState state{ConnectionState::Disconnected};
	bool stop_requested{false};
	bool started{false};
	std::deque<std::string> outbox;
	ErrorCallback error_callback;
	StateCallback state_callback;

	// Per-connection bookkeeping, reset on every connect
	std::unordered_set<CorrelationId> pending_commands; // unsubscribe, update, custom
	std::unordered_set<CorrelationId> cancelled;        // removed before their ack arrived
	std::unordered_set<std::int64_t> retired_sids;      // unsubscribed, ack outstanding

	std::atomic<std::uint64_t> frames_sent{0};
	std::atomic<std::uint64_t> frames_received{0};
	std::atomic<std::uint64_t> frames_dropped{0};
	std::atomic<std::uint64_t> replays{0};
	std::atomic<std::uint64_t> reconnects{0};

	std::thread worker;

	Impl(std::shared_ptr<const Signer> s, std::shared_ptr<ClockGuard> c,
		 std::unique_ptr<StreamTransport> t, StreamConfig cfg)
		: signer(std::move(s)), clock(std::move(c)), transport(std::move(t)), config(std::move(cfg)) {}

	// Requires mutex held
	bool transition(ConnectionState to) {
		ConnectionState from = state;
		if (!is_valid_transition(from, to)) {
			spdlog::error("[StreamManager] Refusing transition {} -> {}", to_string(from),
						  to_string(to));
			return false;
		}
		state = to;
		spdlog::info("[StreamManager] {} -> {}", to_string(from), to_string(to));
		if (state_callback) {
			dispatcher.post([cb = state_callback, from, to] { cb(from, to); });
		}
		cv.notify_all();
		return true;
	}

	void report(StreamError error) {
		ErrorCallback cb;
		{
			std::lock_guard lock(mutex);
			cb = error_callback;
		}
		if (cb) {
			dispatcher.post([cb = std::move(cb), error = std::move(error)] { cb(error); });
		} else {
			spdlog::error("[StreamManager] {} (no error callback): {}", to_string(error.code),
						  error.message);
		}
	}

	void deliver(const MessageCallback& cb, StreamMessage msg) {
		if (cb) {
			dispatcher.post([cb, msg = std::move(msg)] { cb(msg); });
		}
	}

	void drop(std::string_view reason) {
		frames_dropped.fetch_add(1, std::memory_order_relaxed);
		spdlog::warn("[StreamManager] Dropping frame: {}", reason);
	}

	// Fatal end of the run loop: the manager will not try again
	void shut_down(Error error) {
		transport->close();
		{
			std::lock_guard lock(mutex);
			outbox.clear();
			transition(ConnectionState::Closed);
		}
		registry.close();
		report({error.code, std::move(error.message), std::nullopt, 0});
	}

	// Interruptible sleep; false if stop was requested
	bool sleep_for(std::chrono::milliseconds delay) {
		std::unique_lock lock(mutex);
		return !cv.wait_for(lock, delay, [this] { return stop_requested; });
	}

	bool send_frame(const std::string& frame) {
		Result<void> sent = transport->send(frame);
		if (!sent) {
			spdlog::warn("[StreamManager] Send failed: {}", sent.error().message);
			return false;
		}
		frames_sent.fetch_add(1, std::memory_order_relaxed);
		return true;
	}

	void run();
	bool serve_connection();
	void route(const std::string& text);
	void on_subscribed(const SubscribedAck& ack);
	void on_data(DataFrame data);
};

void StreamConnectionManager::Impl::run() {
	std::uint32_t failures = 0;

	while (true) {
		{
			std::lock_guard lock(mutex);
			if (stop_requested || !transition(ConnectionState::Connecting)) {
				return;
			}
		}

		// A fresh timestamp and signature for every handshake
		std::int64_t timestamp_ms = clock->now_ms();
		Result<AuthHeaders> auth = signer->sign_headers(timestamp_ms, "GET", config.sign_path);
		if (!auth) {
			spdlog::error("[StreamManager] Cannot sign handshake: {}", auth.error().message);
			shut_down(auth.error());
			return;
		}
		HeaderList headers{
			{"KALSHI-ACCESS-KEY", auth->access_key},
			{"KALSHI-ACCESS-SIGNATURE", auth->signature},
			{"KALSHI-ACCESS-TIMESTAMP", auth->timestamp},
		};

		Result<void> opened = transport->open(config.url, headers);
		if (!opened) {
			++failures;
			spdlog::warn("[StreamManager] Handshake attempt {} failed: {}", failures,
						 opened.error().message);
			if (config.max_handshake_attempts != 0 && failures >= config.max_handshake_attempts) {
				shut_down(Error::exhausted("Gave up after " + std::to_string(failures) +
											" handshake attempts"));
				return;
			}
			{
				std::lock_guard lock(mutex);
				if (stop_requested || !transition(ConnectionState::Reconnecting)) {
					return;
				}
			}
			if (!sleep_for(calculate_retry_delay(static_cast<std::int32_t>(failures), config.backoff))) {
				return;
			}
			continue;
		}
		failures = 0;

		if (!serve_connection()) {
			return; // stop requested
		}

		transport->close();
		{
			std::lock_guard lock(mutex);
			if (stop_requested) {
				return;
			}
			outbox.clear();
			registry.clear_bindings();
			if (!transition(ConnectionState::Reconnecting)) {
				return;
			}
		}
		reconnects.fetch_add(1, std::memory_order_relaxed);

		if (!sleep_for(calculate_retry_delay(1, config.backoff))) {
			return;
		}
	}
}

// Replays the registry, then pumps frames until the connection is lost.
// Returns false when the loop ended because of a stop request.
bool StreamConnectionManager::Impl::serve_connection() {
	std::vector<SubscriptionIntent> replay;
	{
		std::lock_guard lock(mutex);
		if (stop_requested) {
			return false;
		}
		// Snapshot and state change under one lock: a concurrent subscribe lands
		// either in the snapshot or in the outbox, never both
		outbox.clear();
		pending_commands.clear();
		cancelled.clear();
		retired_sids.clear();
		replay = registry.snapshot();
		transition(ConnectionState::Connected);
	}

	for (const SubscriptionIntent& intent : replay) {
		if (!send_frame(encode_subscribe(intent))) {
			return true;
		}
		replays.fetch_add(1, std::memory_order_relaxed);
	}
	if (!replay.empty()) {
		spdlog::info("[StreamManager] Replayed {} subscription(s)", replay.size());
	}

	auto last_inbound = SteadyClock::now();
	auto last_ping = last_inbound;

	while (true) {
		std::deque<std::string> pending;
		{
			std::lock_guard lock(mutex);
			if (stop_requested) {
				return false;
			}
			pending.swap(outbox);
		}
		for (const std::string& frame : pending) {
			if (!send_frame(frame)) {
				return true;
			}
		}

		auto now = SteadyClock::now();
		if (now - last_inbound >= config.heartbeat_timeout) {
			spdlog::warn("[StreamManager] No traffic for {} ms, reconnecting",
						 std::chrono::duration_cast<std::chrono::milliseconds>(now - last_inbound).count());
			return true;
		}
		if (now - last_ping >= config.heartbeat_interval) {
			Result<void> pinged = transport->ping();
			if (!pinged) {
				spdlog::warn("[StreamManager] Ping failed: {}", pinged.error().message);
				return true;
			}
			last_ping = now;
		}

		StreamEvent event = transport->poll(config.poll_interval);
		switch (event.kind) {
			case StreamEvent::Kind::Frame:
				last_inbound = SteadyClock::now();
				frames_received.fetch_add(1, std::memory_order_relaxed);
				route(event.data);
				break;
			case StreamEvent::Kind::Pong:
				last_inbound = SteadyClock::now();
				break;
			case StreamEvent::Kind::Idle:
				break;
			case StreamEvent::Kind::Closed:
				spdlog::warn("[StreamManager] Connection closed{}{}", event.data.empty() ? "" : ": ",
							 event.data);
				return true;
		}
	}
}

void StreamConnectionManager::Impl::route(const std::string& text) {
	Result<InboundFrame> decoded = decode_frame(text);
	if (!decoded) {
		drop(decoded.error().message);
		return;
	}

	if (const auto* ack = std::get_if<SubscribedAck>(&*decoded)) {
		on_subscribed(*ack);
	} else if (const auto* ack = std::get_if<UnsubscribedAck>(&*decoded)) {
		std::lock_guard lock(mutex);
		retired_sids.erase(ack->sid);
		if (ack->id) {
			pending_commands.erase(*ack->id);
		}
		registry.unbind_sid(ack->sid);
		spdlog::debug("[StreamManager] sid {} unsubscribed", ack->sid);
	} else if (const auto* ack = std::get_if<OkAck>(&*decoded)) {
		{
			std::lock_guard lock(mutex);
			if (ack->id) {
				pending_commands.erase(*ack->id);
			}
		}
		std::optional<CorrelationId> owner = ack->sid ? registry.resolve_sid(*ack->sid) : std::nullopt;
		if (owner) {
			std::optional<SubscriptionIntent> intent = registry.find(*owner);
			StreamMessage msg;
			msg.correlation_id = *owner;
			msg.channel = intent ? intent->channel : Channel::Ticker;
			msg.type = "ok";
			msg.sid = ack->sid;
			msg.payload = ack->payload;
			deliver(registry.callback_for(*owner), std::move(msg));
		} else {
			spdlog::debug("[StreamManager] ok for command {}", ack->id.value_or(0));
		}
	} else if (const auto* err = std::get_if<ErrorFrame>(&*decoded)) {
		if (err->id) {
			std::lock_guard lock(mutex);
			pending_commands.erase(*err->id);
		}
		spdlog::warn("[StreamManager] Exchange error {} for command {}: {}", err->code,
					 err->id.value_or(0), err->message);
		report({ErrorCode::InvalidRequest, err->message, err->id, err->code});
	} else if (auto* data = std::get_if<DataFrame>(&*decoded)) {
		on_data(std::move(*data));
	}
}

void StreamConnectionManager::Impl::on_subscribed(const SubscribedAck& ack) {
	if (!ack.id) {
		drop("subscribed ack without id");
		return;
	}

	{
		std::lock_guard lock(mutex);
		if (cancelled.erase(*ack.id) > 0) {
			// Unsubscribed while the subscribe was in flight
			CorrelationId command = registry.next_command_id();
			pending_commands.insert(command);
			retired_sids.insert(ack.sid);
			outbox.push_back(encode_unsubscribe(command, ack.sid));
			spdlog::debug("[StreamManager] Late ack for cancelled {}, unsubscribing sid {}", *ack.id,
						  ack.sid);
			return;
		}
	}

	if (!registry.bind_sid(*ack.id, ack.sid)) {
		drop("unknown correlation id " + std::to_string(*ack.id));
		return;
	}

	std::optional<SubscriptionIntent> intent = registry.find(*ack.id);
	StreamMessage msg;
	msg.correlation_id = *ack.id;
	msg.channel = intent ? intent->channel : channel_from_string(ack.channel).value_or(Channel::Ticker);
	msg.type = "subscribed";
	msg.sid = ack.sid;
	spdlog::debug("[StreamManager] Subscription {} bound to sid {}", *ack.id, ack.sid);
	deliver(registry.callback_for(*ack.id), std::move(msg));
}

void StreamConnectionManager::Impl::on_data(DataFrame data) {
	StreamMessage msg;
	msg.type = std::move(data.type);
	msg.sid = data.sid;
	msg.seq = data.seq;
	msg.market_ticker = std::move(data.market_ticker);
	msg.payload = std::move(data.payload);

	// 1. explicit correlation id
	if (data.id) {
		std::optional<SubscriptionIntent> intent = registry.find(*data.id);
		if (!intent) {
			bool ours = false;
			{
				std::lock_guard lock(mutex);
				ours = pending_commands.contains(*data.id);
			}
			if (ours) {
				spdlog::debug("[StreamManager] {} reply for command {}", msg.type, *data.id);
			} else {
				drop("unknown correlation id " + std::to_string(*data.id));
			}
			return;
		}
		msg.correlation_id = *data.id;
		msg.channel = intent->channel;
		deliver(registry.callback_for(*data.id), std::move(msg));
		return;
	}

	// 2. bound sid
	if (data.sid) {
		if (std::optional<CorrelationId> owner = registry.resolve_sid(*data.sid)) {
			std::optional<SubscriptionIntent> intent = registry.find(*owner);
			msg.correlation_id = *owner;
			msg.channel = intent ? intent->channel : data.channel.value_or(Channel::Ticker);
			deliver(registry.callback_for(*owner), std::move(msg));
			return;
		}
		std::lock_guard lock(mutex);
		if (retired_sids.contains(*data.sid)) {
			frames_dropped.fetch_add(1, std::memory_order_relaxed);
			spdlog::debug("[StreamManager] Data for retired sid {}", *data.sid);
			return;
		}
	}

	// 3. broadcast to the channel kind
	if (!data.channel) {
		drop("no channel for message type '" + msg.type + "'");
		return;
	}
	auto subscribers = registry.subscribers_of(*data.channel);
	if (subscribers.empty()) {
		drop("no subscriber for " + std::string(to_string(*data.channel)));
		return;
	}
	msg.channel = *data.channel;
	for (auto& [id, cb] : subscribers) {
		StreamMessage copy = msg;
		copy.correlation_id = id;
		deliver(cb, std::move(copy));
	}
}

StreamConnectionManager::StreamConnectionManager(std::shared_ptr<const Signer> signer,
												 std::shared_ptr<ClockGuard> clock,
												 std::unique_ptr<StreamTransport> transport,
												 StreamConfig config)
	: impl_(std::make_unique<Impl>(std::move(signer), std::move(clock), std::move(transport),
								   std::move(config))) {}

StreamConnectionManager::~StreamConnectionManager() {
	if (impl_) {
		close();
	}
}

StreamConnectionManager::StreamConnectionManager(StreamConnectionManager&&) noexcept = default;

StreamConnectionManager& StreamConnectionManager::operator=(StreamConnectionManager&& other) noexcept {
	if (this != &other) {
		if (impl_) {
			close();
		}
		impl_ = std::move(other.impl_);
	}
	return *this;
}

Result<void> StreamConnectionManager::start() {
	if (!impl_->signer || !impl_->clock || !impl_->transport) {
		return std::unexpected(Error::invalid("Stream manager is not fully configured"));
	}
	std::lock_guard lock(impl_->mutex);
	if (impl_->started || impl_->state != ConnectionState::Disconnected) {
		return std::unexpected(Error::invalid("Stream already started or closed"));
	}
	impl_->started = true;
	impl_->worker = std::thread([impl = impl_.get()] { impl->run(); });
	return {};
}

void StreamConnectionManager::close() {
	{
		std::lock_guard lock(impl_->mutex);
		impl_->stop_requested = true;
	}
	impl_->cv.notify_all();

	if (impl_->worker.joinable()) {
		impl_->worker.join();
	}

	if (impl_->transport) {
		impl_->transport->close();
	}
	{
		std::lock_guard lock(impl_->mutex);
		impl_->outbox.clear();
		if (impl_->state != ConnectionState::Closed) {
			impl_->transition(ConnectionState::Closed);
		}
	}
	impl_->registry.close();
	impl_->dispatcher.stop();
}

Result<CorrelationId> StreamConnectionManager::subscribe(Channel channel,
														 std::vector<std::string> market_tickers,
														 MessageCallback callback) {
	std::lock_guard lock(impl_->mutex);
	Result<CorrelationId> id = impl_->registry.add(channel, std::move(market_tickers),
												   std::move(callback));
	if (!id) {
		return id;
	}
	if (impl_->state == ConnectionState::Connected) {
		if (std::optional<SubscriptionIntent> intent = impl_->registry.find(*id)) {
			impl_->outbox.push_back(encode_subscribe(*intent));
		}
	}
	spdlog::debug("[StreamManager] Subscription {} on {}", *id, to_string(channel));
	return id;
}

void StreamConnectionManager::unsubscribe(CorrelationId id) {
	std::lock_guard lock(impl_->mutex);
	std::optional<std::int64_t> sid = impl_->registry.sid_of(id);
	if (!impl_->registry.remove(id)) {
		return;
	}
	if (impl_->state != ConnectionState::Connected) {
		return;
	}
	if (sid) {
		CorrelationId command = impl_->registry.next_command_id();
		impl_->pending_commands.insert(command);
		impl_->retired_sids.insert(*sid);
		impl_->outbox.push_back(encode_unsubscribe(command, *sid));
	} else {
		impl_->cancelled.insert(id);
	}
}

Result<void> StreamConnectionManager::update_markets(CorrelationId id, MarketUpdate action,
													 const std::vector<std::string>& market_tickers) {
	if (market_tickers.empty()) {
		return std::unexpected(Error::invalid("market_tickers required"));
	}

	std::lock_guard lock(impl_->mutex);
	Result<void> updated = impl_->registry.update_markets(id, action, market_tickers);
	if (!updated) {
		return updated;
	}

	std::optional<std::int64_t> sid = impl_->registry.sid_of(id);
	std::optional<SubscriptionIntent> intent = impl_->registry.find(id);
	if (impl_->state == ConnectionState::Connected && sid && intent) {
		CorrelationId command = impl_->registry.next_command_id();
		impl_->pending_commands.insert(command);
		impl_->outbox.push_back(encode_update(command, *sid, intent->channel, action, market_tickers));
	}
	return {};
}

Result<CorrelationId> StreamConnectionManager::send_custom(std::string_view cmd,
														   std::string_view params_json) {
	if (cmd.empty()) {
		return std::unexpected(Error::invalid("Command name required"));
	}
	if (!json::is_object(params_json)) {
		return std::unexpected(Error::invalid("Command params must be a JSON object"));
	}

	std::lock_guard lock(impl_->mutex);
	if (impl_->state != ConnectionState::Connected) {
		return std::unexpected(Error::network("Stream is not connected"));
	}
	CorrelationId command = impl_->registry.next_command_id();
	impl_->pending_commands.insert(command);
	impl_->outbox.push_back(encode_command(command, cmd, params_json));
	return command;
}

void StreamConnectionManager::on_error(ErrorCallback callback) {
	std::lock_guard lock(impl_->mutex);
	impl_->error_callback = std::move(callback);
}

void StreamConnectionManager::on_state_change(StateCallback callback) {
	std::lock_guard lock(impl_->mutex);
	impl_->state_callback = std::move(callback);
}

ConnectionState StreamConnectionManager::state() const {
	std::lock_guard lock(impl_->mutex);
	return impl_->state;
}

bool StreamConnectionManager::wait_for_state(ConnectionState target,
											 std::chrono::milliseconds timeout) const {
	std::unique_lock lock(impl_->mutex);
	return impl_->cv.wait_for(lock, timeout, [&] { return impl_->state == target; });
}

StreamStats StreamConnectionManager::stats() const {
	return StreamStats{
		.frames_sent = impl_->frames_sent.load(std::memory_order_relaxed),
		.frames_received = impl_->frames_received.load(std::memory_order_relaxed),
		.frames_dropped = impl_->frames_dropped.load(std::memory_order_relaxed),
		.replays = impl_->replays.load(std::memory_order_relaxed),
		.reconnects = impl_->reconnects.load(std::memory_order_relaxed),
	};
}

const SubscriptionRegistry& StreamConnectionManager::registry() const noexcept {
	return impl_->registry;
}

const StreamConfig& StreamConnectionManager::config() const noexcept {
	return impl_->config;
}

} // namespace marketlink
