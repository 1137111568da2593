#include "marketlink/subscription.hpp"

#include <algorithm>

namespace marketlink {

std::optional<Channel> channel_from_string(std::string_view name) noexcept {
	if (name == "ticker" || name == "ticker_v2") {
		return Channel::Ticker;
	}
	if (name == "orderbook_delta" || name == "orderbook_snapshot") {
		return Channel::OrderbookDelta;
	}
	if (name == "trade") {
		return Channel::Trade;
	}
	if (name == "fill") {
		return Channel::Fill;
	}
	if (name == "market_lifecycle_v2" || name == "market_lifecycle" || name == "event_lifecycle") {
		return Channel::MarketLifecycle;
	}
	if (name == "market_positions" || name == "market_position") {
		return Channel::MarketPositions;
	}
	return std::nullopt;
}

Result<CorrelationId> SubscriptionRegistry::add(Channel channel,
												std::vector<std::string> market_tickers,
												MessageCallback callback) {
	std::lock_guard lock(mutex_);
	if (closed_) {
		return std::unexpected(Error::invalid("Subscription registry is closed"));
	}

	CorrelationId id = next_id_++;
	Entry entry;
	entry.intent = SubscriptionIntent{id, channel, std::move(market_tickers)};
	entry.callback = std::move(callback);
	entries_.emplace(id, std::move(entry));
	return id;
}

bool SubscriptionRegistry::remove(CorrelationId id) {
	std::lock_guard lock(mutex_);
	auto it = entries_.find(id);
	if (it == entries_.end()) {
		return false;
	}
	if (it->second.sid) {
		sid_index_.erase(*it->second.sid);
	}
	entries_.erase(it);
	return true;
}

std::vector<SubscriptionIntent> SubscriptionRegistry::snapshot() const {
	std::lock_guard lock(mutex_);
	std::vector<SubscriptionIntent> intents;
	intents.reserve(entries_.size());
	for (const auto& [id, entry] : entries_) {
		intents.push_back(entry.intent);
	}
	return intents;
}

std::optional<SubscriptionIntent> SubscriptionRegistry::find(CorrelationId id) const {
	std::lock_guard lock(mutex_);
	auto it = entries_.find(id);
	if (it == entries_.end()) {
		return std::nullopt;
	}
	return it->second.intent;
}

bool SubscriptionRegistry::contains(CorrelationId id) const {
	std::lock_guard lock(mutex_);
	return entries_.contains(id);
}

MessageCallback SubscriptionRegistry::callback_for(CorrelationId id) const {
	std::lock_guard lock(mutex_);
	auto it = entries_.find(id);
	if (it == entries_.end()) {
		return {};
	}
	return it->second.callback;
}

std::vector<std::pair<CorrelationId, MessageCallback>>
SubscriptionRegistry::subscribers_of(Channel channel) const {
	std::lock_guard lock(mutex_);
	std::vector<std::pair<CorrelationId, MessageCallback>> subscribers;
	for (const auto& [id, entry] : entries_) {
		if (entry.intent.channel == channel) {
			subscribers.emplace_back(id, entry.callback);
		}
	}
	return subscribers;
}

Result<void> SubscriptionRegistry::update_markets(CorrelationId id, MarketUpdate action,
												  const std::vector<std::string>& market_tickers) {
	std::lock_guard lock(mutex_);
	auto it = entries_.find(id);
	if (it == entries_.end()) {
		return std::unexpected(Error::invalid("Unknown subscription " + std::to_string(id)));
	}

	std::vector<std::string>& current = it->second.intent.market_tickers;
	if (current.empty()) {
		return std::unexpected(
			Error::invalid("Subscription " + std::to_string(id) + " covers every market"));
	}

	// An empty ticker list means every market, so a scoped intent must keep one
	std::vector<std::string> next = current;
	for (const std::string& ticker : market_tickers) {
		auto pos = std::find(next.begin(), next.end(), ticker);
		if (action == MarketUpdate::Add && pos == next.end()) {
			next.push_back(ticker);
		} else if (action == MarketUpdate::Remove && pos != next.end()) {
			next.erase(pos);
		}
	}
	if (next.empty()) {
		return std::unexpected(Error::invalid("Cannot remove every market from subscription " +
											  std::to_string(id) + "; unsubscribe instead"));
	}
	current = std::move(next);
	return {};
}

bool SubscriptionRegistry::bind_sid(CorrelationId id, std::int64_t sid) {
	std::lock_guard lock(mutex_);
	auto it = entries_.find(id);
	if (it == entries_.end()) {
		return false;
	}
	if (it->second.sid) {
		sid_index_.erase(*it->second.sid);
	}
	it->second.sid = sid;
	sid_index_[sid] = id;
	return true;
}

void SubscriptionRegistry::unbind_sid(std::int64_t sid) {
	std::lock_guard lock(mutex_);
	auto it = sid_index_.find(sid);
	if (it == sid_index_.end()) {
		return;
	}
	auto entry = entries_.find(it->second);
	if (entry != entries_.end()) {
		entry->second.sid.reset();
	}
	sid_index_.erase(it);
}

std::optional<CorrelationId> SubscriptionRegistry::resolve_sid(std::int64_t sid) const {
	std::lock_guard lock(mutex_);
	auto it = sid_index_.find(sid);
	if (it == sid_index_.end()) {
		return std::nullopt;
	}
	return it->second;
}

std::optional<std::int64_t> SubscriptionRegistry::sid_of(CorrelationId id) const {
	std::lock_guard lock(mutex_);
	auto it = entries_.find(id);
	if (it == entries_.end()) {
		return std::nullopt;
	}
	return it->second.sid;
}

void SubscriptionRegistry::clear_bindings() {
	std::lock_guard lock(mutex_);
	for (auto& [id, entry] : entries_) {
		entry.sid.reset();
	}
	sid_index_.clear();
}

CorrelationId SubscriptionRegistry::next_command_id() {
	std::lock_guard lock(mutex_);
	return next_id_++;
}

void SubscriptionRegistry::close() {
	std::lock_guard lock(mutex_);
	entries_.clear();
	sid_index_.clear();
	closed_ = true;
}

bool SubscriptionRegistry::is_closed() const {
	std::lock_guard lock(mutex_);
	return closed_;
}

std::size_t SubscriptionRegistry::size() const {
	std::lock_guard lock(mutex_);
	return entries_.size();
}

} // namespace marketlink
