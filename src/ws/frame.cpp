#include "marketlink/frame.hpp"
#include "marketlink/json.hpp"

#include <sstream>

namespace marketlink {

namespace {

std::string build_command(CorrelationId id, std::string_view cmd, std::string_view params) {
	std::ostringstream ss;
	ss << "{\"id\":" << id << ",\"cmd\":" << json::quote(cmd) << ",\"params\":" << params << "}";
	return ss.str();
}

// Optional integer member that must be an integer when present
Result<std::optional<std::int64_t>> optional_int(std::string_view object, std::string_view key) {
	std::optional<std::string_view> raw = json::member(object, key);
	if (!raw || *raw == "null") {
		return std::optional<std::int64_t>{};
	}
	std::optional<std::int64_t> value = json::as_int(*raw);
	if (!value) {
		return std::unexpected(Error::parse("\"" + std::string(key) + "\" is not an integer"));
	}
	return value;
}

Result<std::optional<CorrelationId>> optional_id(std::string_view object) {
	Result<std::optional<std::int64_t>> id = optional_int(object, "id");
	if (!id) {
		return std::unexpected(id.error());
	}
	if (!*id) {
		return std::optional<CorrelationId>{};
	}
	if (**id < 0) {
		return std::unexpected(Error::parse("\"id\" is negative"));
	}
	return std::optional<CorrelationId>{static_cast<CorrelationId>(**id)};
}

Result<std::string_view> required_object(std::string_view object, std::string_view key) {
	std::optional<std::string_view> raw = json::member(object, key);
	if (!raw || raw->empty() || raw->front() != '{') {
		return std::unexpected(Error::parse("\"" + std::string(key) + "\" object missing"));
	}
	return *raw;
}

} // namespace

std::string encode_subscribe(const SubscriptionIntent& intent) {
	std::ostringstream params;
	params << "{\"channels\":[" << json::quote(to_string(intent.channel)) << "]";
	if (intent.market_tickers.size() == 1) {
		params << ",\"market_ticker\":" << json::quote(intent.market_tickers.front());
	} else if (!intent.market_tickers.empty()) {
		params << ",\"market_tickers\":" << json::string_array(intent.market_tickers);
	}
	params << "}";
	return build_command(intent.correlation_id, "subscribe", params.str());
}

std::string encode_unsubscribe(CorrelationId command_id, std::int64_t sid) {
	return build_command(command_id, "unsubscribe", "{\"sids\":[" + std::to_string(sid) + "]}");
}

std::string encode_update(CorrelationId command_id, std::int64_t sid, Channel channel,
						  MarketUpdate action, const std::vector<std::string>& market_tickers) {
	std::ostringstream params;
	params << "{\"action\":" << json::quote(action == MarketUpdate::Add ? "add_markets" : "delete_markets")
		   << ",\"channel\":" << json::quote(to_string(channel)) << ",\"sids\":[" << sid << "]"
		   << ",\"market_tickers\":" << json::string_array(market_tickers) << "}";
	return build_command(command_id, "update_subscription", params.str());
}

std::string encode_command(CorrelationId command_id, std::string_view cmd,
						   std::string_view params_json) {
	return build_command(command_id, cmd, params_json);
}

Result<InboundFrame> decode_frame(std::string_view text) {
	if (!json::is_object(text)) {
		return std::unexpected(Error::parse("Frame is not a JSON object"));
	}

	std::optional<std::string> type = json::get_string(text, "type");
	if (!type || type->empty()) {
		return std::unexpected(Error::parse("Frame has no \"type\""));
	}

	Result<std::optional<CorrelationId>> id = optional_id(text);
	if (!id) {
		return std::unexpected(id.error());
	}

	if (*type == "subscribed") {
		Result<std::string_view> msg = required_object(text, "msg");
		if (!msg) {
			return std::unexpected(msg.error());
		}
		std::optional<std::int64_t> sid = json::get_int(*msg, "sid");
		if (!sid) {
			return std::unexpected(Error::parse("subscribed ack without integer \"sid\""));
		}
		SubscribedAck ack;
		ack.id = *id;
		ack.sid = *sid;
		ack.channel = json::get_string(*msg, "channel").value_or("");
		return ack;
	}

	if (*type == "unsubscribed") {
		std::optional<std::int64_t> sid = json::get_int(text, "sid");
		if (!sid) {
			return std::unexpected(Error::parse("unsubscribed ack without integer \"sid\""));
		}
		return UnsubscribedAck{*id, *sid};
	}

	if (*type == "ok") {
		Result<std::optional<std::int64_t>> sid = optional_int(text, "sid");
		if (!sid) {
			return std::unexpected(sid.error());
		}
		OkAck ack;
		ack.id = *id;
		ack.sid = *sid;
		ack.payload = std::string(json::member(text, "msg").value_or(""));
		return ack;
	}

	if (*type == "error") {
		Result<std::string_view> msg = required_object(text, "msg");
		if (!msg) {
			return std::unexpected(msg.error());
		}
		ErrorFrame err;
		err.id = *id;
		err.code = json::get_int(*msg, "code").value_or(0);
		err.message = json::get_string(*msg, "msg").value_or("");
		return err;
	}

	Result<std::string_view> msg = required_object(text, "msg");
	if (!msg) {
		return std::unexpected(msg.error());
	}
	Result<std::optional<std::int64_t>> sid = optional_int(text, "sid");
	if (!sid) {
		return std::unexpected(sid.error());
	}
	Result<std::optional<std::int64_t>> seq = optional_int(text, "seq");
	if (!seq) {
		return std::unexpected(seq.error());
	}

	DataFrame data;
	data.id = *id;
	data.type = *type;
	data.channel = channel_from_string(*type);
	data.sid = *sid;
	data.seq = *seq;
	data.market_ticker = json::get_string(*msg, "market_ticker");
	data.payload = std::string(*msg);
	return data;
}

} // namespace marketlink
