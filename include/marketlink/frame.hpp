#pragma once

/// @file frame.hpp
/// @brief Streaming command encoding and event decoding

#include "marketlink/error.hpp"
#include "marketlink/subscription.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace marketlink {

// Outbound commands: {"id":N,"cmd":"...","params":{...}}

/// Subscribe command carrying the intent's correlation id
[[nodiscard]] std::string encode_subscribe(const SubscriptionIntent& intent);

[[nodiscard]] std::string encode_unsubscribe(CorrelationId command_id, std::int64_t sid);

[[nodiscard]] std::string encode_update(CorrelationId command_id, std::int64_t sid, Channel channel,
										MarketUpdate action,
										const std::vector<std::string>& market_tickers);

/// Arbitrary command; params_json must be a JSON object
[[nodiscard]] std::string encode_command(CorrelationId command_id, std::string_view cmd,
										 std::string_view params_json);

// Inbound events: {"id"?,"type":"...","sid"?,"seq"?,"msg":{...}}

/// {"type":"subscribed","msg":{"channel":...,"sid":...}}
struct SubscribedAck {
	std::optional<CorrelationId> id;
	std::string channel;
	std::int64_t sid{0};
};

/// {"type":"unsubscribed","sid":...}
struct UnsubscribedAck {
	std::optional<CorrelationId> id;
	std::int64_t sid{0};
};

/// {"type":"ok"} answer to update_subscription and friends
struct OkAck {
	std::optional<CorrelationId> id;
	std::optional<std::int64_t> sid;
	std::string payload;
};

/// {"type":"error","msg":{"code":...,"msg":"..."}}
struct ErrorFrame {
	std::optional<CorrelationId> id;
	std::int64_t code{0};
	std::string message;
};

/// Any other type is channel data
struct DataFrame {
	std::optional<CorrelationId> id;
	std::string type;
	std::optional<Channel> channel; // nullopt for types no channel claims
	std::optional<std::int64_t> sid;
	std::optional<std::int64_t> seq;
	std::optional<std::string> market_ticker;
	std::string payload; // raw JSON text of "msg"
};

using InboundFrame = std::variant<SubscribedAck, UnsubscribedAck, OkAck, ErrorFrame, DataFrame>;

/// Decode and shape-check one inbound frame
/// @return the tagged record, or ParseError describing the first violation
[[nodiscard]] Result<InboundFrame> decode_frame(std::string_view text);

} // namespace marketlink
