#pragma once

/// @file config.hpp
/// @brief Exchange environments and their endpoints

#include <string>
#include <string_view>

namespace marketlink {

/// Exchange environment
enum class Environment { Demo, Production };

[[nodiscard]] constexpr std::string_view to_string(Environment env) noexcept {
	return env == Environment::Demo ? "demo" : "production";
}

/// Hosts and path prefixes of one environment
struct Endpoints {
	std::string rest_base_url;
	std::string ws_base_url;
	std::string api_prefix{"/trade-api/v2"};
	std::string ws_path{"/trade-api/ws/v2"};
};

[[nodiscard]] inline Endpoints endpoints_for(Environment env) {
	if (env == Environment::Demo) {
		return {"https://demo-api.kalshi.co", "wss://demo-api.kalshi.co"};
	}
	return {"https://api.elections.kalshi.com", "wss://api.elections.kalshi.com"};
}

} // namespace marketlink
