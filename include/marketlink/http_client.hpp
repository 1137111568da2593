#pragma once

#include "marketlink/error.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace marketlink {

/// HTTP methods
enum class HttpMethod : std::uint8_t { GET, POST, PUT, DELETE };

/// Convert HTTP method to string
[[nodiscard]] constexpr std::string_view to_string(HttpMethod method) noexcept {
	switch (method) {
		case HttpMethod::GET:
			return "GET";
		case HttpMethod::POST:
			return "POST";
		case HttpMethod::PUT:
			return "PUT";
		case HttpMethod::DELETE:
			return "DELETE";
	}
	return "GET";
}

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/// HTTP response
/// Uses contiguous vector storage for headers instead of unordered_map
/// for better cache locality (typically <10 headers in a response).
struct HttpResponse {
	std::int16_t status_code{0}; // HTTP status codes fit in int16 (100-599)
	std::string body;
	HeaderList headers;

	[[nodiscard]] bool is_success() const noexcept {
		return status_code >= 200 && status_code < 300;
	}

	/// Case-insensitive header lookup, empty if absent
	[[nodiscard]] std::string_view header(std::string_view name) const noexcept;
};

/// A fully prepared request, ready for the wire
struct TransportRequest {
	HttpMethod method{HttpMethod::GET};
	std::string url;
	HeaderList headers;
	std::string body;
	std::chrono::seconds timeout{30};
	bool verify_ssl{true};
};

/// Moves prepared requests over the network
///
/// Implementations must be safe to call from several threads at once.
/// Only transport-level failures are errors; any HTTP status is a response.
class HttpTransport {
public:
	virtual ~HttpTransport() = default;

	[[nodiscard]] virtual Result<HttpResponse> send(const TransportRequest& request) = 0;
};

/// libcurl transport, one easy handle per request
class CurlTransport final : public HttpTransport {
public:
	CurlTransport();
	~CurlTransport() override;

	CurlTransport(const CurlTransport&) = delete;
	CurlTransport& operator=(const CurlTransport&) = delete;

	[[nodiscard]] Result<HttpResponse> send(const TransportRequest& request) override;
};

} // namespace marketlink
