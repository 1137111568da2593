#pragma once

#include "marketlink/clock.hpp"
#include "marketlink/config.hpp"
#include "marketlink/error.hpp"
#include "marketlink/http_client.hpp"
#include "marketlink/rate_limit.hpp"
#include "marketlink/signer.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace marketlink {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

/// Percent-encode everything outside the RFC 3986 unreserved set
[[nodiscard]] std::string url_encode(std::string_view value);

/// "?k1=v1&k2=v2", or empty when there are no parameters
[[nodiscard]] std::string build_query(const QueryParams& params);

/// One REST call as issued by an endpoint wrapper
struct ApiRequest {
	HttpMethod method{HttpMethod::GET};
	std::string path; // relative to the API prefix, e.g. "/portfolio/balance"
	QueryParams query;
	std::optional<std::string> body;
	/// Builds the body from the signing timestamp; takes precedence over body
	std::function<std::string(std::int64_t timestamp_ms)> body_builder;
};

/// What a request was signed with. Built once per execute and not reused.
struct SignedRequestContext {
	HttpMethod method;
	std::string path; // full signed path, query excluded
	std::int64_t timestamp_ms;
	AuthHeaders auth;
};

/// Successful (2xx) response with a validated payload
struct ParsedResponse {
	std::int16_t status_code{0};
	std::string body; // empty, or one well-formed JSON value
	HeaderList headers;
	std::int64_t timestamp_ms{0}; // timestamp the request was signed with
};

/// Request pipeline configuration
struct PipelineConfig {
	std::string base_url{"https://api.elections.kalshi.com"};
	std::string api_prefix{"/trade-api/v2"};
	std::chrono::seconds timeout{30};
	bool verify_ssl{true};

	[[nodiscard]] static PipelineConfig for_environment(Environment env) {
		Endpoints endpoints = endpoints_for(env);
		PipelineConfig config;
		config.base_url = endpoints.rest_base_url;
		config.api_prefix = endpoints.api_prefix;
		return config;
	}
};

/// Authenticated, rate-limited REST pipeline
///
/// Every call goes through: rate limiter permit -> one clock reading -> sign
/// -> transport -> classify. Nothing is retried here; see RetryingClient.
///
/// Thread-safe: pipelines sharing one RateLimiter pace each other.
class RequestPipeline {
public:
	RequestPipeline(std::shared_ptr<const Signer> signer, std::shared_ptr<RateLimiter> limiter,
					std::shared_ptr<ClockGuard> clock, std::unique_ptr<HttpTransport> transport,
					PipelineConfig config = {});
	~RequestPipeline();

	RequestPipeline(RequestPipeline&&) noexcept;
	RequestPipeline& operator=(RequestPipeline&&) noexcept;

	// Non-copyable
	RequestPipeline(const RequestPipeline&) = delete;
	RequestPipeline& operator=(const RequestPipeline&) = delete;

	/// Execute a request
	/// @return the 2xx response, or HttpError / NetworkError / SigningError / ParseError
	[[nodiscard]] Result<ParsedResponse> execute(HttpMethod method, std::string_view path,
												 const QueryParams& query = {},
												 std::optional<std::string> body = std::nullopt) const;

	[[nodiscard]] Result<ParsedResponse> execute(const ApiRequest& request) const;

	[[nodiscard]] Result<ParsedResponse> get(std::string_view path, const QueryParams& query = {}) const;

	[[nodiscard]] Result<ParsedResponse> post(std::string_view path, std::string body) const;

	[[nodiscard]] Result<ParsedResponse> put(std::string_view path, std::string body) const;

	[[nodiscard]] Result<ParsedResponse> del(std::string_view path,
											 std::optional<std::string> body = std::nullopt) const;

	[[nodiscard]] const PipelineConfig& config() const noexcept;

	[[nodiscard]] RateLimiter& rate_limiter() const noexcept;

private:
	struct Impl;
	std::unique_ptr<Impl> impl_;
};

/// Build a production pipeline: libcurl transport, fresh clock guard
[[nodiscard]] RequestPipeline make_pipeline(std::shared_ptr<const Signer> signer,
											std::shared_ptr<RateLimiter> limiter,
											PipelineConfig config = {});

} // namespace marketlink
