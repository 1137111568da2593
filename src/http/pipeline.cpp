#include "marketlink/json.hpp"
#include "marketlink/request_pipeline.hpp"

#include <spdlog/spdlog.h>

namespace marketlink {

namespace {

constexpr std::size_t kLoggedBodyLimit = 256;

std::string snippet(std::string_view body) {
	if (body.size() <= kLoggedBodyLimit) {
		return std::string(body);
	}
	return std::string(body.substr(0, kLoggedBodyLimit)) + "...";
}

} // namespace

std::string url_encode(std::string_view value) {
	static constexpr char hex[] = "0123456789ABCDEF";
	std::string out;
	out.reserve(value.size());
	for (char c : value) {
		unsigned char uc = static_cast<unsigned char>(c);
		if ((uc >= 'A' && uc <= 'Z') || (uc >= 'a' && uc <= 'z') || (uc >= '0' && uc <= '9') ||
			uc == '-' || uc == '_' || uc == '.' || uc == '~') {
			out.push_back(c);
		} else {
			out.push_back('%');
			out.push_back(hex[uc >> 4]);
			out.push_back(hex[uc & 0x0F]);
		}
	}
	return out;
}

std::string build_query(const QueryParams& params) {
	std::string query;
	for (const auto& [key, value] : params) {
		query += query.empty() ? "?" : "&";
		query += url_encode(key);
		query += "=";
		query += url_encode(value);
	}
	return query;
}

struct RequestPipeline::Impl {
	std::shared_ptr<const Signer> signer;
	std::shared_ptr<RateLimiter> limiter;
	std::shared_ptr<ClockGuard> clock;
	std::unique_ptr<HttpTransport> transport;
	PipelineConfig config;

	Impl(std::shared_ptr<const Signer> s, std::shared_ptr<RateLimiter> l,
		 std::shared_ptr<ClockGuard> c, std::unique_ptr<HttpTransport> t, PipelineConfig cfg)
		: signer(std::move(s)), limiter(std::move(l)), clock(std::move(c)), transport(std::move(t)),
		  config(std::move(cfg)) {}
};

RequestPipeline::RequestPipeline(std::shared_ptr<const Signer> signer,
								 std::shared_ptr<RateLimiter> limiter,
								 std::shared_ptr<ClockGuard> clock,
								 std::unique_ptr<HttpTransport> transport, PipelineConfig config)
	: impl_(std::make_unique<Impl>(std::move(signer), std::move(limiter), std::move(clock),
								   std::move(transport), std::move(config))) {}

RequestPipeline::~RequestPipeline() = default;

RequestPipeline::RequestPipeline(RequestPipeline&&) noexcept = default;

RequestPipeline& RequestPipeline::operator=(RequestPipeline&&) noexcept = default;

const PipelineConfig& RequestPipeline::config() const noexcept {
	return impl_->config;
}

RateLimiter& RequestPipeline::rate_limiter() const noexcept {
	return *impl_->limiter;
}

Result<ParsedResponse> RequestPipeline::execute(HttpMethod method, std::string_view path,
												const QueryParams& query,
												std::optional<std::string> body) const {
	ApiRequest request;
	request.method = method;
	request.path = std::string(path);
	request.query = query;
	request.body = std::move(body);
	return execute(request);
}

Result<ParsedResponse> RequestPipeline::execute(const ApiRequest& request) const {
	if (!impl_->signer || !impl_->limiter || !impl_->clock || !impl_->transport) {
		return std::unexpected(Error::invalid("Request pipeline is not fully configured"));
	}
	if (request.path.empty() || request.path.front() != '/') {
		return std::unexpected(Error::invalid("Request path must start with '/': " + request.path));
	}
	if (request.path.find('?') != std::string::npos) {
		return std::unexpected(Error::invalid("Pass query parameters separately: " + request.path));
	}

	// The limiter lock covers only the pacing decision, not the network call
	RateLimiter::Clock::time_point granted = impl_->limiter->acquire();

	// One reading feeds the signature and any body timestamp
	std::int64_t timestamp_ms = impl_->clock->now_ms();

	std::string signed_path = impl_->config.api_prefix + request.path;
	Result<AuthHeaders> auth = impl_->signer->sign_headers(timestamp_ms, to_string(request.method),
														   signed_path);
	if (!auth) {
		spdlog::error("[RequestPipeline] Signing {} {} failed: {}", to_string(request.method),
					  signed_path, auth.error().message);
		return std::unexpected(auth.error());
	}
	const SignedRequestContext context{request.method, signed_path, timestamp_ms, std::move(*auth)};

	TransportRequest wire;
	wire.method = context.method;
	wire.url = impl_->config.base_url + context.path + build_query(request.query);
	wire.timeout = impl_->config.timeout;
	wire.verify_ssl = impl_->config.verify_ssl;
	wire.headers = {
		{"KALSHI-ACCESS-KEY", context.auth.access_key},
		{"KALSHI-ACCESS-TIMESTAMP", context.auth.timestamp},
		{"KALSHI-ACCESS-SIGNATURE", context.auth.signature},
		{"Content-Type", "application/json"},
		{"Accept", "application/json"},
	};
	if (request.body_builder) {
		wire.body = request.body_builder(context.timestamp_ms);
	} else if (request.body) {
		wire.body = *request.body;
	}

	Result<HttpResponse> response = impl_->transport->send(wire);
	std::chrono::milliseconds elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
		RateLimiter::Clock::now() - granted);

	if (!response) {
		spdlog::warn("[RequestPipeline] {} {} transport failure after {} ms: {}",
					 to_string(context.method), context.path, elapsed.count(),
					 response.error().message);
		return std::unexpected(response.error());
	}

	if (!response->is_success()) {
		spdlog::warn("[RequestPipeline] {} {} -> HTTP {} body='{}'", to_string(context.method),
					 context.path, response->status_code, snippet(response->body));
		return std::unexpected(Error::http(response->status_code, std::move(response->body)));
	}

	spdlog::debug("[RequestPipeline] {} {} -> {} ({} ms)", to_string(context.method), context.path,
				  response->status_code, elapsed.count());

	if (!response->body.empty() && !json::is_valid(response->body)) {
		return std::unexpected(Error::parse("Malformed JSON in " + std::to_string(response->status_code) +
											" response to " + context.path));
	}

	return ParsedResponse{.status_code = response->status_code,
						  .body = std::move(response->body),
						  .headers = std::move(response->headers),
						  .timestamp_ms = context.timestamp_ms};
}

Result<ParsedResponse> RequestPipeline::get(std::string_view path, const QueryParams& query) const {
	return execute(HttpMethod::GET, path, query);
}

Result<ParsedResponse> RequestPipeline::post(std::string_view path, std::string body) const {
	return execute(HttpMethod::POST, path, {}, std::move(body));
}

Result<ParsedResponse> RequestPipeline::put(std::string_view path, std::string body) const {
	return execute(HttpMethod::PUT, path, {}, std::move(body));
}

Result<ParsedResponse> RequestPipeline::del(std::string_view path,
											std::optional<std::string> body) const {
	return execute(HttpMethod::DELETE, path, {}, std::move(body));
}

RequestPipeline make_pipeline(std::shared_ptr<const Signer> signer,
							  std::shared_ptr<RateLimiter> limiter, PipelineConfig config) {
	return RequestPipeline(std::move(signer), std::move(limiter), std::make_shared<ClockGuard>(),
						   std::make_unique<CurlTransport>(), std::move(config));
}

} // namespace marketlink
