#include "marketlink/request_pipeline.hpp"
#include "marketlink/retry.hpp"

#include "test_keys.hpp"
#include "test_support.hpp"

#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace {

// Records every request and answers from a script (or 200 "{}" once it runs dry)
struct FakeHttp {
	std::mutex mutex;
	std::vector<marketlink::TransportRequest> requests;
	std::deque<marketlink::Result<marketlink::HttpResponse>> script;

	std::size_t count() {
		std::lock_guard lock(mutex);
		return requests.size();
	}

	marketlink::TransportRequest last() {
		std::lock_guard lock(mutex);
		return requests.back();
	}
};

class FakeHttpTransport final : public marketlink::HttpTransport {
public:
	explicit FakeHttpTransport(std::shared_ptr<FakeHttp> state) : state_(std::move(state)) {}

	marketlink::Result<marketlink::HttpResponse>
	send(const marketlink::TransportRequest& request) override {
		std::lock_guard lock(state_->mutex);
		state_->requests.push_back(request);
		if (state_->script.empty()) {
			return marketlink::HttpResponse{200, "{}", {}};
		}
		auto next = std::move(state_->script.front());
		state_->script.pop_front();
		return next;
	}

private:
	std::shared_ptr<FakeHttp> state_;
};

std::shared_ptr<const marketlink::Signer> test_signer() {
	static std::shared_ptr<const marketlink::Signer> signer = [] {
		auto result = marketlink::Signer::from_pem("key-abc", test_keys::shared_rsa_pem());
		if (!result) {
			throw std::runtime_error("test key rejected");
		}
		return std::make_shared<const marketlink::Signer>(std::move(*result));
	}();
	return signer;
}

struct Harness {
	std::shared_ptr<FakeHttp> http = std::make_shared<FakeHttp>();
	std::shared_ptr<marketlink::RateLimiter> limiter;
	std::shared_ptr<marketlink::ClockGuard> clock;
	marketlink::RequestPipeline pipeline;

	explicit Harness(std::chrono::milliseconds interval = 1ms,
					 marketlink::ClockGuard::Source source = marketlink::wall_clock_ms)
		: limiter(std::make_shared<marketlink::RateLimiter>(
			  marketlink::RateLimiter::Config{.min_interval = interval})),
		  clock(std::make_shared<marketlink::ClockGuard>(std::move(source))),
		  pipeline(test_signer(), limiter, clock, std::make_unique<FakeHttpTransport>(http),
				   marketlink::PipelineConfig::for_environment(marketlink::Environment::Demo)) {}
};

std::string header_value(const marketlink::HeaderList& headers, const std::string& name) {
	for (const auto& [key, value] : headers) {
		if (key == name) {
			return value;
		}
	}
	return {};
}

std::vector<unsigned char> decode_base64(const std::string& text) {
	std::vector<unsigned char> out(text.size());
	int len = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
							  static_cast<int>(text.size()));
	if (len < 0) {
		throw std::runtime_error("bad base64");
	}
	std::size_t padding = 0;
	for (auto it = text.rbegin(); it != text.rend() && *it == '='; ++it) {
		++padding;
	}
	out.resize(static_cast<std::size_t>(len) - padding);
	return out;
}

} // namespace

TEST(pipeline_url_encode_and_query) {
	ASSERT_EQ(marketlink::url_encode("a b&c=d/é"), std::string("a%20b%26c%3Dd%2F%C3%A9"));
	ASSERT_EQ(marketlink::build_query({}), std::string(""));
	ASSERT_EQ(marketlink::build_query({{"limit", "5"}, {"status", "open"}}),
			  std::string("?limit=5&status=open"));
}

TEST(pipeline_environment_endpoints) {
	auto demo = marketlink::PipelineConfig::for_environment(marketlink::Environment::Demo);
	auto prod = marketlink::PipelineConfig::for_environment(marketlink::Environment::Production);
	ASSERT_EQ(demo.base_url, std::string("https://demo-api.kalshi.co"));
	ASSERT_EQ(prod.base_url, std::string("https://api.elections.kalshi.com"));
	ASSERT_EQ(prod.api_prefix, std::string("/trade-api/v2"));
}

TEST(pipeline_attaches_auth_headers) {
	Harness h(1ms, [] { return std::int64_t{1700000000000}; });
	auto response = h.pipeline.get("/portfolio/balance");
	ASSERT_TRUE(response.has_value());
	ASSERT_EQ(response->status_code, 200);
	ASSERT_EQ(response->timestamp_ms, 1700000000000);

	marketlink::TransportRequest sent = h.http->last();
	ASSERT_EQ(sent.method, marketlink::HttpMethod::GET);
	ASSERT_EQ(sent.url, std::string("https://demo-api.kalshi.co/trade-api/v2/portfolio/balance"));
	ASSERT_EQ(header_value(sent.headers, "KALSHI-ACCESS-KEY"), std::string("key-abc"));
	ASSERT_EQ(header_value(sent.headers, "KALSHI-ACCESS-TIMESTAMP"), std::string("1700000000000"));

	auto signature = decode_base64(header_value(sent.headers, "KALSHI-ACCESS-SIGNATURE"));
	auto verified = test_signer()->verify(1700000000000, "GET", "/trade-api/v2/portfolio/balance",
										  signature);
	ASSERT_TRUE(verified.has_value() && *verified);
}

TEST(pipeline_query_not_signed) {
	Harness h(1ms, [] { return std::int64_t{1234}; });
	auto response = h.pipeline.get("/markets", {{"limit", "2"}, {"cursor", "a b"}});
	ASSERT_TRUE(response.has_value());

	marketlink::TransportRequest sent = h.http->last();
	ASSERT_EQ(sent.url, std::string("https://demo-api.kalshi.co/trade-api/v2/markets?limit=2&cursor=a%20b"));
	auto signature = decode_base64(header_value(sent.headers, "KALSHI-ACCESS-SIGNATURE"));
	auto verified = test_signer()->verify(1234, "GET", "/trade-api/v2/markets", signature);
	ASSERT_TRUE(verified.has_value() && *verified);
}

TEST(pipeline_rejects_query_in_path) {
	Harness h;
	auto response = h.pipeline.get("/markets?limit=2");
	ASSERT_FALSE(response.has_value());
	ASSERT_EQ(response.error().code, marketlink::ErrorCode::InvalidRequest);
	ASSERT_EQ(h.http->count(), 0u);

	auto relative = h.pipeline.get("markets");
	ASSERT_FALSE(relative.has_value());
	ASSERT_EQ(h.http->count(), 0u);
}

TEST(pipeline_http_error_keeps_status_and_body) {
	Harness h;
	h.http->script.push_back(marketlink::HttpResponse{400, R"({"error":{"code":"invalid_order"}})", {}});
	auto response = h.pipeline.post("/portfolio/orders", R"({"ticker":"X"})");
	ASSERT_FALSE(response.has_value());
	ASSERT_EQ(response.error().code, marketlink::ErrorCode::HttpError);
	ASSERT_EQ(response.error().http_status, 400);
	ASSERT_EQ(response.error().body, std::string(R"({"error":{"code":"invalid_order"}})"));
}

TEST(pipeline_network_error_not_retried) {
	Harness h;
	h.http->script.push_back(std::unexpected(marketlink::Error::network("connection refused")));
	auto response = h.pipeline.get("/exchange/status");
	ASSERT_FALSE(response.has_value());
	ASSERT_EQ(response.error().code, marketlink::ErrorCode::NetworkError);
	ASSERT_EQ(h.http->count(), 1u);
}

TEST(pipeline_malformed_success_body_is_parse_error) {
	Harness h;
	h.http->script.push_back(marketlink::HttpResponse{200, "{\"balance\": 10", {}});
	auto response = h.pipeline.get("/portfolio/balance");
	ASSERT_FALSE(response.has_value());
	ASSERT_EQ(response.error().code, marketlink::ErrorCode::ParseError);
}

TEST(pipeline_empty_success_body_allowed) {
	Harness h;
	h.http->script.push_back(marketlink::HttpResponse{204, "", {}});
	auto response = h.pipeline.del("/portfolio/orders/abc");
	ASSERT_TRUE(response.has_value());
	ASSERT_EQ(response->status_code, 204);
	ASSERT_EQ(h.http->last().method, marketlink::HttpMethod::DELETE);
}

TEST(pipeline_delete_and_put_carry_body) {
	Harness h;
	auto batched = h.pipeline.del("/portfolio/orders/batched", std::string(R"({"ids":["a","b"]})"));
	ASSERT_TRUE(batched.has_value());
	ASSERT_EQ(h.http->last().body, std::string(R"({"ids":["a","b"]})"));

	auto put = h.pipeline.put("/portfolio/orders/abc/amend", R"({"count":3})");
	ASSERT_TRUE(put.has_value());
	ASSERT_EQ(h.http->last().method, marketlink::HttpMethod::PUT);
	ASSERT_EQ(h.http->last().body, std::string(R"({"count":3})"));
}

TEST(pipeline_body_builder_gets_signing_timestamp) {
	Harness h(1ms, [] { return std::int64_t{1700000000555}; });
	marketlink::ApiRequest request;
	request.method = marketlink::HttpMethod::POST;
	request.path = "/portfolio/orders";
	request.body_builder = [](std::int64_t ts) {
		return "{\"client_order_id\":\"order-" + std::to_string(ts) + "\"}";
	};

	auto response = h.pipeline.execute(request);
	ASSERT_TRUE(response.has_value());
	marketlink::TransportRequest sent = h.http->last();
	ASSERT_EQ(sent.body, std::string("{\"client_order_id\":\"order-1700000000555\"}"));
	ASSERT_EQ(header_value(sent.headers, "KALSHI-ACCESS-TIMESTAMP"), std::string("1700000000555"));
}

TEST(pipeline_timestamps_never_decrease) {
	std::int64_t readings[] = {5000, 4000, 6000};
	int index = 0;
	Harness h(1ms, [&] { return readings[index++]; });
	ASSERT_TRUE(h.pipeline.get("/a").has_value());
	ASSERT_TRUE(h.pipeline.get("/b").has_value());
	ASSERT_EQ(header_value(h.http->last().headers, "KALSHI-ACCESS-TIMESTAMP"), std::string("5000"));
	ASSERT_TRUE(h.pipeline.get("/c").has_value());
	ASSERT_EQ(header_value(h.http->last().headers, "KALSHI-ACCESS-TIMESTAMP"), std::string("6000"));
}

TEST(pipeline_twenty_calls_respect_spacing) {
	Harness h(10ms);
	auto start = std::chrono::steady_clock::now();
	for (int i = 0; i < 20; ++i) {
		ASSERT_TRUE(h.pipeline.get("/exchange/status").has_value());
	}
	ASSERT_TRUE(std::chrono::steady_clock::now() - start >= 19 * 10ms);
	ASSERT_EQ(h.http->count(), 20u);
}

TEST(pipeline_shared_limiter_paces_two_pipelines) {
	auto limiter = std::make_shared<marketlink::RateLimiter>(
		marketlink::RateLimiter::Config{.min_interval = 15ms});
	auto http = std::make_shared<FakeHttp>();
	marketlink::RequestPipeline a(test_signer(), limiter, std::make_shared<marketlink::ClockGuard>(),
								  std::make_unique<FakeHttpTransport>(http));
	marketlink::RequestPipeline b(test_signer(), limiter, std::make_shared<marketlink::ClockGuard>(),
								  std::make_unique<FakeHttpTransport>(http));

	auto start = std::chrono::steady_clock::now();
	for (int i = 0; i < 3; ++i) {
		ASSERT_TRUE(a.get("/x").has_value());
		ASSERT_TRUE(b.get("/y").has_value());
	}
	ASSERT_TRUE(std::chrono::steady_clock::now() - start >= 5 * 15ms);
}

TEST(retrying_client_retries_get) {
	Harness h;
	h.http->script.push_back(std::unexpected(marketlink::Error::network("reset")));
	h.http->script.push_back(marketlink::HttpResponse{503, "busy", {}});
	h.http->script.push_back(marketlink::HttpResponse{200, R"({"exchange_active":true})", {}});

	marketlink::RetryPolicy policy;
	policy.max_attempts = 3;
	policy.initial_delay = 1ms;
	marketlink::RetryingClient client(h.pipeline, policy);

	auto response = client.get("/exchange/status");
	ASSERT_TRUE(response.has_value());
	ASSERT_EQ(response->body, std::string(R"({"exchange_active":true})"));
	ASSERT_EQ(h.http->count(), 3u);
}

TEST(retrying_client_never_retries_post) {
	Harness h;
	h.http->script.push_back(std::unexpected(marketlink::Error::network("reset")));

	marketlink::RetryPolicy policy;
	policy.max_attempts = 5;
	policy.initial_delay = 1ms;
	marketlink::RetryingClient client(h.pipeline, policy);

	auto response = client.post("/portfolio/orders", "{}");
	ASSERT_FALSE(response.has_value());
	ASSERT_EQ(response.error().code, marketlink::ErrorCode::NetworkError);
	ASSERT_EQ(h.http->count(), 1u);
}

TEST(http_response_header_lookup_ignores_case) {
	marketlink::HttpResponse response{200, "", {{"Content-Type", "application/json"}}};
	ASSERT_EQ(response.header("content-type"), std::string_view("application/json"));
	ASSERT_TRUE(response.header("X-Missing").empty());
	ASSERT_TRUE(response.is_success());
}
