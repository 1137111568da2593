/// @file basic_usage.cpp
/// @brief Signed REST call plus a ticker stream against the demo exchange

#include <marketlink/marketlink.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

int main() {
	// Get API credentials from environment
	const char* api_key_id = std::getenv("MARKETLINK_API_KEY_ID");
	const char* api_key_file = std::getenv("MARKETLINK_API_KEY_FILE");

	if (!api_key_id || !api_key_file) {
		spdlog::error("Please set MARKETLINK_API_KEY_ID and MARKETLINK_API_KEY_FILE environment variables");
		return 1;
	}

	std::ifstream file(api_key_file);
	if (!file) {
		spdlog::error("Cannot open key file {}", api_key_file);
		return 1;
	}
	std::stringstream pem;
	pem << file.rdbuf();

	marketlink::Result<marketlink::Signer> signer_result = marketlink::Signer::from_pem(api_key_id, pem.str());
	if (!signer_result) {
		spdlog::error("Failed to create signer: {}", signer_result.error().message);
		return 1;
	}
	auto signer = std::make_shared<const marketlink::Signer>(std::move(*signer_result));

	// REST: one limiter shared by everything that talks to the exchange
	auto limiter = std::make_shared<marketlink::RateLimiter>();
	marketlink::RequestPipeline pipeline = marketlink::make_pipeline(
		signer, limiter, marketlink::PipelineConfig::for_environment(marketlink::Environment::Demo));

	marketlink::Result<marketlink::ParsedResponse> status = pipeline.get("/exchange/status");
	if (!status) {
		spdlog::error("Request failed: {}", status.error().message);
		return 1;
	}
	spdlog::info("Status: {} {}", status->status_code, status->body);

	// Streaming
	marketlink::StreamConnectionManager stream(
		signer, std::make_shared<marketlink::ClockGuard>(), std::make_unique<marketlink::LwsTransport>(),
		marketlink::StreamConfig::for_environment(marketlink::Environment::Demo));

	stream.on_state_change([](marketlink::ConnectionState from, marketlink::ConnectionState to) {
		spdlog::info("Stream {} -> {}", marketlink::to_string(from), marketlink::to_string(to));
	});
	stream.on_error([](const marketlink::StreamError& error) {
		spdlog::warn("Stream error {}: {}", error.exchange_code, error.message);
	});

	marketlink::Result<marketlink::CorrelationId> ticker =
		stream.subscribe(marketlink::Channel::Ticker, {}, [](const marketlink::StreamMessage& msg) {
			spdlog::info("{} {} {}", msg.type, msg.market_ticker.value_or("-"), msg.payload);
		});
	if (!ticker) {
		spdlog::error("Subscribe failed: {}", ticker.error().message);
		return 1;
	}

	if (marketlink::Result<void> started = stream.start(); !started) {
		spdlog::error("Stream failed to start: {}", started.error().message);
		return 1;
	}

	std::this_thread::sleep_for(std::chrono::seconds(30));

	auto stats = stream.stats();
	spdlog::info("Received {} frames, dropped {}, reconnects {}", stats.frames_received,
				 stats.frames_dropped, stats.reconnects);
	stream.close();
	return 0;
}
