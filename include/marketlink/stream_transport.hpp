#pragma once

/// @file stream_transport.hpp
/// @brief Websocket transport seam used by the stream connection manager

#include "marketlink/error.hpp"
#include "marketlink/http_client.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace marketlink {

/// Something that happened on the socket during poll()
struct StreamEvent {
	enum class Kind : std::uint8_t {
		Frame,  // complete text message in data
		Pong,   // answer to our ping
		Idle,   // nothing arrived before the timeout
		Closed  // peer or network closed the connection
	};

	Kind kind{Kind::Idle};
	std::string data;
};

/// One websocket connection at a time
///
/// All members are called from the manager's thread only, so
/// implementations need no internal locking toward the manager.
class StreamTransport {
public:
	virtual ~StreamTransport() = default;

	/// Blocking handshake with extra request headers
	[[nodiscard]] virtual Result<void> open(const std::string& url, const HeaderList& headers) = 0;

	/// Queue one text frame
	[[nodiscard]] virtual Result<void> send(const std::string& frame) = 0;

	[[nodiscard]] virtual Result<void> ping() = 0;

	/// Wait up to timeout for the next event
	[[nodiscard]] virtual StreamEvent poll(std::chrono::milliseconds timeout) = 0;

	/// Release the connection. Safe to call when not open.
	virtual void close() = 0;
};

/// libwebsockets client transport
class LwsTransport final : public StreamTransport {
public:
	struct Config {
		std::chrono::milliseconds handshake_timeout{10000};
		bool verify_ssl{true};
	};

	LwsTransport();
	explicit LwsTransport(Config config);
	~LwsTransport() override;

	LwsTransport(const LwsTransport&) = delete;
	LwsTransport& operator=(const LwsTransport&) = delete;

	[[nodiscard]] Result<void> open(const std::string& url, const HeaderList& headers) override;
	[[nodiscard]] Result<void> send(const std::string& frame) override;
	[[nodiscard]] Result<void> ping() override;
	[[nodiscard]] StreamEvent poll(std::chrono::milliseconds timeout) override;
	void close() override;

	struct Impl;

private:
	std::unique_ptr<Impl> impl_;
};

} // namespace marketlink
