#include "marketlink/stream_transport.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <deque>
#include <libwebsockets.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace marketlink {

static int ws_callback(struct lws* wsi, enum lws_callback_reasons reason, void* user, void* in,
					   size_t len);

namespace {

struct ParsedUrl {
	bool use_ssl{true};
	std::string host;
	std::string path{"/"};
	int port{443};
};

Result<ParsedUrl> parse_ws_url(const std::string& url) {
	ParsedUrl parsed;
	size_t host_start = 0;
	if (url.rfind("wss://", 0) == 0) {
		host_start = 6;
	} else if (url.rfind("ws://", 0) == 0) {
		parsed.use_ssl = false;
		parsed.port = 80;
		host_start = 5;
	} else {
		return std::unexpected(Error::invalid("Unsupported websocket URL: " + url));
	}

	size_t path_start = url.find('/', host_start);
	if (path_start != std::string::npos) {
		parsed.host = url.substr(host_start, path_start - host_start);
		parsed.path = url.substr(path_start);
	} else {
		parsed.host = url.substr(host_start);
	}

	size_t port_pos = parsed.host.find(':');
	if (port_pos != std::string::npos) {
		std::string port = parsed.host.substr(port_pos + 1);
		parsed.host = parsed.host.substr(0, port_pos);
		parsed.port = 0;
		for (char c : port) {
			if (c < '0' || c > '9') {
				return std::unexpected(Error::invalid("Bad port in websocket URL: " + url));
			}
			parsed.port = parsed.port * 10 + (c - '0');
		}
	}

	if (parsed.host.empty()) {
		return std::unexpected(Error::invalid("No host in websocket URL: " + url));
	}
	return parsed;
}

} // anonymous namespace

struct LwsTransport::Impl {
	struct Outgoing {
		bool is_ping{false};
		std::string data;
	};

	Config config;

	lws_context* context{nullptr};
	lws* wsi{nullptr};

	// State written by ws_callback, always on the caller's thread inside lws_service
	bool established{false};
	bool failed{false};
	std::string failure;
	HeaderList handshake_headers;
	std::deque<Outgoing> outgoing;
	std::deque<StreamEvent> incoming;
	std::string recv_buffer;

	explicit Impl(Config c) : config(c) {}

	~Impl() { destroy(); }

	void destroy() {
		if (context) {
			lws_context_destroy(context);
			context = nullptr;
		}
		wsi = nullptr;
		established = false;
		outgoing.clear();
		recv_buffer.clear();
	}

	int append_headers(unsigned char** p, unsigned char* end) {
		for (const auto& [name, value] : handshake_headers) {
			std::string token = name + ":";
			if (lws_add_http_header_by_name(wsi, reinterpret_cast<const unsigned char*>(token.c_str()),
											reinterpret_cast<const unsigned char*>(value.data()),
											static_cast<int>(value.size()), p, end)) {
				return -1;
			}
		}
		return 0;
	}

	int write_next(lws* socket) {
		if (outgoing.empty()) {
			return 0;
		}
		Outgoing next = std::move(outgoing.front());
		outgoing.pop_front();

		std::vector<unsigned char> buf(LWS_PRE + next.data.size());
		std::memcpy(buf.data() + LWS_PRE, next.data.data(), next.data.size());
		int written = lws_write(socket, buf.data() + LWS_PRE, next.data.size(),
								next.is_ping ? LWS_WRITE_PING : LWS_WRITE_TEXT);
		if (written < static_cast<int>(next.data.size())) {
			spdlog::warn("[LwsTransport] Short write ({} of {} bytes)", written, next.data.size());
			return -1;
		}

		if (!outgoing.empty()) {
			lws_callback_on_writable(socket);
		}
		return 0;
	}
};

static int ws_callback(struct lws* wsi, enum lws_callback_reasons reason, void* /*user*/, void* in,
					   size_t len) {
	lws_context* context = lws_get_context(wsi);
	auto* impl = context ? static_cast<LwsTransport::Impl*>(lws_context_user(context)) : nullptr;
	if (!impl) {
		return 0;
	}

	switch (reason) {
		case LWS_CALLBACK_CLIENT_APPEND_HANDSHAKE_HEADER: {
			auto** p = static_cast<unsigned char**>(in);
			return impl->append_headers(p, *p + len);
		}

		case LWS_CALLBACK_CLIENT_ESTABLISHED:
			impl->established = true;
			break;

		case LWS_CALLBACK_CLIENT_CONNECTION_ERROR:
			impl->failed = true;
			impl->failure = in ? std::string(static_cast<char*>(in), len) : "connection error";
			if (impl->established) {
				impl->incoming.push_back({StreamEvent::Kind::Closed, impl->failure});
			}
			impl->established = false;
			impl->wsi = nullptr;
			break;

		case LWS_CALLBACK_CLIENT_CLOSED:
			if (impl->established) {
				impl->incoming.push_back({StreamEvent::Kind::Closed, {}});
			}
			impl->established = false;
			impl->wsi = nullptr;
			break;

		case LWS_CALLBACK_CLIENT_RECEIVE:
			if (in && len > 0) {
				impl->recv_buffer.append(static_cast<char*>(in), len);
			}
			if (lws_is_final_fragment(wsi) && lws_remaining_packet_payload(wsi) == 0) {
				impl->incoming.push_back({StreamEvent::Kind::Frame, std::move(impl->recv_buffer)});
				impl->recv_buffer.clear();
			}
			break;

		case LWS_CALLBACK_CLIENT_RECEIVE_PONG:
			impl->incoming.push_back({StreamEvent::Kind::Pong, {}});
			break;

		case LWS_CALLBACK_CLIENT_WRITEABLE:
			return impl->write_next(wsi);

		default:
			break;
	}

	return 0;
}

static const struct lws_protocols protocols[] = {{"marketlink-ws", ws_callback, 0, 65536},
												 LWS_PROTOCOL_LIST_TERM};

LwsTransport::LwsTransport() : LwsTransport(Config{}) {}

LwsTransport::LwsTransport(Config config) : impl_(std::make_unique<Impl>(config)) {}

LwsTransport::~LwsTransport() = default;

Result<void> LwsTransport::open(const std::string& url, const HeaderList& headers) {
	close();

	Result<ParsedUrl> parsed = parse_ws_url(url);
	if (!parsed) {
		return std::unexpected(parsed.error());
	}

	impl_->handshake_headers = headers;
	impl_->failed = false;
	impl_->failure.clear();
	impl_->incoming.clear();

	struct lws_context_creation_info ctx_info {};
	std::memset(&ctx_info, 0, sizeof(ctx_info));
	ctx_info.port = CONTEXT_PORT_NO_LISTEN;
	ctx_info.protocols = protocols;
	ctx_info.user = impl_.get();
	ctx_info.options = LWS_SERVER_OPTION_DO_SSL_GLOBAL_INIT;

	impl_->context = lws_create_context(&ctx_info);
	if (!impl_->context) {
		return std::unexpected(Error::network("Failed to create WebSocket context"));
	}

	struct lws_client_connect_info conn_info {};
	std::memset(&conn_info, 0, sizeof(conn_info));
	conn_info.context = impl_->context;
	conn_info.address = parsed->host.c_str();
	conn_info.port = parsed->port;
	conn_info.path = parsed->path.c_str();
	conn_info.host = parsed->host.c_str();
	conn_info.origin = parsed->host.c_str();
	conn_info.protocol = protocols[0].name;
	if (parsed->use_ssl) {
		conn_info.ssl_connection = LCCSCF_USE_SSL;
		if (!impl_->config.verify_ssl) {
			conn_info.ssl_connection |=
				LCCSCF_ALLOW_SELFSIGNED | LCCSCF_SKIP_SERVER_CERT_HOSTNAME_CHECK;
		}
	}
	conn_info.pwsi = &impl_->wsi;

	if (!lws_client_connect_via_info(&conn_info)) {
		impl_->destroy();
		return std::unexpected(Error::network("Failed to initiate WebSocket connection"));
	}

	auto deadline = std::chrono::steady_clock::now() + impl_->config.handshake_timeout;
	while (!impl_->established && !impl_->failed) {
		if (std::chrono::steady_clock::now() >= deadline) {
			impl_->destroy();
			return std::unexpected(Error::network("WebSocket handshake timeout"));
		}
		lws_service(impl_->context, 50);
	}

	if (!impl_->established) {
		std::string reason = impl_->failure;
		impl_->destroy();
		return std::unexpected(Error::network("WebSocket handshake failed: " + reason));
	}

	spdlog::debug("[LwsTransport] Connected to {}:{}{}", parsed->host, parsed->port, parsed->path);
	return {};
}

Result<void> LwsTransport::send(const std::string& frame) {
	if (!impl_->established || !impl_->wsi) {
		return std::unexpected(Error::network("Not connected"));
	}
	impl_->outgoing.push_back({false, frame});
	lws_callback_on_writable(impl_->wsi);
	return {};
}

Result<void> LwsTransport::ping() {
	if (!impl_->established || !impl_->wsi) {
		return std::unexpected(Error::network("Not connected"));
	}
	impl_->outgoing.push_back({true, {}});
	lws_callback_on_writable(impl_->wsi);
	return {};
}

StreamEvent LwsTransport::poll(std::chrono::milliseconds timeout) {
	if (!impl_->context) {
		return {StreamEvent::Kind::Closed, {}};
	}

	auto deadline = std::chrono::steady_clock::now() + timeout;
	while (impl_->incoming.empty()) {
		auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
			deadline - std::chrono::steady_clock::now());
		if (remaining.count() <= 0) {
			return {StreamEvent::Kind::Idle, {}};
		}
		lws_service(impl_->context, static_cast<int>(std::min<std::int64_t>(remaining.count(), 50)));
	}

	StreamEvent event = std::move(impl_->incoming.front());
	impl_->incoming.pop_front();
	return event;
}

void LwsTransport::close() {
	impl_->destroy();
	impl_->incoming.clear();
}

} // namespace marketlink
