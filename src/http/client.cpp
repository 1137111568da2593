#include "marketlink/http_client.hpp"

#include <cctype>
#include <curl/curl.h>
#include <mutex>
#include <spdlog/spdlog.h>

namespace marketlink {

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
	std::string* response = static_cast<std::string*>(userdata);
	response->append(ptr, size * nmemb);
	return size * nmemb;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
	auto* headers = static_cast<HeaderList*>(userdata);
	std::string line(buffer, size * nitems);

	std::size_t colon = line.find(':');
	if (colon != std::string::npos) {
		std::string key = line.substr(0, colon);
		std::string value = line.substr(colon + 1);
		// Trim whitespace
		while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
			value.erase(0, 1);
		}
		while (!value.empty() && (value.back() == '\r' || value.back() == '\n')) {
			value.pop_back();
		}
		headers->emplace_back(std::move(key), std::move(value));
	}
	return size * nitems;
}

bool iequals(std::string_view a, std::string_view b) {
	if (a.size() != b.size()) {
		return false;
	}
	for (std::size_t i = 0; i < a.size(); ++i) {
		if (std::tolower(static_cast<unsigned char>(a[i])) !=
			std::tolower(static_cast<unsigned char>(b[i]))) {
			return false;
		}
	}
	return true;
}

struct CurlHandleDeleter {
	void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct CurlListDeleter {
	void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

std::once_flag g_curl_init;

} // namespace

std::string_view HttpResponse::header(std::string_view name) const noexcept {
	for (const auto& [key, value] : headers) {
		if (iequals(key, name)) {
			return value;
		}
	}
	return {};
}

CurlTransport::CurlTransport() {
	// curl_global_init is not thread-safe and must run before any easy handle exists
	std::call_once(g_curl_init, [] {
		CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
		if (rc != CURLE_OK) {
			spdlog::error("[CurlTransport] curl_global_init failed: {}", curl_easy_strerror(rc));
		}
	});
}

CurlTransport::~CurlTransport() = default;

Result<HttpResponse> CurlTransport::send(const TransportRequest& request) {
	// A handle per call keeps concurrent requests independent
	std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
	if (!curl) {
		return std::unexpected(Error::network("CURL not initialized"));
	}

	curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
	curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

	switch (request.method) {
		case HttpMethod::GET:
			curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
			break;
		case HttpMethod::POST:
			curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
			break;
		case HttpMethod::PUT:
			curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, "PUT");
			break;
		case HttpMethod::DELETE:
			curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, "DELETE");
			break;
	}

	// DELETE may carry a body too (batched cancels)
	if (!request.body.empty() || request.method == HttpMethod::POST) {
		curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.data());
		curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
	}

	curl_slist* raw_headers = nullptr;
	for (const auto& [name, value] : request.headers) {
		std::string line = name + ": " + value;
		curl_slist* appended = curl_slist_append(raw_headers, line.c_str());
		if (!appended) {
			curl_slist_free_all(raw_headers);
			return std::unexpected(Error::network("Failed to build request headers"));
		}
		raw_headers = appended;
	}
	std::unique_ptr<curl_slist, CurlListDeleter> headers(raw_headers);
	curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

	curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(request.timeout.count()));
	curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, request.verify_ssl ? 1L : 0L);
	curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, request.verify_ssl ? 2L : 0L);

	HttpResponse response;
	curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
	curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
	curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_callback);
	curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response.headers);

	CURLcode res = curl_easy_perform(curl.get());
	if (res != CURLE_OK) {
		return std::unexpected(Error::network(curl_easy_strerror(res)));
	}

	long status_code = 0;
	curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status_code);
	response.status_code = static_cast<std::int16_t>(status_code);

	return response;
}

} // namespace marketlink
