#include "marketlink/retry.hpp"

namespace marketlink {

RetryingClient::RetryingClient(const RequestPipeline& pipeline, RetryPolicy policy)
	: pipeline_(pipeline), policy_(std::move(policy)) {}

Result<ParsedResponse> RetryingClient::execute(const ApiRequest& request) const {
	if (!is_idempotent(request.method)) {
		return pipeline_.execute(request);
	}
	return with_retry([this, &request]() { return pipeline_.execute(request); }, policy_);
}

Result<ParsedResponse> RetryingClient::get(std::string_view path, const QueryParams& query) const {
	ApiRequest request;
	request.method = HttpMethod::GET;
	request.path = std::string(path);
	request.query = query;
	return execute(request);
}

Result<ParsedResponse> RetryingClient::post(std::string_view path, std::string body) const {
	return pipeline_.post(path, std::move(body));
}

Result<ParsedResponse> RetryingClient::put(std::string_view path, std::string body) const {
	return pipeline_.put(path, std::move(body));
}

Result<ParsedResponse> RetryingClient::del(std::string_view path,
										   std::optional<std::string> body) const {
	return pipeline_.del(path, std::move(body));
}

const RetryPolicy& RetryingClient::policy() const noexcept {
	return policy_;
}

void RetryingClient::set_policy(RetryPolicy policy) noexcept {
	policy_ = std::move(policy);
}

} // namespace marketlink
