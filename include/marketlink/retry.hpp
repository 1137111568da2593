#pragma once

#include "marketlink/error.hpp"
#include "marketlink/request_pipeline.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <random>
#include <thread>

namespace marketlink {

/// Retry and backoff configuration
///
/// Also used for streaming reconnect backoff, where max_attempts is ignored.
struct RetryPolicy {
    std::int32_t max_attempts{3};
    std::chrono::milliseconds initial_delay{100};
    std::chrono::milliseconds max_delay{10000};
    double backoff_multiplier{2.0};
    double jitter_factor{0.1}; // Random jitter as fraction of delay
    bool retry_on_network_error{true};
    bool retry_on_rate_limit{true};
    bool retry_on_server_error{true}; // 5xx errors
};

/// Determines if a failed request should be retried
[[nodiscard]] inline bool should_retry(const Error& error, const RetryPolicy& policy) noexcept {
    switch (error.code) {
        case ErrorCode::NetworkError:
            return policy.retry_on_network_error;
        case ErrorCode::HttpError:
            if (error.http_status == 429) {
                return policy.retry_on_rate_limit;
            }
            return policy.retry_on_server_error && error.http_status >= 500;
        default:
            return false;
    }
}

/// Only GET is replayed automatically; a repeated POST or DELETE could
/// duplicate or cancel orders twice.
[[nodiscard]] constexpr bool is_idempotent(HttpMethod method) noexcept {
    return method == HttpMethod::GET;
}

/// Calculate delay for a retry attempt with exponential backoff and jitter
[[nodiscard]] inline std::chrono::milliseconds calculate_retry_delay(std::int32_t attempt,
                                                                     const RetryPolicy& policy) {
    // Exponential backoff
    double delay_ms = static_cast<double>(policy.initial_delay.count());
    for (std::int32_t i = 1; i < attempt; ++i) {
        delay_ms *= policy.backoff_multiplier;
        if (delay_ms >= static_cast<double>(policy.max_delay.count())) {
            break;
        }
    }

    // Cap at max delay
    delay_ms = std::min(delay_ms, static_cast<double>(policy.max_delay.count()));

    // Add jitter
    if (policy.jitter_factor > 0) {
        static thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_real_distribution<double> dist(1.0 - policy.jitter_factor,
                                                    1.0 + policy.jitter_factor);
        delay_ms *= dist(rng);
    }

    return std::chrono::milliseconds{static_cast<std::int64_t>(delay_ms)};
}

/// Execute an operation with retry logic
///
/// @param operation Callable returning Result<T>
/// @param policy Retry configuration
/// @return Result of the last attempt
template <typename Operation>
[[nodiscard]] auto with_retry(Operation&& operation, const RetryPolicy& policy)
    -> decltype(operation()) {
    std::int32_t attempts = std::max<std::int32_t>(policy.max_attempts, 1);

    for (std::int32_t attempt = 1;; ++attempt) {
        auto result = operation();
        if (result.has_value() || attempt >= attempts || !should_retry(result.error(), policy)) {
            return result;
        }
        std::this_thread::sleep_for(calculate_retry_delay(attempt, policy));
    }
}

/// Request pipeline wrapper with automatic retries for idempotent requests
///
/// GET requests are retried per the policy. Every other method is executed
/// exactly once and its failure is returned as is.
class RetryingClient {
public:
    RetryingClient(const RequestPipeline& pipeline, RetryPolicy policy = {});

    [[nodiscard]] Result<ParsedResponse> execute(const ApiRequest& request) const;

    /// Make a GET request with retries
    [[nodiscard]] Result<ParsedResponse> get(std::string_view path, const QueryParams& query = {}) const;

    /// Make a POST request, never retried
    [[nodiscard]] Result<ParsedResponse> post(std::string_view path, std::string body) const;

    /// Make a PUT request, never retried
    [[nodiscard]] Result<ParsedResponse> put(std::string_view path, std::string body) const;

    /// Make a DELETE request, never retried
    [[nodiscard]] Result<ParsedResponse> del(std::string_view path,
                                             std::optional<std::string> body = std::nullopt) const;

    [[nodiscard]] const RetryPolicy& policy() const noexcept;

    void set_policy(RetryPolicy policy) noexcept;

private:
    const RequestPipeline& pipeline_;
    RetryPolicy policy_;
};

} // namespace marketlink
