#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>

namespace marketlink {

/// Minimum-spacing rate limiter shared by every REST call site
///
/// Guarantees that two granted sends are never closer than min_interval.
/// Callers that arrive too early are blocked, never rejected. The wait
/// computation, the sleep and the update of the last grant happen under one
/// lock, so concurrent callers cannot both see an expired window and burst.
/// Callers are served in the order they enter the critical section.
class RateLimiter {
public:
	using Clock = std::chrono::steady_clock;

	/// Configuration for rate limiting
	struct Config {
		std::chrono::milliseconds min_interval{100};
	};

	RateLimiter();
	explicit RateLimiter(Config config);

	RateLimiter(const RateLimiter&) = delete;
	RateLimiter& operator=(const RateLimiter&) = delete;

	/// Block until a send is permitted and record it
	/// @return the time point the send was granted at
	Clock::time_point acquire();

	/// Record a send only if no wait is needed
	[[nodiscard]] bool try_acquire();

	/// Time since the last granted send, nullopt before the first one
	[[nodiscard]] std::optional<std::chrono::milliseconds> since_last() const;

	/// Forget the last grant so the next acquire is immediate
	void reset() noexcept;

	[[nodiscard]] const Config& config() const noexcept;

private:
	Config config_;
	mutable std::mutex mutex_;
	std::optional<Clock::time_point> last_sent_;
};

/// Scoped rate limit acquisition
///
/// RAII wrapper that blocks on the limiter during construction.
class ScopedRateLimit {
public:
	explicit ScopedRateLimit(RateLimiter& limiter);

	[[nodiscard]] RateLimiter::Clock::time_point granted_at() const noexcept;

private:
	RateLimiter::Clock::time_point granted_at_;
};

} // namespace marketlink
