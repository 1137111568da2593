#include "marketlink/rate_limit.hpp"

#include <thread>

namespace marketlink {

RateLimiter::RateLimiter() : RateLimiter(Config{}) {}

RateLimiter::RateLimiter(Config config) : config_(std::move(config)) {}

RateLimiter::Clock::time_point RateLimiter::acquire() {
	std::lock_guard lock(mutex_);

	if (last_sent_) {
		Clock::time_point earliest = *last_sent_ + config_.min_interval;
		// sleep_until may wake marginally early on some platforms
		while (Clock::now() < earliest) {
			std::this_thread::sleep_until(earliest);
		}
	}

	Clock::time_point granted = Clock::now();
	last_sent_ = granted;
	return granted;
}

bool RateLimiter::try_acquire() {
	std::lock_guard lock(mutex_);
	Clock::time_point now = Clock::now();

	if (last_sent_ && now - *last_sent_ < config_.min_interval) {
		return false;
	}
	last_sent_ = now;
	return true;
}

std::optional<std::chrono::milliseconds> RateLimiter::since_last() const {
	std::lock_guard lock(mutex_);
	if (!last_sent_) {
		return std::nullopt;
	}
	return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - *last_sent_);
}

void RateLimiter::reset() noexcept {
	std::lock_guard lock(mutex_);
	last_sent_.reset();
}

const RateLimiter::Config& RateLimiter::config() const noexcept {
	return config_;
}

// ScopedRateLimit
ScopedRateLimit::ScopedRateLimit(RateLimiter& limiter) : granted_at_(limiter.acquire()) {}

RateLimiter::Clock::time_point ScopedRateLimit::granted_at() const noexcept {
	return granted_at_;
}

} // namespace marketlink
