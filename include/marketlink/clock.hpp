#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>

namespace marketlink {

/// Milliseconds since the Unix epoch from the system clock
[[nodiscard]] std::int64_t wall_clock_ms() noexcept;

/// Non-decreasing millisecond timestamps for request signing
///
/// Reads the wall clock (or an injected source) and never returns a value
/// smaller than one it has already handed out, even if the source steps back.
/// No NTP correction is attempted. A backward step larger than the skew
/// tolerance is logged once per step. Thread-safe.
class ClockGuard {
public:
	using Source = std::function<std::int64_t()>;

	ClockGuard();
	explicit ClockGuard(Source source,
						std::chrono::milliseconds skew_tolerance = std::chrono::milliseconds{1000});

	ClockGuard(const ClockGuard&) = delete;
	ClockGuard& operator=(const ClockGuard&) = delete;

	[[nodiscard]] std::int64_t now_ms();

	/// Last timestamp handed out, 0 before the first call
	[[nodiscard]] std::int64_t last_ms() const noexcept;

	[[nodiscard]] std::chrono::milliseconds skew_tolerance() const noexcept { return skew_tolerance_; }

private:
	Source source_;
	std::chrono::milliseconds skew_tolerance_;
	std::atomic<std::int64_t> last_{0};
	std::atomic<bool> step_reported_{false};
};

} // namespace marketlink
