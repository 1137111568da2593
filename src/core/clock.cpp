#include "marketlink/clock.hpp"

#include <spdlog/spdlog.h>

namespace marketlink {

std::int64_t wall_clock_ms() noexcept {
	std::chrono::system_clock::time_point now = std::chrono::system_clock::now();
	return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

ClockGuard::ClockGuard() : ClockGuard(wall_clock_ms) {}

ClockGuard::ClockGuard(Source source, std::chrono::milliseconds skew_tolerance)
	: source_(std::move(source)), skew_tolerance_(skew_tolerance) {}

std::int64_t ClockGuard::now_ms() {
	std::int64_t candidate = source_();
	std::int64_t previous = last_.load(std::memory_order_relaxed);
	while (true) {
		if (candidate <= previous) {
			if (previous - candidate > skew_tolerance_.count() &&
				!step_reported_.exchange(true, std::memory_order_relaxed)) {
				spdlog::warn("[ClockGuard] Clock stepped back {} ms, holding at {}",
							 previous - candidate, previous);
			}
			return previous;
		}
		if (last_.compare_exchange_weak(previous, candidate, std::memory_order_acq_rel,
										std::memory_order_relaxed)) {
			step_reported_.store(false, std::memory_order_relaxed);
			return candidate;
		}
	}
}

std::int64_t ClockGuard::last_ms() const noexcept {
	return last_.load(std::memory_order_acquire);
}

} // namespace marketlink
