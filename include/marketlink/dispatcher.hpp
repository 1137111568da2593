#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <thread>

namespace marketlink {

/// Runs user callbacks on one worker thread, in posting order
///
/// Keeps slow subscribers off the socket thread. Anything a task throws is
/// logged and the worker moves on to the next task. A task may destroy the
/// dispatcher that runs it: the worker then drains the queue on its own and
/// exits.
class CallbackDispatcher {
public:
	using Task = std::function<void()>;

	CallbackDispatcher();
	~CallbackDispatcher();

	CallbackDispatcher(const CallbackDispatcher&) = delete;
	CallbackDispatcher& operator=(const CallbackDispatcher&) = delete;

	/// Queue a task
	/// @return false once stopped
	bool post(Task task);

	/// Run what is queued, then stop accepting work and join the worker.
	/// Called from inside a task it only stops; the worker exits on its own.
	void stop();

	/// Block until the queue is empty and no task is running
	void wait_idle();

	[[nodiscard]] std::size_t pending() const;

private:
	// Queue and flags, shared with the worker so they outlive the dispatcher
	struct State;

	static void run(const std::shared_ptr<State>& state);

	std::shared_ptr<State> state_;
	std::thread worker_;
	std::thread::id worker_id_;
};

} // namespace marketlink
