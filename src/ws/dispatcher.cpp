#include "marketlink/dispatcher.hpp"

#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <spdlog/spdlog.h>

namespace marketlink {

struct CallbackDispatcher::State {
	mutable std::mutex mutex;
	std::condition_variable work_cv;
	std::condition_variable idle_cv;
	std::deque<Task> tasks;
	bool stopping{false};
	bool busy{false};
	bool finished{false};
};

CallbackDispatcher::CallbackDispatcher()
	: state_(std::make_shared<State>()), worker_([state = state_] { run(state); }) {
	worker_id_ = worker_.get_id();
}

CallbackDispatcher::~CallbackDispatcher() {
	stop();
	if (worker_.joinable()) {
		// Destroyed from one of its own tasks; the worker holds its own reference to the state
		worker_.detach();
	}
}

bool CallbackDispatcher::post(Task task) {
	{
		std::lock_guard lock(state_->mutex);
		if (state_->stopping) {
			return false;
		}
		state_->tasks.push_back(std::move(task));
	}
	state_->work_cv.notify_one();
	return true;
}

void CallbackDispatcher::stop() {
	{
		std::lock_guard lock(state_->mutex);
		state_->stopping = true;
	}
	state_->work_cv.notify_all();
	if (worker_.joinable() && worker_id_ != std::this_thread::get_id()) {
		worker_.join();
	}
}

void CallbackDispatcher::wait_idle() {
	if (worker_id_ == std::this_thread::get_id()) {
		return;
	}
	std::unique_lock lock(state_->mutex);
	state_->idle_cv.wait(lock, [this] {
		return (state_->tasks.empty() && !state_->busy) || state_->finished;
	});
}

std::size_t CallbackDispatcher::pending() const {
	std::lock_guard lock(state_->mutex);
	return state_->tasks.size() + (state_->busy ? 1 : 0);
}

// Touches nothing but the shared state, which may outlive the dispatcher
void CallbackDispatcher::run(const std::shared_ptr<State>& state) {
	std::unique_lock lock(state->mutex);
	while (true) {
		state->work_cv.wait(lock, [&] { return state->stopping || !state->tasks.empty(); });
		if (state->tasks.empty()) {
			break; // stopping and drained
		}

		Task task = std::move(state->tasks.front());
		state->tasks.pop_front();
		state->busy = true;
		lock.unlock();

		try {
			task();
		} catch (const std::exception& e) {
			spdlog::error("[CallbackDispatcher] Callback threw: {}", e.what());
		} catch (...) {
			spdlog::error("[CallbackDispatcher] Callback threw a non-standard exception");
		}
		task = nullptr;

		lock.lock();
		state->busy = false;
		if (state->tasks.empty()) {
			state->idle_cv.notify_all();
		}
	}
	state->finished = true;
	state->idle_cv.notify_all();
}

} // namespace marketlink
