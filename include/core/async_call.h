#pragma once

/**
 * @file async_call.h
 * @brief Bounded-time execution of a blocking call on a worker thread
 */

#include "errors.h"
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <utility>

namespace interview_coach {

/**
 * @brief Runs a task on a detached worker and waits for it with a deadline
 *
 * The task must own everything it touches (copies, shared_ptrs): on timeout
 * the caller walks away and a late result is dropped with the promise.
 * Unlike std::async, destroying an unfinished AsyncCall never blocks.
 */
template<typename T>
class AsyncCall {
public:
    AsyncCall(std::function<Result<T>()> task, std::string what)
        : what_(std::move(what)) {
        auto promise = std::make_shared<std::promise<Result<T>>>();
        future_ = promise->get_future();
        std::thread([promise, task = std::move(task)]() {
            try {
                promise->set_value(task());
            } catch (const std::exception& e) {
                promise->set_value(Result<T>(make_error(ErrorType::Unknown, e.what())));
            }
        }).detach();
    }

    /**
     * @brief Wait for the result
     * @param timeout_ms Deadline; 0 waits without bound
     */
    Result<T> get(int timeout_ms) {
        if (!future_.valid()) {
            return make_invalid_state_error(what_ + ": result already taken");
        }
        if (timeout_ms > 0 &&
            future_.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready) {
            return make_timeout_error(what_ + " timed out after " + std::to_string(timeout_ms) + "ms");
        }
        return future_.get();
    }

private:
    std::string what_;
    std::future<Result<T>> future_;
};

/**
 * @brief Start a task and wait for it in one step
 */
template<typename T>
Result<T> call_with_timeout(std::function<Result<T>()> task, int timeout_ms, const std::string& what) {
    AsyncCall<T> call(std::move(task), what);
    return call.get(timeout_ms);
}

} // namespace interview_coach
