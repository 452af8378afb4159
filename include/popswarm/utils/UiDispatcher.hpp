#pragma once

/**
 * @file UiDispatcher.hpp
 * @brief Hands work from any thread to the single thread that owns the display
 *
 * Xlib calls for popup windows must come from one thread. Sub-behaviors
 * post closures here; the event loop calls drain() between X events.
 */

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace pswarm {

class UiDispatcher {
public:
    using Task = std::function<void()>;

    UiDispatcher();

    UiDispatcher(const UiDispatcher&) = delete;
    UiDispatcher& operator=(const UiDispatcher&) = delete;

    void post(Task task);

    /**
     * @brief Run every task posted so far, including tasks posted by them
     * @return number of tasks run
     */
    size_t drain();

    /**
     * @brief Rebind the owning thread to the caller
     */
    void bindToCurrentThread();

    bool isUiThread() const;

    size_t pending() const;

private:
    mutable std::mutex mutex_;
    std::vector<Task> tasks_;       // in posting order
    std::atomic<std::thread::id> owner_;
};

}
