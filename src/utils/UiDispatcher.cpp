#include "popswarm/utils/UiDispatcher.hpp"
#include <exception>
#include <iostream>

namespace pswarm {

UiDispatcher::UiDispatcher() : owner_(std::this_thread::get_id()) {}

void UiDispatcher::post(Task task) {
    if (!task) return;

    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.push_back(std::move(task));
}

size_t UiDispatcher::drain() {
    size_t ran = 0;
    std::vector<Task> batch;

    // Tasks may post more tasks; keep swapping until a batch comes back empty
    for (;;) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (tasks_.empty()) break;
            batch.swap(tasks_);
        }

        for (auto& task : batch) {
            ++ran;
            try {
                task();
            } catch (const std::exception& e) {
                std::cerr << "UiDispatcher: task failed: " << e.what() << std::endl;
            }
        }
        batch.clear();
    }

    return ran;
}

void UiDispatcher::bindToCurrentThread() {
    owner_.store(std::this_thread::get_id());
}

bool UiDispatcher::isUiThread() const {
    return owner_.load() == std::this_thread::get_id();
}

size_t UiDispatcher::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

}
