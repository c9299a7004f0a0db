#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

#include <pthread.h>
#include <algorithm>
#include <string>

namespace lanwatch::infra {

AsioContext::AsioContext(size_t threadCount) : threadCount_(std::max<size_t>(threadCount, 1)) {}

AsioContext::~AsioContext() {
    stop();
}

void AsioContext::start() {
    if (running_.exchange(true)) {
        return;
    }

    workGuard_.emplace(asio::make_work_guard(ioContext_));

    workers_.reserve(threadCount_);
    for (size_t i = 0; i < threadCount_; ++i) {
        workers_.emplace_back([this, i]() {
            // Linux caps thread names at 15 characters.
            auto name = "lanwatch-io-" + std::to_string(i);
            pthread_setname_np(pthread_self(), name.c_str());
            ioContext_.run();
        });
    }

    spdlog::debug("I/O context running on {} worker(s)", threadCount_);
}

void AsioContext::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    workGuard_.reset();
    ioContext_.stop();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    ioContext_.restart();
    spdlog::debug("I/O context stopped");
}

} // namespace lanwatch::infra
