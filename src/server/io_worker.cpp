/**
 * FERRY - HTTP Load Balancer
 * IoWorker implementation
 */

#include "server/io_worker.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace ferry::server {

IoWorker::IoWorker(std::string name)
    : name_(std::move(name))
    , work_guard_(asio::make_work_guard(io_context_))
    , thread_([this](std::stop_token st) { run(st); }) {
    spdlog::debug("IoWorker[{}]: Started", name_);
}

IoWorker::~IoWorker() {
    stop();
}

void IoWorker::stop() {
    if (!thread_.joinable()) {
        return;
    }
    work_guard_.reset();
    thread_.request_stop();
    io_context_.stop();
    thread_.join();
    spdlog::debug("IoWorker[{}]: Stopped", name_);
}

void IoWorker::run(std::stop_token stop_token) {
    while (!stop_token.stop_requested()) {
        try {
            io_context_.run();
            return;
        } catch (const std::exception& e) {
            spdlog::error("IoWorker[{}]: Caught exception: {}", name_, e.what());
        }
    }
}

} // namespace ferry::server
