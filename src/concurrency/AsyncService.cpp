#include "concurrency/AsyncService.hpp"
#include "logging/LogRegistry.hpp"

using namespace pfs::concurrency;
using namespace pfs::logging;

AsyncService::AsyncService(const std::string& serviceName)
    : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    stop();
    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) worker_.join();
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join();

    interruptFlag_.store(false, std::memory_order_release);
    failed_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            failed_.store(true, std::memory_order_release);
            LogRegistry::putiofs()->error("[{}] Service error: {}", serviceName_, e.what());
        }

        running_.store(false, std::memory_order_release);
    });

    LogRegistry::putiofs()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!isRunning()) return;

    LogRegistry::putiofs()->info("[{}] Stopping service...", serviceName_);
    interruptFlag_.store(true, std::memory_order_release);

    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) {
        worker_.join();
    }

    running_.store(false, std::memory_order_release);
    LogRegistry::putiofs()->info("[{}] Service stopped.", serviceName_);
}

void AsyncService::wait() {
    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) worker_.join();
}
