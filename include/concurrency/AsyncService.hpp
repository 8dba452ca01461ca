#pragma once

#include <atomic>
#include <string>
#include <thread>

namespace pfs::concurrency {

// Runs runLoop() on a dedicated worker thread.
class AsyncService {
public:
    explicit AsyncService(const std::string& serviceName);

    virtual ~AsyncService();

    virtual void start();

    virtual void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    // Blocks until the worker thread has finished.
    void wait();

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::atomic<bool> failed_{false};
    std::thread worker_;

    virtual void runLoop() = 0;
};

}
