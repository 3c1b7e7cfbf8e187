#include "services/AsyncService.hpp"
#include "logging/LogRegistry.hpp"

using namespace fv::services;
using namespace fv::logging;

AsyncService::AsyncService(const std::string& serviceName) : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    stop();
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join();   // previous run ended on its own

    interruptFlag_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            LogRegistry::validator()->error("[{}] Service error: {}", serviceName_, e.what());
        }

        running_.store(false, std::memory_order_release);
    });

    LogRegistry::validator()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    const bool wasRunning = isRunning();
    if (wasRunning) LogRegistry::validator()->info("[{}] Stopping service...", serviceName_);

    interruptFlag_.store(true, std::memory_order_release);

    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) worker_.join();

    running_.store(false, std::memory_order_release);
    if (wasRunning) LogRegistry::validator()->info("[{}] Service stopped.", serviceName_);
}
