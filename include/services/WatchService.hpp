#pragma once

#include "config/Config.hpp"
#include "services/AsyncService.hpp"
#include "types/FileEvent.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <unordered_map>

struct inotify_event;

namespace fv::services {

/*
 * inotify dispatcher. Watches every configured path (recursively when asked),
 * turns IN_CLOSE_WRITE into a modified event and IN_MOVED_TO into a created
 * event, and hands them to the handler one at a time on the service thread.
 * Files already inside a directory that appears under a watch are handed over
 * as created events.
 */
class WatchService : public AsyncService {
public:
    using Handler = std::function<void(const types::FileEvent&)>;

    WatchService(const config::MonitoringConfig& cfg, Handler handler);
    ~WatchService() override;

    // Opens the inotify instance and installs every watch before the loop starts.
    void start() override;
    void stop() override;

    [[nodiscard]] size_t watchCount() const { return watch_count_.load(); }

protected:
    void runLoop() override;

private:
    config::MonitoringConfig cfg_;
    Handler handler_;
    int fd_ = -1;
    std::unordered_map<int, std::filesystem::path> watches_;
    std::atomic<size_t> watch_count_{0};
    bool limitReached_ = false;

    [[nodiscard]] bool isExcluded(const std::filesystem::path& path) const;

    void addWatchRecursive(const std::filesystem::path& dir);
    bool addWatch(const std::filesystem::path& dir);

    void dispatch(const inotify_event& event);
    void deliverExisting(const std::filesystem::path& dir);
    void deliver(const types::FileEvent& event);
    void closeFd();
};

}
