#include "services/WatchService.hpp"
#include "core/DirectoryWalker.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <stdexcept>
#include <sys/inotify.h>
#include <sys/select.h>
#include <unistd.h>

using namespace fv::services;
using namespace fv::logging;

namespace fs = std::filesystem;

namespace {

constexpr uint32_t WATCH_MASK = IN_CLOSE_WRITE | IN_MOVED_TO | IN_CREATE | IN_ONLYDIR;
constexpr size_t EVENT_BUF_LEN = 64 * (sizeof(inotify_event) + NAME_MAX + 1);

}

WatchService::WatchService(const config::MonitoringConfig& cfg, Handler handler)
    : AsyncService("WatchService"), cfg_(cfg), handler_(std::move(handler)) {
    if (!handler_) throw std::invalid_argument("WatchService requires an event handler");
}

WatchService::~WatchService() {
    stop();
    closeFd();
}

void WatchService::start() {
    if (isRunning()) return;

    closeFd();
    fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd_ < 0) throw std::runtime_error(std::string("inotify_init1 failed: ") + std::strerror(errno));

    watches_.clear();
    watch_count_.store(0);
    limitReached_ = false;

    for (const auto& root : cfg_.watch_paths) {
        std::error_code ec;
        if (!fs::is_directory(root, ec)) {
            LogRegistry::watch()->warn("[WatchService] Watch path {} is not a directory, skipping", root.string());
            continue;
        }
        if (cfg_.recursive) addWatchRecursive(root);
        else addWatch(root);
    }

    LogRegistry::validator()->info("[WatchService] Watching {} directories", watch_count_.load());
    AsyncService::start();
}

void WatchService::stop() {
    AsyncService::stop();
    closeFd();
}

void WatchService::runLoop() {
    alignas(inotify_event) char buffer[EVENT_BUF_LEN];

    while (!interruptFlag_.load(std::memory_order_acquire)) {
        fd_set fds;
        FD_ZERO(&fds);
        FD_SET(fd_, &fds);

        timeval timeout{};
        timeout.tv_sec = 1;

        const int ret = ::select(fd_ + 1, &fds, nullptr, nullptr, &timeout);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error(std::string("select() failed: ") + std::strerror(errno));
        }
        if (ret == 0) continue;

        const ssize_t len = ::read(fd_, buffer, sizeof(buffer));
        if (len < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            throw std::runtime_error(std::string("read() on inotify fd failed: ") + std::strerror(errno));
        }

        for (ssize_t i = 0; i < len;) {
            const auto* event = reinterpret_cast<const inotify_event*>(&buffer[i]);
            dispatch(*event);
            i += static_cast<ssize_t>(sizeof(inotify_event) + event->len);
        }
    }
}

void WatchService::dispatch(const inotify_event& event) {
    if (event.mask & IN_Q_OVERFLOW) {
        LogRegistry::watch()->warn("[WatchService] Event queue overflowed, some changes were missed");
        return;
    }

    const auto it = watches_.find(event.wd);
    if (it == watches_.end()) return;

    if (event.mask & IN_IGNORED) {
        watches_.erase(it);
        watch_count_.store(watches_.size());
        return;
    }

    if (event.len == 0) return;
    const auto path = it->second / event.name;

    if (isExcluded(path)) return;

    if (event.mask & IN_ISDIR) {
        if (cfg_.recursive && (event.mask & (IN_CREATE | IN_MOVED_TO))) {
            addWatchRecursive(path);
            deliverExisting(path);
        }
        return;
    }

    types::FileEvent fe;
    fe.path = path;
    if (event.mask & IN_CLOSE_WRITE) fe.kind = types::FileEventKind::Modified;
    else if (event.mask & IN_MOVED_TO) fe.kind = types::FileEventKind::Created;
    else return;   // plain IN_CREATE: wait for the writer to close the file

    deliver(fe);
}

void WatchService::deliverExisting(const fs::path& dir) {
    // A directory moved or copied in arrives with its files already inside;
    // none of them produce an event of their own. Files still being written
    // are seen again on their IN_CLOSE_WRITE.
    const core::DirectoryWalker walker(true);
    const auto entries = walker.walk(dir, [this](const fs::directory_entry& e) { return !isExcluded(e.path()); });

    size_t delivered = 0;
    for (const auto& entry : entries) {
        if (interruptFlag_.load(std::memory_order_acquire)) break;
        if (entry.is_directory) continue;
        deliver({entry.path, types::FileEventKind::Created});
        ++delivered;
    }

    if (delivered) LogRegistry::watch()->debug("[WatchService] Delivered {} files found in new directory {}", delivered, dir.string());
}

void WatchService::deliver(const types::FileEvent& event) {
    try {
        handler_(event);
    } catch (const std::exception& e) {
        LogRegistry::watch()->error("[WatchService] Handler failed for {}: {}", event.path.string(), e.what());
    }
}

bool WatchService::isExcluded(const fs::path& path) const {
    return std::ranges::any_of(cfg_.excluded_paths, [&path](const fs::path& prefix) {
        return util::isSameOrUnder(path, prefix);
    });
}

bool WatchService::addWatch(const fs::path& dir) {
    if (limitReached_ || isExcluded(dir)) return false;

    const int wd = ::inotify_add_watch(fd_, dir.c_str(), WATCH_MASK);
    if (wd < 0) {
        if (errno == ENOSPC) {
            limitReached_ = true;
            LogRegistry::watch()->error("[WatchService] inotify watch limit reached ({} watches), not every directory is monitored. "
                                        "Raise fs.inotify.max_user_watches to cover more.", watches_.size());
        } else {
            LogRegistry::watch()->warn("[WatchService] Failed to watch {}: {}", dir.string(), std::strerror(errno));
        }
        return false;
    }

    watches_[wd] = dir;
    watch_count_.store(watches_.size());
    return true;
}

void WatchService::addWatchRecursive(const fs::path& dir) {
    if (!addWatch(dir)) return;

    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    for (const fs::recursive_directory_iterator end{}; !ec && it != end; it.increment(ec)) {
        std::error_code entryEc;
        if (it->is_symlink(entryEc) || !it->is_directory(entryEc)) continue;

        if (isExcluded(it->path()) || !addWatch(it->path())) {
            it.disable_recursion_pending();
            if (limitReached_) return;
        }
    }

    if (ec) LogRegistry::watch()->debug("[WatchService] Stopped descending {}: {}", dir.string(), ec.message());
}

void WatchService::closeFd() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}
