#include <gtest/gtest.h>
#include "services/WatchService.hpp"
#include "TestHelpers.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

using namespace fv;
using namespace fv::services;
using namespace fv::test;
using namespace std::chrono_literals;

class WatchServiceTest : public ::testing::Test {
protected:
    TempDir dir;
    config::MonitoringConfig cfg;

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<types::FileEvent> events;

    void SetUp() override {
        fs::create_directories(dir / "watched" / "excluded");
        cfg.watch_paths = {dir / "watched"};
        cfg.excluded_paths = {dir / "watched" / "excluded"};
        cfg.recursive = true;
    }

    WatchService::Handler recorder() {
        return [this](const types::FileEvent& e) {
            {
                std::scoped_lock lock(mutex);
                events.push_back(e);
            }
            cv.notify_all();
        };
    }

    // Waits until an event for the path shows up; returns it.
    std::optional<types::FileEvent> waitFor(const fs::path& p, const std::chrono::milliseconds timeout = 5s) {
        std::unique_lock lock(mutex);
        std::optional<types::FileEvent> found;
        cv.wait_for(lock, timeout, [&] {
            for (const auto& e : events) if (e.path == p) { found = e; return true; }
            return false;
        });
        return found;
    }

    bool sawEventFor(const fs::path& p) {
        std::scoped_lock lock(mutex);
        return std::ranges::any_of(events, [&](const auto& e) { return e.path == p; });
    }
};

TEST_F(WatchServiceTest, ClosedWriteIsModified) {
    WatchService watcher(cfg, recorder());
    watcher.start();
    ASSERT_TRUE(watcher.isRunning());

    const auto file = dir / "watched" / "holiday.jpg";
    writeBytes(file, pdfBytes());

    const auto e = waitFor(file);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->kind, types::FileEventKind::Modified);
    watcher.stop();
}

TEST_F(WatchServiceTest, MovedInIsCreated) {
    const auto outside = dir / "outside.jpg";
    writeBytes(outside, pdfBytes());

    WatchService watcher(cfg, recorder());
    watcher.start();

    const auto target = dir / "watched" / "moved.jpg";
    fs::rename(outside, target);

    const auto e = waitFor(target);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->kind, types::FileEventKind::Created);
}

TEST_F(WatchServiceTest, NewDirectoriesAreWatched) {
    WatchService watcher(cfg, recorder());
    watcher.start();
    const auto before = watcher.watchCount();

    fs::create_directories(dir / "watched" / "new");
    // give the loop a moment to install the watch
    for (int i = 0; i < 50 && watcher.watchCount() == before; ++i) std::this_thread::sleep_for(100ms);
    EXPECT_GT(watcher.watchCount(), before);

    const auto file = dir / "watched" / "new" / "doc.pdf";
    writeBytes(file, pdfBytes());
    EXPECT_TRUE(waitFor(file).has_value());
}

TEST_F(WatchServiceTest, FilesInsideMovedInDirectoryAreDelivered) {
    const auto outside = dir / "outside" / "pkg";
    writeBytes(outside / "invoice.jpg", pdfBytes());
    writeBytes(outside / "nested" / "report.png", pdfBytes());

    WatchService watcher(cfg, recorder());
    watcher.start();
    const auto before = watcher.watchCount();

    const auto target = dir / "watched" / "pkg";
    fs::rename(outside, target);

    const auto invoice = waitFor(target / "invoice.jpg");
    ASSERT_TRUE(invoice.has_value());
    EXPECT_EQ(invoice->kind, types::FileEventKind::Created);

    const auto report = waitFor(target / "nested" / "report.png");
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->kind, types::FileEventKind::Created);

    EXPECT_EQ(watcher.watchCount(), before + 2);
}

TEST_F(WatchServiceTest, MovedInDirectoryUnderExcludedPathIsIgnored) {
    const auto outside = dir / "outside" / "pkg";
    writeBytes(outside / "invoice.jpg", pdfBytes());

    WatchService watcher(cfg, recorder());
    watcher.start();

    fs::rename(outside, dir / "watched" / "excluded" / "pkg");

    const auto visible = dir / "watched" / "visible.jpg";
    writeBytes(visible, pdfBytes());
    ASSERT_TRUE(waitFor(visible).has_value());
    EXPECT_FALSE(sawEventFor(dir / "watched" / "excluded" / "pkg" / "invoice.jpg"));
}

TEST_F(WatchServiceTest, ExcludedDirectoriesAreNotWatched) {
    WatchService watcher(cfg, recorder());
    watcher.start();

    const auto hidden = dir / "watched" / "excluded" / "secret.jpg";
    const auto visible = dir / "watched" / "visible.jpg";
    writeBytes(hidden, pdfBytes());
    writeBytes(visible, pdfBytes());

    ASSERT_TRUE(waitFor(visible).has_value());
    EXPECT_FALSE(sawEventFor(hidden));
}

TEST_F(WatchServiceTest, HandlerFailureDoesNotStopWatching) {
    int calls = 0;
    WatchService watcher(cfg, [&](const types::FileEvent& e) {
        if (++calls == 1) throw std::runtime_error("boom");
        recorder()(e);
    });
    watcher.start();

    writeBytes(dir / "watched" / "first.jpg", pdfBytes());
    std::this_thread::sleep_for(300ms);
    const auto second = dir / "watched" / "second.jpg";
    writeBytes(second, pdfBytes());

    EXPECT_TRUE(waitFor(second).has_value());
    EXPECT_TRUE(watcher.isRunning());
}

TEST_F(WatchServiceTest, StopIsIdempotent) {
    WatchService watcher(cfg, recorder());
    watcher.start();
    watcher.stop();
    EXPECT_FALSE(watcher.isRunning());
    watcher.stop();
    watcher.start();
    EXPECT_TRUE(watcher.isRunning());
}

TEST(WatchServiceCtorTest, RequiresHandler) {
    EXPECT_THROW(WatchService(config::MonitoringConfig{}, nullptr), std::invalid_argument);
}
