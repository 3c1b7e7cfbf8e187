#pragma once

#include "logging/EventSink.hpp"
#include "util/files.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace fv::test {

namespace fs = std::filesystem;

// Scratch directory removed with everything in it when the test ends.
class TempDir {
public:
    TempDir() : path_(fs::temp_directory_path() / ("fv-test-" + util::generate_random_suffix(12))) {
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        // Quarantined files are 0400; make them removable again first.
        for (fs::recursive_directory_iterator it(path_, ec), end; !ec && it != end; it.increment(ec))
            fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, ec);
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const fs::path& path() const { return path_; }
    fs::path operator/(const std::string& rel) const { return path_ / rel; }

private:
    fs::path path_;
};

inline void writeBytes(const fs::path& p, const std::vector<uint8_t>& bytes) {
    if (p.has_parent_path()) fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

inline void writeText(const fs::path& p, const std::string_view text) {
    writeBytes(p, {text.begin(), text.end()});
}

// Creates nested directories under base until the path is at least minLength
// characters long. Anything placed far enough beneath it crosses PATH_MAX,
// which fails with ENAMETOOLONG regardless of privileges.
inline fs::path deepDirectory(const fs::path& base, const size_t minLength) {
    auto p = base;
    while (p.string().size() < minLength) p /= std::string(100, 'd');
    fs::create_directories(p);
    return p;
}

inline std::vector<uint8_t> pdfBytes() {
    const std::string_view body = "%PDF-1.4\n%\xe2\xe3\xcf\xd3\n1 0 obj\n<< /Type /Catalog >>\nendobj\ntrailer\n%%EOF\n";
    return {body.begin(), body.end()};
}

// Captures every security event instead of writing it anywhere.
class RecordingEventSink : public logging::EventSink {
public:
    void emit(const logging::SecurityEvent& event) override {
        std::scoped_lock lock(mutex_);
        events_.push_back(event);
    }

    [[nodiscard]] std::vector<logging::SecurityEvent> events() const {
        std::scoped_lock lock(mutex_);
        return events_;
    }

    [[nodiscard]] size_t count(const std::string& type) const {
        std::scoped_lock lock(mutex_);
        size_t n = 0;
        for (const auto& e : events_) if (e.event_type == type) ++n;
        return n;
    }

    [[nodiscard]] const logging::SecurityEvent* first(const std::string& type) const {
        std::scoped_lock lock(mutex_);
        for (const auto& e : events_) if (e.event_type == type) return &e;
        return nullptr;
    }

private:
    mutable std::mutex mutex_;
    std::vector<logging::SecurityEvent> events_;
};

}
