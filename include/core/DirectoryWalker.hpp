#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <vector>

namespace fs = std::filesystem;

namespace fv::core {

class DirectoryWalker {
public:
    struct Entry {
        fs::path path;
        bool is_directory;
        std::uintmax_t size;
        fs::file_time_type last_modified;
    };

    // Return false to leave an entry out. A directory left out is not descended into.
    using Filter = std::function<bool(const fs::directory_entry&)>;

    explicit DirectoryWalker(bool recursive = true);

    // Unreadable sub-trees are logged and skipped. A root that is a regular
    // file yields just that file.
    std::vector<Entry> walk(const fs::path& root, const Filter& filter = nullptr) const;

private:
    bool recursive;
};

}
