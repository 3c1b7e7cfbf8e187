#pragma once

#include <filesystem>
#include <string>

namespace fv::types {

enum class FileEventKind { Created, Modified };

inline std::string to_string(const FileEventKind k) {
    return k == FileEventKind::Created ? "created" : "modified";
}

// Kind only explains why the file is being looked at; both are handled alike.
struct FileEvent {
    std::filesystem::path path;
    FileEventKind kind = FileEventKind::Modified;
};

}
