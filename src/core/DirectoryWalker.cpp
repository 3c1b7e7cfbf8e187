#include "core/DirectoryWalker.hpp"
#include "logging/LogRegistry.hpp"

#include <type_traits>
#include <variant>

using namespace fv::core;
using namespace fv::logging;

using DirectoryIteratorVariant = std::variant<
        fs::directory_iterator,
        fs::recursive_directory_iterator
>;

namespace {

void disableRecursion(fs::directory_iterator&) {}
void disableRecursion(fs::recursive_directory_iterator& it) { it.disable_recursion_pending(); }

}

DirectoryWalker::DirectoryWalker(const bool recursive) : recursive(recursive) {}

std::vector<DirectoryWalker::Entry> DirectoryWalker::walk(const fs::path& root, const Filter& filter) const {
    std::vector<Entry> entries;
    std::error_code ec;

    const auto st = fs::symlink_status(root, ec);
    if (!ec && fs::is_regular_file(st)) {
        const fs::directory_entry single(root, ec);
        if (!ec && (!filter || filter(single)))
            entries.push_back({root, false, fs::file_size(root, ec), fs::last_write_time(root, ec)});
        return entries;
    }

    if (ec || !fs::is_directory(st)) {
        LogRegistry::watch()->warn("[DirectoryWalker] Invalid directory path: {}", root.string());
        return entries;
    }

    constexpr auto opts = fs::directory_options::skip_permission_denied;
    DirectoryIteratorVariant it = recursive
                                  ? DirectoryIteratorVariant{fs::recursive_directory_iterator(root, opts, ec)}
                                  : DirectoryIteratorVariant{fs::directory_iterator(root, opts, ec)};
    if (ec) {
        LogRegistry::watch()->warn("[DirectoryWalker] Cannot open {}: {}", root.string(), ec.message());
        return entries;
    }

    std::visit([&filter, &entries](auto& dir_iter) {
        using Iterator = std::remove_reference_t<decltype(dir_iter)>;

        std::error_code iterEc;
        for (; dir_iter != Iterator{}; dir_iter.increment(iterEc)) {
            if (iterEc) break;

            const auto& dir_entry = *dir_iter;
            std::error_code entryEc;
            const bool isDir = dir_entry.is_directory(entryEc) && !dir_entry.is_symlink(entryEc);

            if (filter && !filter(dir_entry)) {
                if (isDir) disableRecursion(dir_iter);
                continue;
            }

            const bool isFile = !isDir && dir_entry.is_regular_file(entryEc);
            Entry entry {
                dir_entry.path(),
                isDir,
                isFile ? dir_entry.file_size(entryEc) : 0,
                dir_entry.last_write_time(entryEc)
            };
            if (entryEc) {
                LogRegistry::watch()->debug("[DirectoryWalker] Error accessing {}: {}", dir_entry.path().string(), entryEc.message());
                continue;
            }

            entries.push_back(std::move(entry));
        }

        if (iterEc) LogRegistry::watch()->warn("[DirectoryWalker] Walk stopped early: {}", iterEc.message());
    }, it);

    return entries;
}
