#include "util/files.hpp"

#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <fstream>
#include <random>
#include <sstream>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

struct FdGuard {
    int fd = -1;
    ~FdGuard() { if (fd >= 0) ::close(fd); }
};

[[noreturn]] void throwErrno(const std::string& what, const fs::path& path) {
    throw std::system_error(errno, std::generic_category(), what + " " + path.string());
}

}

std::vector<uint8_t> fv::util::readFilePrefix(const fs::path& path, const size_t maxBytes) {
    FdGuard guard{::open(path.c_str(), O_RDONLY | O_CLOEXEC | O_NOCTTY | O_NONBLOCK)};
    if (guard.fd < 0) throwErrno("Failed to open", path);

    struct stat st{};
    if (::fstat(guard.fd, &st) != 0) throwErrno("Failed to stat", path);
    if (S_ISDIR(st.st_mode)) throw std::system_error(EISDIR, std::generic_category(), "Is a directory " + path.string());
    if (!S_ISREG(st.st_mode)) throw std::system_error(EINVAL, std::generic_category(), "Not a regular file " + path.string());

    std::vector<uint8_t> buffer(maxBytes);
    size_t total = 0;
    while (total < maxBytes) {
        const ssize_t r = ::read(guard.fd, buffer.data() + total, maxBytes - total);
        if (r < 0) {
            if (errno == EINTR) continue;
            throwErrno("Failed to read", path);
        }
        if (r == 0) break;
        total += static_cast<size_t>(r);
    }

    buffer.resize(total);
    return buffer;
}

std::string fv::util::readFileToString(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) throw std::runtime_error("Failed to read file: " + path.string());
    return ss.str();
}

void fv::util::writeFileAtomic(const fs::path& path, const std::string& contents) {
    const fs::path tmp = path.parent_path() / ("." + path.filename().string() + "." + generate_random_suffix() + ".tmp");

    FdGuard guard{::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600)};
    if (guard.fd < 0) throwErrno("Failed to create", tmp);

    size_t written = 0;
    while (written < contents.size()) {
        const ssize_t w = ::write(guard.fd, contents.data() + written, contents.size() - written);
        if (w < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            ::unlink(tmp.c_str());
            throw std::system_error(err, std::generic_category(), "Failed to write " + tmp.string());
        }
        written += static_cast<size_t>(w);
    }

    if (::fsync(guard.fd) != 0) {
        const int err = errno;
        ::unlink(tmp.c_str());
        throw std::system_error(err, std::generic_category(), "Failed to sync " + tmp.string());
    }

    ::close(guard.fd);
    guard.fd = -1;

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        const auto err = ec;
        fs::remove(tmp, ec);
        throw std::system_error(err, "Failed to publish " + path.string());
    }
}

std::string fv::util::generate_random_suffix(const size_t length) {
    static constexpr char charset[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<> dist(0, sizeof(charset) - 2);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) result += charset[dist(rng)];
    return result;
}

bool fv::util::isSameOrUnder(const fs::path& path, const fs::path& prefix) {
    // "/watch/" normalizes with a trailing empty element
    const fs::path base = prefix.has_filename() ? prefix : prefix.parent_path();
    return std::mismatch(path.begin(), path.end(), base.begin(), base.end()).second == base.end();
}
