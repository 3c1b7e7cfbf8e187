#include "util/system.hpp"

#include <cstdlib>
#include <pwd.h>
#include <unistd.h>
#include <vector>

namespace fv::util {

std::string hostname() {
    char buf[256] = {};
    if (::gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') return "unknown";
    return {buf};
}

std::string userNameForUid(const uid_t uid) {
    long bufSize = ::sysconf(_SC_GETPW_R_SIZE_MAX);
    if (bufSize <= 0) bufSize = 16384;

    std::vector<char> buf(static_cast<size_t>(bufSize));
    passwd pwd{};
    passwd* result = nullptr;

    if (::getpwuid_r(uid, &pwd, buf.data(), buf.size(), &result) == 0 && result && result->pw_name)
        return {result->pw_name};

    return "uid:" + std::to_string(uid);
}

std::string processUser() {
    const auto name = userNameForUid(::geteuid());
    if (name.rfind("uid:", 0) != 0) return name;
    if (const char* env = std::getenv("USER"); env && *env) return {env};
    return name;
}

}
