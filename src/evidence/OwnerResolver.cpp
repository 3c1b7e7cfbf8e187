#include "evidence/OwnerResolver.hpp"
#include "logging/LogRegistry.hpp"
#include "util/system.hpp"

#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

using namespace fv::evidence;
using namespace fv::logging;

namespace {

bool passwdDatabaseUsable() {
    long bufSize = ::sysconf(_SC_GETPW_R_SIZE_MAX);
    if (bufSize <= 0) bufSize = 16384;

    std::vector<char> buf(static_cast<size_t>(bufSize));
    passwd pwd{};
    passwd* result = nullptr;
    return ::getpwuid_r(::geteuid(), &pwd, buf.data(), buf.size(), &result) == 0 && result != nullptr;
}

}

std::string PosixOwnerResolver::ownerOf(const std::filesystem::path& path) const {
    struct stat st{};
    if (::lstat(path.c_str(), &st) != 0) {
        LogRegistry::evidence()->debug("[PosixOwnerResolver] stat failed for {}, using process identity", path.string());
        return util::processUser();
    }
    return util::userNameForUid(st.st_uid);
}

ProcessIdentityResolver::ProcessIdentityResolver() : identity_(util::processUser()) {}

std::shared_ptr<OwnerResolver> fv::evidence::makeOwnerResolver(const config::DetectionConfig& cfg) {
    if (!cfg.get_file_owner) return nullptr;

    if (passwdDatabaseUsable()) return std::make_shared<PosixOwnerResolver>();

    LogRegistry::evidence()->warn("[OwnerResolver] Account database unavailable, attributing files to the process identity");
    return std::make_shared<ProcessIdentityResolver>();
}
