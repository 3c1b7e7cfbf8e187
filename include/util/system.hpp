#pragma once

#include <string>
#include <sys/types.h>

namespace fv::util {

// Host name of this machine, "unknown" if it cannot be determined.
std::string hostname();

// Account name for a uid, or "uid:<n>" when the passwd database has no entry.
std::string userNameForUid(uid_t uid);

// Account the running process acts as (effective uid).
std::string processUser();

}
