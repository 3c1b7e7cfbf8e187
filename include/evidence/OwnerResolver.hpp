#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace fv::evidence {

class OwnerResolver {
public:
    virtual ~OwnerResolver() = default;

    [[nodiscard]] virtual std::string ownerOf(const std::filesystem::path& path) const = 0;
    [[nodiscard]] virtual std::string_view name() const = 0;
};

// stat() + passwd lookup. If the file cannot be stat'ed (vanished, no
// permission on a parent) the process identity is reported instead.
class PosixOwnerResolver final : public OwnerResolver {
public:
    [[nodiscard]] std::string ownerOf(const std::filesystem::path& path) const override;
    [[nodiscard]] std::string_view name() const override { return "posix"; }
};

// Hosts without a usable account database: every file is attributed to the
// account the daemon runs as.
class ProcessIdentityResolver final : public OwnerResolver {
public:
    ProcessIdentityResolver();

    [[nodiscard]] std::string ownerOf(const std::filesystem::path&) const override { return identity_; }
    [[nodiscard]] std::string_view name() const override { return "process-identity"; }

private:
    std::string identity_;
};

// Picks the variant once at startup. Returns nullptr when owner lookup is disabled.
std::shared_ptr<OwnerResolver> makeOwnerResolver(const config::DetectionConfig& cfg);

}
