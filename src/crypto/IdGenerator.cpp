#include "crypto/IdGenerator.hpp"
#include "util/timestamp.hpp"

using namespace fv::crypto;

std::string IdGenerator::generate(const std::chrono::system_clock::time_point at) const {
    const auto stamp = util::compactTimestamp(at);
    const auto body = random_body();

    std::string id;
    id.reserve(stamp.size() + 1 + body.size());
    id.append(stamp);
    id.push_back(options_.separator);
    id.append(body);
    return id;
}
