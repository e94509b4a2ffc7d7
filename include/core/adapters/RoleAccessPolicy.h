#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>

#include "core/contracts/IAccessPolicy.h"

namespace capflow {
namespace core {

// Caller -> granted capabilities. Role administration itself lives outside
// the engine; this is only the lookup.
class RoleAccessPolicy : public IAccessPolicy {
public:
    explicit RoleAccessPolicy(bool allow_all = false);

    void grant(const std::string& caller, Capability capability);
    void grantAll(const std::string& caller);
    void revoke(const std::string& caller, Capability capability);

    bool isAllowed(const std::string& caller, Capability capability) const override;

private:
    bool allow_all_;
    mutable std::mutex mutex_;
    std::map<std::string, std::set<Capability>> grants_;
};

} // namespace core
} // namespace capflow
