#pragma once

#include <string>

#include "core/model/AllocationTypes.h"

namespace capflow {
namespace core {

class IAccessPolicy {
public:
    virtual ~IAccessPolicy() = default;

    virtual bool isAllowed(const std::string& caller, Capability capability) const = 0;
};

} // namespace core
} // namespace capflow
