#pragma once

#include "common/Types.h"

namespace capflow {
namespace core {

class IPriceOracle {
public:
    virtual ~IPriceOracle() = default;

    // Quote-currency value of one unit of the asset.
    virtual double price(const Asset& asset) = 0;
};

} // namespace core
} // namespace capflow
