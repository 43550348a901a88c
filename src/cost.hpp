#pragma once

#include <cstdint>
#include <vector>
#include "coin.hpp"

namespace coldspend {

class CostValidator {
public:
    // Throws SpendError(CostExceeded) when cost > max_cost
    static void validate(uint64_t cost, uint64_t max_cost);

    // Total cost of running every spend's puzzle with its solution
    static uint64_t bundle_cost(const std::vector<CoinSpend>& spends);

private:
    CostValidator() = delete;
};

} // namespace coldspend
