#include "cost.hpp"
#include "error.hpp"
#include "puzzle.hpp"

namespace coldspend {

void CostValidator::validate(uint64_t cost, uint64_t max_cost) {
    if (cost > max_cost) {
        throw SpendError(SpendError::ErrorType::CostExceeded,
            "Bundle cost " + std::to_string(cost) + " exceeds maximum block cost " + std::to_string(max_cost));
    }
}

uint64_t CostValidator::bundle_cost(const std::vector<CoinSpend>& spends) {
    uint64_t total = 0;
    for (const auto& spend : spends) {
        total += StandardPuzzle::run(spend.puzzle_reveal, spend.solution).cost;
    }
    return total;
}

} // namespace coldspend
