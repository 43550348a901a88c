#include "signature_aggregator.hpp"
#include "error.hpp"

namespace coldspend {

bls::G2Element SignatureAggregator::aggregate(const std::vector<bls::G2Element>& signatures) {
    if (signatures.empty()) {
        return bls::G2Element();
    }
    return bls::AugSchemeMPL().Aggregate(signatures);
}

bls::G2Element SignatureAggregator::aggregate_nonempty(const std::vector<bls::G2Element>& signatures) {
    if (signatures.empty()) {
        throw SpendError(SpendError::ErrorType::AggregationDegenerate, "No signatures to aggregate");
    }
    return aggregate(signatures);
}

bool SignatureAggregator::verify(const std::vector<bls::G1Element>& public_keys,
                                 const std::vector<std::vector<uint8_t>>& messages,
                                 const bls::G2Element& signature) {
    if (public_keys.empty() || public_keys.size() != messages.size()) {
        return false;
    }
    return bls::AugSchemeMPL().AggregateVerify(public_keys, messages, signature);
}

} // namespace coldspend
