#pragma once

#include <cstdint>
#include <string>

#include "prediction.hpp"

namespace ee {

// Fields covered by a published prediction's checksum, in payload order.
struct ChecksumFields {
    std::int64_t fixtureId = 0;
    double lambdaHome = 0.0;
    double lambdaAway = 0.0;
    std::string market;
    double probability = 0.0;
    double odds = 0.0;
    double evAdjusted = 0.0;
    int confidence = 0;
    std::string publishedAt;
};

ChecksumFields checksumFieldsFor(const MatchPrediction& prediction, const std::string& publishedAt);

// "fixture|lambdaHome|lambdaAway|market|p|odds|evAdjusted|confidence|publishedAt"
// with lambdas, p and evAdjusted at 4 decimals and odds at 3.
std::string checksumPayload(const ChecksumFields& fields);

// Lowercase hex SHA-256 of the payload.
std::string generateChecksum(const ChecksumFields& fields);

// Recomputes the digest and compares in constant time.
bool verifyChecksum(const ChecksumFields& fields, const std::string& checksum);

} // namespace ee
