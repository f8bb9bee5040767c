#include "integrity.hpp"

#include "picosha2.h"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <sodium.h>

namespace ee {

namespace {

bool ensureSodiumReady() {
    static bool ready = sodium_init() >= 0;
    return ready;
}

std::string hashBytes(const std::string& data) {
    std::vector<unsigned char> hash(picosha2::k_digest_size);
    picosha2::hash256(data.begin(), data.end(), hash.begin(), hash.end());
    return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

std::string fixed(double value, int decimals) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(decimals) << value;
    return oss.str();
}

} // namespace

ChecksumFields checksumFieldsFor(const MatchPrediction& prediction, const std::string& publishedAt) {
    ChecksumFields f;
    f.fixtureId = prediction.fixtureId;
    f.lambdaHome = prediction.lambdaHome;
    f.lambdaAway = prediction.lambdaAway;
    f.market = prediction.market;
    f.probability = prediction.probability;
    f.odds = prediction.odds;
    f.evAdjusted = prediction.evAdjusted;
    f.confidence = prediction.confidence;
    f.publishedAt = publishedAt;
    return f;
}

std::string checksumPayload(const ChecksumFields& fields) {
    std::ostringstream oss;
    oss << fields.fixtureId << "|" << fixed(fields.lambdaHome, 4) << "|" << fixed(fields.lambdaAway, 4) << "|"
        << fields.market << "|" << fixed(fields.probability, 4) << "|" << fixed(fields.odds, 3) << "|"
        << fixed(fields.evAdjusted, 4) << "|" << fields.confidence << "|" << fields.publishedAt;
    return oss.str();
}

std::string generateChecksum(const ChecksumFields& fields) {
    return hashBytes(checksumPayload(fields));
}

bool verifyChecksum(const ChecksumFields& fields, const std::string& checksum) {
    if (!ensureSodiumReady()) {
        throw std::runtime_error("Unable to initialize libsodium");
    }
    const std::string expected = generateChecksum(fields);
    if (expected.size() != checksum.size()) {
        return false;
    }
    return sodium_memcmp(expected.data(), checksum.data(), expected.size()) == 0;
}

} // namespace ee
