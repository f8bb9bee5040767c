#include "integrity.hpp"

#include <exception>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 11) {
        std::cerr << "Usage: audit_checksum <fixtureId> <lambdaHome> <lambdaAway> <market> <probability> <odds> "
                     "<evAdjusted> <confidence> <publishedAt> <checksumHex>\n";
        return 1;
    }

    ee::ChecksumFields fields;
    try {
        fields.fixtureId = std::stoll(argv[1]);
        fields.lambdaHome = std::stod(argv[2]);
        fields.lambdaAway = std::stod(argv[3]);
        fields.market = argv[4];
        fields.probability = std::stod(argv[5]);
        fields.odds = std::stod(argv[6]);
        fields.evAdjusted = std::stod(argv[7]);
        fields.confidence = std::stoi(argv[8]);
        fields.publishedAt = argv[9];
    } catch (const std::exception& ex) {
        std::cerr << "Invalid field: " << ex.what() << '\n';
        return 1;
    }
    std::string checksum = argv[10];

    bool ok = false;
    try {
        ok = ee::verifyChecksum(fields, checksum);
    } catch (const std::exception& ex) {
        std::cerr << "Verification unavailable: " << ex.what() << '\n';
        return 1;
    }

    std::cout << "Payload: " << ee::checksumPayload(fields) << '\n';
    std::cout << "Expected: " << ee::generateChecksum(fields) << '\n';
    std::cout << "Checksum verification: " << (ok ? "valid" : "INVALID") << '\n';
    return ok ? 0 : 2;
}
