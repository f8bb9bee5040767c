#include "engine_events.hpp"
#include "integrity.hpp"
#include "prediction_repository.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "integrity_test failure: " << msg << std::endl;
    std::exit(1);
}

class CountingSink : public ee::EventSink {
public:
    void emit(const ee::EngineEvent& event) override {
        if (event.level == ee::EventLevel::Error) {
            ++errors;
        }
    }

    int errors = 0;
};

// Serves stored records with their odds altered for selected fixtures, as a
// store edited behind the engine's back would.
class TamperedRepository : public ee::PredictionRepository {
public:
    bool publish(const ee::ImmutablePrediction& record) override { return inner_.publish(record); }

    std::optional<ee::ImmutablePrediction> find(std::int64_t fixtureId) const override {
        auto record = inner_.find(fixtureId);
        if (record && tampered_.count(fixtureId) != 0) {
            record->fields.odds += 0.5;
        }
        return record;
    }

    bool freeze(std::int64_t fixtureId, ee::SettlementResult result, double profitLoss) override {
        return inner_.freeze(fixtureId, result, profitLoss);
    }

    bool exists(std::int64_t fixtureId) const override { return inner_.exists(fixtureId); }

    std::vector<ee::ImmutablePrediction> range(const std::string& from, const std::string& to) const override {
        auto records = inner_.range(from, to);
        for (auto& record : records) {
            if (tampered_.count(record.fields.fixtureId) != 0) {
                record.fields.odds += 0.5;
            }
        }
        return records;
    }

    void tamper(std::int64_t fixtureId) { tampered_.insert(fixtureId); }

private:
    ee::InMemoryPredictionRepository inner_;
    std::set<std::int64_t> tampered_;
};

// Every read fails, as a store whose backend has gone away would.
class UnavailableRepository : public ee::PredictionRepository {
public:
    bool publish(const ee::ImmutablePrediction&) override { return false; }

    std::optional<ee::ImmutablePrediction> find(std::int64_t) const override {
        throw std::runtime_error("store offline");
    }

    bool freeze(std::int64_t, ee::SettlementResult, double) override { return false; }

    bool exists(std::int64_t) const override { return false; }

    std::vector<ee::ImmutablePrediction> range(const std::string&, const std::string&) const override {
        throw std::runtime_error("store offline");
    }
};

ee::MatchPrediction prediction(std::int64_t fixtureId) {
    ee::MatchPrediction p;
    p.fixtureId = fixtureId;
    p.homeTeam = "Rovers";
    p.awayTeam = "United";
    p.market = "Over 2.5 Goals";
    p.marketId = "over_2.5";
    p.lambdaHome = 1.5;
    p.lambdaAway = 1.1;
    p.probability = 0.6123;
    p.odds = 2.05;
    p.evAdjusted = 0.1012;
    p.confidence = 78;
    p.tier = ee::RiskTier::A;
    return p;
}

} // namespace

int main() {
    using namespace ee;

    const std::string publishedAt = "2026-10-24T09:00:00Z";
    ChecksumFields fields = checksumFieldsFor(prediction(12345), publishedAt);
    if (checksumPayload(fields) != "12345|1.5000|1.1000|Over 2.5 Goals|0.6123|2.050|0.1012|78|2026-10-24T09:00:00Z") {
        fail("payload layout: " + checksumPayload(fields));
    }
    const std::string expected = "fde0b429d27e99cd2772f22507058002b8b16b0b65a76c5ee58923eac1ea8e95";
    if (generateChecksum(fields) != expected) {
        fail("SHA-256 of the payload");
    }
    if (!verifyChecksum(fields, expected)) {
        fail("intact record must verify");
    }
    ChecksumFields edited = fields;
    edited.odds = 2.10;
    if (verifyChecksum(edited, expected)) {
        fail("edited odds must not verify");
    }
    if (verifyChecksum(fields, expected.substr(1)) || verifyChecksum(fields, "")) {
        fail("truncated checksum must not verify");
    }
    std::string upper = expected;
    upper[0] = 'F';
    if (verifyChecksum(fields, upper)) {
        fail("checksum comparison is exact");
    }

    // Publish once, read back verified, settle once.
    InMemoryPredictionRepository repository;
    auto sink = std::make_shared<CountingSink>();
    auto checksum = publishPrediction(repository, prediction(1), publishedAt, sink);
    if (!checksum || checksum->size() != 64) {
        fail("first publication must return the checksum");
    }
    if (publishPrediction(repository, prediction(1), "2026-10-24T10:00:00Z", sink)) {
        fail("republishing must be a no-op");
    }
    if (repository.size() != 1) {
        fail("repository size");
    }
    auto stored = getVerifiedPrediction(repository, 1, sink);
    if (!stored || stored->checksum != *checksum || stored->fields.publishedAt != publishedAt ||
        stored->tier != RiskTier::A || stored->frozen) {
        fail("stored record");
    }
    if (getVerifiedPrediction(repository, 99, sink)) {
        fail("unknown fixture");
    }

    if (!repository.freeze(1, SettlementResult::Won, 1.05) || repository.freeze(1, SettlementResult::Lost, -1.0)) {
        fail("a record settles exactly once");
    }
    if (repository.freeze(99, SettlementResult::Void, 0.0)) {
        fail("cannot settle an unknown fixture");
    }
    auto settled = getVerifiedPrediction(repository, 1, sink);
    if (!settled || !settled->frozen || settled->result != SettlementResult::Won || settled->profitLoss != 1.05) {
        fail("settlement must be stored and keep the record verifiable");
    }

    if (!publishPrediction(repository, prediction(2), "2026-10-23T09:00:00Z", sink) ||
        !publishPrediction(repository, prediction(3), "2026-10-25T09:00:00Z", sink)) {
        fail("publish further fixtures");
    }
    auto window = getVerifiedRange(repository, "2026-10-23T00:00:00Z", "2026-10-24T23:59:59Z", sink);
    if (window.size() != 2 || window[0].fields.fixtureId != 1 || window[1].fields.fixtureId != 2) {
        fail("range must be inclusive and newest first");
    }
    if (sink->errors != 0) {
        fail("no errors expected for intact records");
    }

    // Tampering makes the record disappear and raises an error event.
    TamperedRepository tampered;
    if (!publishPrediction(tampered, prediction(7), publishedAt) ||
        !publishPrediction(tampered, prediction(8), publishedAt)) {
        fail("publish through the interface");
    }
    tampered.tamper(7);
    if (getVerifiedPrediction(tampered, 7, sink)) {
        fail("tampered record must be treated as absent");
    }
    if (!getVerifiedPrediction(tampered, 8, sink)) {
        fail("untouched record must still verify");
    }
    auto survivors = getVerifiedRange(tampered, "2026-01-01", "2026-12-31", sink);
    if (survivors.size() != 1 || survivors[0].fields.fixtureId != 8) {
        fail("range must drop tampered records");
    }
    if (sink->errors != 2) {
        fail("each tampered read should raise one error event");
    }

    // A failing backend reads as absent with an error event, never an exception.
    UnavailableRepository offline;
    auto offlineSink = std::make_shared<CountingSink>();
    if (getVerifiedPrediction(offline, 7, offlineSink)) {
        fail("unreadable record must be treated as absent");
    }
    if (!getVerifiedRange(offline, "2026-01-01", "2026-12-31", offlineSink).empty()) {
        fail("unreadable range must be empty");
    }
    if (offlineSink->errors != 2) {
        fail("each failed read should raise one error event");
    }

    std::cout << "integrity_test passed\n";
    return 0;
}
