#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "engine_events.hpp"
#include "integrity.hpp"
#include "prediction.hpp"
#include "risk.hpp"

namespace ee {

enum class SettlementResult { Won, Lost, Void };

const char* settlementResultName(SettlementResult result);

struct ImmutablePrediction {
    ChecksumFields fields;
    std::string marketId;
    std::string homeTeam;
    std::string awayTeam;
    std::string leagueName;
    RiskTier tier = RiskTier::Reject;
    std::optional<double> referenceOdds;
    std::string bestBookmaker;
    double edge = 0.0;

    std::string checksum;
    std::optional<SettlementResult> result;
    std::optional<double> profitLoss;
    bool frozen = false;
};

// Persistence boundary. Implementations own durability and the freeze write
// barrier; every call must be safe to repeat.
class PredictionRepository {
public:
    virtual ~PredictionRepository() = default;

    // False when a record for the fixture already exists.
    virtual bool publish(const ImmutablePrediction& record) = 0;
    // Stored record as-is; callers verify the checksum.
    virtual std::optional<ImmutablePrediction> find(std::int64_t fixtureId) const = 0;
    // Attaches a settlement once; false when missing or already frozen.
    virtual bool freeze(std::int64_t fixtureId, SettlementResult result, double profitLoss) = 0;
    virtual bool exists(std::int64_t fixtureId) const = 0;
    // publishedAt within [from, to] inclusive, newest first.
    virtual std::vector<ImmutablePrediction> range(const std::string& from, const std::string& to) const = 0;
};

using PredictionRepositoryPtr = std::shared_ptr<PredictionRepository>;

class InMemoryPredictionRepository : public PredictionRepository {
public:
    bool publish(const ImmutablePrediction& record) override;
    std::optional<ImmutablePrediction> find(std::int64_t fixtureId) const override;
    bool freeze(std::int64_t fixtureId, SettlementResult result, double profitLoss) override;
    bool exists(std::int64_t fixtureId) const override;
    std::vector<ImmutablePrediction> range(const std::string& from, const std::string& to) const override;

    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::int64_t, ImmutablePrediction> records_;
};

ImmutablePrediction makeImmutablePrediction(const MatchPrediction& prediction, const std::string& publishedAt);

// Publishes once per fixture. Returns the checksum of a newly stored record,
// nullopt when the fixture was already published or the store failed.
std::optional<std::string> publishPrediction(PredictionRepository& repository,
                                             const MatchPrediction& prediction,
                                             const std::string& publishedAt,
                                             const EventSinkPtr& events = nullptr);

// Reads a record and drops it, with an error event, when its checksum no
// longer matches its fields.
std::optional<ImmutablePrediction> getVerifiedPrediction(const PredictionRepository& repository,
                                                         std::int64_t fixtureId,
                                                         const EventSinkPtr& events = nullptr);

std::vector<ImmutablePrediction> getVerifiedRange(const PredictionRepository& repository,
                                                  const std::string& from,
                                                  const std::string& to,
                                                  const EventSinkPtr& events = nullptr);

} // namespace ee
