#include "prediction_repository.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace ee {

namespace {

const char* kComponent = "history";

bool intact(const ImmutablePrediction& record, const EventSinkPtr& events) {
    if (verifyChecksum(record.fields, record.checksum)) {
        return true;
    }
    emitEvent(events, EventLevel::Error, kComponent, record.fields.fixtureId,
              "checksum mismatch, record treated as absent");
    return false;
}

} // namespace

const char* settlementResultName(SettlementResult result) {
    switch (result) {
    case SettlementResult::Won:
        return "won";
    case SettlementResult::Lost:
        return "lost";
    case SettlementResult::Void:
        return "void";
    }
    return "void";
}

bool InMemoryPredictionRepository::publish(const ImmutablePrediction& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.emplace(record.fields.fixtureId, record).second;
}

std::optional<ImmutablePrediction> InMemoryPredictionRepository::find(std::int64_t fixtureId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(fixtureId);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemoryPredictionRepository::freeze(std::int64_t fixtureId, SettlementResult result, double profitLoss) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(fixtureId);
    if (it == records_.end() || it->second.frozen) {
        return false;
    }
    it->second.result = result;
    it->second.profitLoss = profitLoss;
    it->second.frozen = true;
    return true;
}

bool InMemoryPredictionRepository::exists(std::int64_t fixtureId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.count(fixtureId) != 0;
}

std::vector<ImmutablePrediction> InMemoryPredictionRepository::range(const std::string& from,
                                                                     const std::string& to) const {
    std::vector<ImmutablePrediction> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : records_) {
            const std::string& at = entry.second.fields.publishedAt;
            if (at >= from && at <= to) {
                out.push_back(entry.second);
            }
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const ImmutablePrediction& a, const ImmutablePrediction& b) {
        return a.fields.publishedAt > b.fields.publishedAt;
    });
    return out;
}

std::size_t InMemoryPredictionRepository::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

ImmutablePrediction makeImmutablePrediction(const MatchPrediction& prediction, const std::string& publishedAt) {
    ImmutablePrediction record;
    record.fields = checksumFieldsFor(prediction, publishedAt);
    record.marketId = prediction.marketId;
    record.homeTeam = prediction.homeTeam;
    record.awayTeam = prediction.awayTeam;
    record.leagueName = prediction.leagueName;
    record.tier = prediction.tier;
    record.referenceOdds = prediction.referenceOdds;
    record.bestBookmaker = prediction.bestBookmaker;
    record.edge = prediction.edge;
    record.checksum = generateChecksum(record.fields);
    return record;
}

std::optional<std::string> publishPrediction(PredictionRepository& repository,
                                             const MatchPrediction& prediction,
                                             const std::string& publishedAt,
                                             const EventSinkPtr& events) {
    try {
        if (repository.exists(prediction.fixtureId)) {
            emitEvent(events, EventLevel::Debug, kComponent, prediction.fixtureId, "already published");
            return std::nullopt;
        }
        ImmutablePrediction record = makeImmutablePrediction(prediction, publishedAt);
        if (!repository.publish(record)) {
            emitEvent(events, EventLevel::Debug, kComponent, prediction.fixtureId, "publish raced, record kept");
            return std::nullopt;
        }
        emitEvent(events, EventLevel::Info, kComponent, prediction.fixtureId,
                  "published " + prediction.marketId + " checksum " + record.checksum);
        return record.checksum;
    } catch (const std::exception& ex) {
        emitEvent(events, EventLevel::Error, kComponent, prediction.fixtureId,
                  std::string("publish failed: ") + ex.what());
        return std::nullopt;
    }
}

std::optional<ImmutablePrediction> getVerifiedPrediction(const PredictionRepository& repository,
                                                         std::int64_t fixtureId,
                                                         const EventSinkPtr& events) {
    try {
        auto record = repository.find(fixtureId);
        if (!record || !intact(*record, events)) {
            return std::nullopt;
        }
        return record;
    } catch (const std::exception& ex) {
        emitEvent(events, EventLevel::Error, kComponent, fixtureId,
                  std::string("verification unavailable, record treated as absent: ") + ex.what());
        return std::nullopt;
    }
}

// A failing store or checksum backend yields an empty window, not a partial one.
std::vector<ImmutablePrediction> getVerifiedRange(const PredictionRepository& repository,
                                                  const std::string& from,
                                                  const std::string& to,
                                                  const EventSinkPtr& events) {
    std::vector<ImmutablePrediction> out;
    try {
        for (auto& record : repository.range(from, to)) {
            if (intact(record, events)) {
                out.push_back(std::move(record));
            }
        }
    } catch (const std::exception& ex) {
        emitEvent(events, EventLevel::Error, kComponent, 0,
                  std::string("verification unavailable for ") + from + ".." + to + ": " + ex.what());
        out.clear();
    }
    return out;
}

} // namespace ee
