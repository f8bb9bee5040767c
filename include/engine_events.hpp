#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

namespace ee {

enum class EventLevel { Debug, Info, Warning, Error };

const char* eventLevelName(EventLevel level);

struct EngineEvent {
    EventLevel level = EventLevel::Info;
    std::string component;
    std::int64_t fixtureId = 0;
    std::string message;
};

// Receives diagnostics from the orchestration layers. Pure model functions
// never emit; only the orchestrator, slate runner and publication paths do.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void emit(const EngineEvent& event) = 0;
};

using EventSinkPtr = std::shared_ptr<EventSink>;

class NullEventSink : public EventSink {
public:
    void emit(const EngineEvent&) override {}
};

// Writes "[LEVEL] component #fixture: message" lines. Safe to share between
// the slate runner's worker threads.
class StreamEventSink : public EventSink {
public:
    explicit StreamEventSink(std::ostream& out, EventLevel minLevel = EventLevel::Info);

    void emit(const EngineEvent& event) override;

private:
    std::ostream& out_;
    EventLevel minLevel_;
    std::mutex mutex_;
};

// Convenience for call sites holding a possibly-null sink.
void emitEvent(const EventSinkPtr& sink,
               EventLevel level,
               const std::string& component,
               std::int64_t fixtureId,
               const std::string& message);

} // namespace ee
