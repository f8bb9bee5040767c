#include "engine_events.hpp"

namespace ee {

const char* eventLevelName(EventLevel level) {
    switch (level) {
    case EventLevel::Debug:
        return "DEBUG";
    case EventLevel::Info:
        return "INFO";
    case EventLevel::Warning:
        return "WARN";
    case EventLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

StreamEventSink::StreamEventSink(std::ostream& out, EventLevel minLevel)
    : out_(out), minLevel_(minLevel) {}

void StreamEventSink::emit(const EngineEvent& event) {
    if (static_cast<int>(event.level) < static_cast<int>(minLevel_)) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "[" << eventLevelName(event.level) << "] " << event.component;
    if (event.fixtureId != 0) {
        out_ << " #" << event.fixtureId;
    }
    out_ << ": " << event.message << "\n";
}

void emitEvent(const EventSinkPtr& sink,
               EventLevel level,
               const std::string& component,
               std::int64_t fixtureId,
               const std::string& message) {
    if (!sink) {
        return;
    }
    sink->emit(EngineEvent{ level, component, fixtureId, message });
}

} // namespace ee
