#include "appwatch/events.hpp"
#include "appwatch/types.hpp"

namespace appwatch {

std::string to_string(const SupervisionState& state) {
    if (state.phase == SupervisionPhase::Monitoring) {
        return std::string(phase_to_string(state.phase)) + "(" + std::to_string(state.pid) + ")";
    }
    return phase_to_string(state.phase);
}

std::vector<EventKind> RecordingEventSink::kinds() const {
    std::vector<EventKind> out;
    out.reserve(events_.size());
    for (const auto& e : events_) {
        out.push_back(e.kind);
    }
    return out;
}

} // namespace appwatch
