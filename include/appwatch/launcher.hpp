#pragma once

#include "appwatch/events.hpp"
#include "appwatch/export.hpp"
#include "appwatch/platform.hpp"
#include "appwatch/types.hpp"

#include <string>

namespace appwatch {

/**
 * @brief Two-tier application launcher
 *
 * Tries the platform activation service first. If that fails the error is
 * held back and the shell fallback is tried; only when both fail are the two
 * messages reported together.
 */
class APPWATCH_API Launcher {
public:
    explicit Launcher(ActivationService& activation, EventSink* sink = nullptr)
        : activation_(activation), sink_(sink) {}

    LaunchOutcome launch(const std::string& app_id);

private:
    void emit(SupervisionEvent event);

    ActivationService& activation_;
    EventSink* sink_;
};

} // namespace appwatch
