#include "frontend/interactive/fault_classifier.hpp"

namespace kiln::frontend::interactive {

namespace rt = backend::runtime;

std::string frame_method(const std::string& frame) {
    std::size_t dot = frame.rfind('.');
    return dot == std::string::npos ? frame : frame.substr(dot + 1);
}

Failure Failure::from_fault(const rt::FaultPtr& fault, const std::string& stop_marker) {
    std::string text;
    rt::FaultPtr level = fault;
    bool first = true;
    while (level) {
        if (!first) text += "\nCaused by: ";
        first = false;

        text += level->message.empty() ? level->type : level->type + ": " + level->message;
        std::size_t shown = 0;
        std::size_t hidden = 0;
        for (const auto& frame : level->frames) {
            if (frame_method(frame) == stop_marker) break;
            if (shown == kMaxTraceFrames) {
                ++hidden;
                continue;
            }
            text += "\n  at " + frame;
            ++shown;
        }
        if (hidden) {
            text += "\n  ... " + std::to_string(hidden) + " more";
        }
        level = level->cause;
    }
    return Failure{text, stop_marker};
}

Res<std::string> classify_fault(const rt::FaultPtr& fault) {
    rt::FaultPtr current = fault;
    bool under_initializer = false;
    while (current->cause && (current->type == rt::fault_types::kInvocationError ||
                              current->type == rt::fault_types::kInitializerError)) {
        under_initializer = under_initializer || current->type == rt::fault_types::kInitializerError;
        current = current->cause;
    }

    if (current->type == rt::fault_types::kExit) {
        return Exit{};
    }
    if (current->type == rt::fault_types::kInterrupted) {
        return Failure{"Interrupted!", std::nullopt};
    }
    return Failure::from_fault(current, under_initializer ? "$main" : frame_method(rt::kHostFrame));
}

Failure unexpected_failure(const std::exception& error) {
    return Failure{std::string(error.what()) + "\n" + kUnexpectedSuffix, std::nullopt};
}

} // namespace kiln::frontend::interactive
