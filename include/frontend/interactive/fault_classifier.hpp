#pragma once

#include <cstddef>
#include <exception>
#include <string>

#include "backend/runtime/runtime_context.hpp"
#include "frontend/interactive/result.hpp"

namespace kiln::frontend::interactive {

constexpr const char* kUnexpectedSuffix = "Something unexpected went wrong =(";

// Frames rendered per fault level; the rest collapse into "... N more".
constexpr std::size_t kMaxTraceFrames = 1024;

// Method part of a frame ("cmd3$Main.$main" -> "$main").
std::string frame_method(const std::string& frame);

/**
 * Turns the outcome of an entry-point call into a Res.
 *
 * Invocation and initializer wrappers are peeled first. An exit request
 * becomes Exit, an interrupt a one-line failure, anything else a trace cut
 * at `$main` when it happened under a module initializer and at the host
 * frame otherwise.
 */
Res<std::string> classify_fault(const backend::runtime::FaultPtr& fault);

Failure unexpected_failure(const std::exception& error);

} // namespace kiln::frontend::interactive
