
#pragma once

#include "annotator-session.hpp"

namespace vocmark
{
constexpr int k_default_poll_ms = 1;

// Render, poll one event, dispatch; until the session says quit.
// Returns the number of ticks run.
size_t run_annotator(AnnotatorSession& session,
                     Display& display,
                     const int poll_ms = k_default_poll_ms) noexcept(false);

} // namespace vocmark
