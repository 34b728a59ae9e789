
#include "stdinc.hpp"

#include "annotator-loop.hpp"

namespace vocmark
{
size_t run_annotator(AnnotatorSession& session,
                     Display& display,
                     const int poll_ms) noexcept(false)
{
   size_t ticks = 0;
   while(true) {
      ++ticks;
      display.show(session.render());
      const auto e = display.poll(poll_ms);
      if(e.kind != InputEvent::NONE and e.kind != InputEvent::MOUSE_MOVE)
         TRACE(format("tick {}: {}", ticks, str(e)));
      if(session.dispatch(e) == AnnotatorSession::Action::QUIT) break;
   }
   return ticks;
}

} // namespace vocmark
