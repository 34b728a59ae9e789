
#include "stdinc.hpp"

#include "display.hpp"

namespace vocmark
{
const char* str(InputEvent::Kind kind) noexcept
{
   switch(kind) {
   case InputEvent::NONE: return "NONE";
   case InputEvent::KEY: return "KEY";
   case InputEvent::LBUTTON_DOWN: return "LBUTTON_DOWN";
   case InputEvent::MOUSE_MOVE: return "MOUSE_MOVE";
   case InputEvent::LBUTTON_UP: return "LBUTTON_UP";
   }
   return "<unknown>";
}

string InputEvent::to_string() const noexcept
{
   switch(kind) {
   case NONE: return "NONE";
   case KEY: return format("KEY('{}')", char(key));
   default: break;
   }
   return format("{}({}, {})", str(kind), x, y);
}

} // namespace vocmark
