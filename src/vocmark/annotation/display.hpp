
#pragma once

#include "vocmark/foundation.hpp"

#include <opencv2/core/core.hpp>

namespace vocmark
{
struct InputEvent
{
   enum Kind : int {
      NONE = 0,     // poll timed out
      KEY,          // `key` is set
      LBUTTON_DOWN, // `x`, `y` are set
      MOUSE_MOVE,
      LBUTTON_UP
   };

   Kind kind{NONE};
   int x{0};
   int y{0};
   int key{-1};

   static InputEvent none() noexcept { return {}; }
   static InputEvent key_press(int k) noexcept
   {
      InputEvent e;
      e.kind = KEY;
      e.key  = k;
      return e;
   }
   static InputEvent mouse(Kind kind, int x, int y) noexcept
   {
      InputEvent e;
      e.kind = kind;
      e.x    = x;
      e.y    = y;
      return e;
   }

   string to_string() const noexcept;
   friend string str(const InputEvent& e) noexcept { return e.to_string(); }
};

const char* str(InputEvent::Kind kind) noexcept;

/**
 * The windowing collaborator: shows frames and hands back input, one
 * event per poll.
 */
class Display
{
 public:
   virtual ~Display() = default;

   virtual void show(const cv::Mat& frame) = 0;

   // Blocks for at most `wait_ms` milliseconds.
   virtual InputEvent poll(int wait_ms) = 0;
};

} // namespace vocmark
