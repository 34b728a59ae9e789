
#pragma once

#include "display.hpp"

#include <deque>

namespace vocmark
{
constexpr const char* k_default_window_name = "Pascal VOC Annotator";

/**
 * An OpenCV highgui window. The window and its mouse callback live exactly
 * as long as this object.
 */
class CvWindow final : public Display
{
 private:
   string name_;
   std::deque<InputEvent> pending_;

   static void on_mouse(int event, int x, int y, int flags, void* userdata);

 public:
   explicit CvWindow(string name = k_default_window_name);
   CvWindow(const CvWindow&) = delete;
   CvWindow(CvWindow&&)      = delete;
   ~CvWindow() override;
   CvWindow& operator=(const CvWindow&) = delete;
   CvWindow& operator=(CvWindow&&) = delete;

   const string& name() const noexcept { return name_; }

   void show(const cv::Mat& frame) override;
   InputEvent poll(int wait_ms) override;
};

} // namespace vocmark
