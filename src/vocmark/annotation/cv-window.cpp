
#include "stdinc.hpp"

#include "cv-window.hpp"

#include <opencv2/highgui/highgui.hpp>

namespace vocmark
{
// -------------------------------------------------------------------- on-mouse
//
void CvWindow::on_mouse(int event, int x, int y, int, void* userdata)
{
   auto* self = static_cast<CvWindow*>(userdata);
   switch(event) {
   case cv::EVENT_LBUTTONDOWN:
      self->pending_.push_back(InputEvent::mouse(InputEvent::LBUTTON_DOWN, x, y));
      break;
   case cv::EVENT_MOUSEMOVE:
      self->pending_.push_back(InputEvent::mouse(InputEvent::MOUSE_MOVE, x, y));
      break;
   case cv::EVENT_LBUTTONUP:
      self->pending_.push_back(InputEvent::mouse(InputEvent::LBUTTON_UP, x, y));
      break;
   default: break;
   }
}

// --------------------------------------------------------------- construction
//
CvWindow::CvWindow(string name)
    : name_(std::move(name))
{
   cv::namedWindow(name_, cv::WINDOW_AUTOSIZE);
   cv::setMouseCallback(name_, on_mouse, this);
   INFO(format("opened window '{}'", name_));
}

CvWindow::~CvWindow()
{
   try {
      cv::destroyWindow(name_);
      cv::waitKey(1); // lets the window system process the destroy
   } catch(cv::Exception& e) {
      WARN(format("failed to destroy window '{}': {}", name_, e.what()));
   }
}

// ------------------------------------------------------------------------ show
//
void CvWindow::show(const cv::Mat& frame) { cv::imshow(name_, frame); }

// ------------------------------------------------------------------------ poll
//
InputEvent CvWindow::poll(int wait_ms)
{
   // Mouse events are delivered from inside waitKey
   const int k = cv::waitKey(std::max(1, wait_ms));
   if(k != -1) pending_.push_back(InputEvent::key_press(k & 0xff));

   if(pending_.empty()) return InputEvent::none();

   // Collapse a run of moves into the latest one
   while(pending_.size() > 1 and pending_[0].kind == InputEvent::MOUSE_MOVE
         and pending_[1].kind == InputEvent::MOUSE_MOVE)
      pending_.pop_front();

   const auto e = pending_.front();
   pending_.pop_front();
   return e;
}

} // namespace vocmark
