
#define CATCH_CONFIG_PREFIX_ALL

#include "image-folder.hpp"
#include "stdinc.hpp"
#include "vocmark/annotation/annotator-loop.hpp"
#include "vocmark/annotation/annotator-session.hpp"

#include <deque>

#include <catch2/catch.hpp>

namespace vocmark
{
static const string k_label = "red roomba";

static void drag(AnnotatorSession& session, int x0, int y0, int x1, int y1)
{
   session.dispatch(InputEvent::mouse(InputEvent::LBUTTON_DOWN, x0, y0));
   session.dispatch(
       InputEvent::mouse(InputEvent::MOUSE_MOVE, (x0 + x1) / 2, (y0 + y1) / 2));
   session.dispatch(InputEvent::mouse(InputEvent::MOUSE_MOVE, x1, y1));
   session.dispatch(InputEvent::mouse(InputEvent::LBUTTON_UP, x1, y1));
}

static AnnotatorSession::Action press(AnnotatorSession& session, char k)
{
   return session.dispatch(InputEvent::key_press(k));
}

// A display that replays a fixed list of events, then quits.
class ScriptedDisplay final : public Display
{
 public:
   std::deque<InputEvent> events;
   size_t n_frames = 0;
   cv::Size last_frame_size;

   void show(const cv::Mat& frame) override
   {
      ++n_frames;
      last_frame_size = frame.size();
   }

   InputEvent poll(int) override
   {
      if(events.empty()) return InputEvent::key_press('q');
      const auto e = events.front();
      events.pop_front();
      return e;
   }
};

// ---------------------------------------------------------------- construction

CATCH_TEST_CASE("AnnotatorSession construction", "[annotator-session]")
{
   CATCH_SECTION("missing folder")
   {
      CATCH_REQUIRE_THROWS_AS(
          AnnotatorSession("/tmp/vocmark-this-does-not-exist", k_label),
          NotADirectoryError);
   }

   CATCH_SECTION("folder without images of the right extension")
   {
      testing::ImageFolder folder(2, 100, 80, ".png");
      CATCH_REQUIRE_THROWS_AS(AnnotatorSession(folder.dir, k_label),
                              NoImagesFoundError);
      AnnotatorSession session(folder.dir, k_label, ".png");
      CATCH_REQUIRE(session.n_images() == 2);
   }

   CATCH_SECTION("only matching extensions, any case, sorted")
   {
      testing::ImageFolder folder(2, 100, 80, ".JPG");
      file_put_contents(format("{}/notes.txt", folder.dir), "not an image");
      mkdir_p(format("{}/sub.jpg", folder.dir));
      AnnotatorSession session(folder.dir, k_label);
      CATCH_REQUIRE(session.n_images() == 2);
      CATCH_REQUIRE(basename(session.image_paths()[0]) == "image-000.JPG");
      CATCH_REQUIRE(basename(session.image_paths()[1]) == "image-001.JPG");
   }

   CATCH_SECTION("starts on the first image, clean")
   {
      testing::ImageFolder folder(3);
      AnnotatorSession session(folder.dir, k_label);
      CATCH_REQUIRE(session.n_images() == 3);
      CATCH_REQUIRE(session.index() == 0);
      CATCH_REQUIRE(basename(session.current_image_path()) == "image-000.jpg");
      CATCH_REQUIRE(session.current_dims().width == 100);
      CATCH_REQUIRE(session.current_dims().height == 80);
      CATCH_REQUIRE(!session.is_dirty());
      CATCH_REQUIRE(!session.is_drawing());
      CATCH_REQUIRE(session.current_boxes().empty());
   }
}

// -------------------------------------------------------------------- scenario

CATCH_TEST_CASE("AnnotatorSession draw then next", "[annotator-session]")
{
   testing::ImageFolder folder(2);
   AnnotatorSession session(folder.dir, k_label);

   drag(session, 10, 10, 50, 50);
   CATCH_REQUIRE(session.is_dirty());
   CATCH_REQUIRE(session.current_boxes().size() == 1);
   CATCH_REQUIRE(!is_regular_file(folder.annotation(0)));

   CATCH_REQUIRE(press(session, 'n') == AnnotatorSession::Action::CONTINUE);
   CATCH_REQUIRE(session.index() == 1);
   CATCH_REQUIRE(!session.is_dirty());

   CATCH_REQUIRE(is_regular_file(folder.annotation(0)));
   CATCH_REQUIRE(!is_regular_file(folder.annotation(1)));

   const auto rec = read(folder.annotation(0));
   CATCH_REQUIRE(rec.size() == 1);
   CATCH_REQUIRE(rec.labels[0] == k_label);
   CATCH_REQUIRE(rec.boxes[0] == BoundingBox(10, 10, 50, 50));
}

// ---------------------------------------------------------------------- drawing

CATCH_TEST_CASE("AnnotatorSession drawing", "[annotator-session]")
{
   testing::ImageFolder folder(1);
   AnnotatorSession session(folder.dir, k_label);

   CATCH_SECTION("press starts a zero-size box that tracks the mouse")
   {
      session.dispatch(InputEvent::mouse(InputEvent::LBUTTON_DOWN, 20, 30));
      CATCH_REQUIRE(session.is_drawing());
      CATCH_REQUIRE(*session.in_progress() == BoundingBox(20, 30, 20, 30));
      session.dispatch(InputEvent::mouse(InputEvent::MOUSE_MOVE, 25, 35));
      CATCH_REQUIRE(*session.in_progress() == BoundingBox(20, 30, 25, 35));
      CATCH_REQUIRE(session.current_boxes().empty());
      CATCH_REQUIRE(!session.is_dirty());
   }

   CATCH_SECTION("moves and releases without a press do nothing")
   {
      session.dispatch(InputEvent::mouse(InputEvent::MOUSE_MOVE, 25, 35));
      session.dispatch(InputEvent::mouse(InputEvent::LBUTTON_UP, 25, 35));
      CATCH_REQUIRE(!session.is_drawing());
      CATCH_REQUIRE(session.current_boxes().empty());
      CATCH_REQUIRE(!session.is_dirty());
   }

   CATCH_SECTION("reversed drags are normalised")
   {
      drag(session, 60, 70, 10, 5);
      CATCH_REQUIRE(session.current_boxes().size() == 1);
      CATCH_REQUIRE(session.current_boxes()[0] == BoundingBox(10, 5, 60, 70));
      CATCH_REQUIRE(session.current_labels()[0] == k_label);
   }

   CATCH_SECTION("drags past the edge are clamped to the image")
   {
      drag(session, -20, 40, 500, 500);
      CATCH_REQUIRE(session.current_boxes()[0] == BoundingBox(0, 40, 99, 79));
   }

   CATCH_SECTION("zero-area boxes are discarded")
   {
      drag(session, 10, 10, 10, 10);
      drag(session, 10, 10, 40, 10);
      CATCH_REQUIRE(session.current_boxes().empty());
      CATCH_REQUIRE(!session.is_dirty());
      CATCH_REQUIRE(!session.is_drawing());
   }

   CATCH_SECTION("render draws committed and in-progress boxes")
   {
      drag(session, 10, 10, 50, 50);
      session.dispatch(InputEvent::mouse(InputEvent::LBUTTON_DOWN, 60, 20));
      session.dispatch(InputEvent::mouse(InputEvent::MOUSE_MOVE, 90, 70));

      const auto frame = session.render();
      CATCH_REQUIRE(frame.size() == session.current_image().size());
      CATCH_REQUIRE(frame.at<cv::Vec3b>(10, 30) == cv::Vec3b(0, 255, 0));
      CATCH_REQUIRE(frame.at<cv::Vec3b>(45, 90) == cv::Vec3b(0, 255, 0));
      CATCH_REQUIRE(frame.at<cv::Vec3b>(30, 30) == cv::Vec3b(0, 0, 0));

      // The source image is untouched
      CATCH_REQUIRE(session.current_image().at<cv::Vec3b>(10, 30)
                    == cv::Vec3b(0, 0, 0));
   }
}

// ------------------------------------------------------------------------ undo

CATCH_TEST_CASE("AnnotatorSession undo", "[annotator-session]")
{
   testing::ImageFolder folder(1);
   AnnotatorSession session(folder.dir, k_label);

   CATCH_SECTION("undo with no boxes changes nothing")
   {
      press(session, 'u');
      CATCH_REQUIRE(session.current_boxes().empty());
      CATCH_REQUIRE(!session.is_dirty());
   }

   CATCH_SECTION("undo removes the most recent box")
   {
      drag(session, 10, 10, 20, 20);
      drag(session, 30, 30, 40, 40);
      press(session, 'u');
      CATCH_REQUIRE(session.current_boxes().size() == 1);
      CATCH_REQUIRE(session.current_labels().size() == 1);
      CATCH_REQUIRE(session.current_boxes()[0] == BoundingBox(10, 10, 20, 20));
      CATCH_REQUIRE(session.is_dirty());
   }

   CATCH_SECTION("undo is ignored while drawing")
   {
      drag(session, 10, 10, 20, 20);
      session.dispatch(InputEvent::mouse(InputEvent::LBUTTON_DOWN, 30, 30));
      press(session, 'u');
      CATCH_REQUIRE(session.current_boxes().size() == 1);
      CATCH_REQUIRE(session.is_drawing());
   }
}

// ------------------------------------------------------------------ navigation

CATCH_TEST_CASE("AnnotatorSession index wraps around", "[annotator-session]")
{
   testing::ImageFolder folder(4);
   AnnotatorSession session(folder.dir, k_label);

   for(size_t i = 0; i < session.n_images(); ++i) {
      CATCH_REQUIRE(session.index() == i);
      press(session, 'n');
   }
   CATCH_REQUIRE(session.index() == 0);

   press(session, 'p');
   CATCH_REQUIRE(session.index() == session.n_images() - 1);

   session.transition_to(9);
   CATCH_REQUIRE(session.index() == 1);

   // Nobody drew anything, so nothing was written
   CATCH_REQUIRE(!is_directory(session.annotation_dir()));
}

CATCH_TEST_CASE("AnnotatorSession file exists iff boxes",
                "[annotator-session]")
{
   testing::ImageFolder folder(3);
   AnnotatorSession session(folder.dir, k_label);

   auto check_invariant = [&]() {
      for(size_t i = 0; i < session.n_images(); ++i)
         CATCH_REQUIRE(is_regular_file(session.annotation_path(i))
                       == !session.record(i).empty());
   };

   drag(session, 1, 1, 10, 10);
   press(session, 'n');
   check_invariant();

   drag(session, 1, 1, 10, 10);
   drag(session, 20, 20, 30, 30);
   press(session, 'n');
   check_invariant();

   press(session, 'p'); // back to image 1, then undo both boxes
   press(session, 'u');
   press(session, 'u');
   press(session, 'p');
   check_invariant();
   CATCH_REQUIRE(!is_regular_file(folder.annotation(1)));
   CATCH_REQUIRE(is_regular_file(folder.annotation(0)));

   // An unchanged image is not rewritten
   const auto before = file_get_contents(folder.annotation(0));
   file_put_contents(folder.annotation(0), before + "\n");
   press(session, 'n');
   CATCH_REQUIRE(file_get_contents(folder.annotation(0)) == before + "\n");
}

CATCH_TEST_CASE("AnnotatorSession clear then reload", "[annotator-session]")
{
   testing::ImageFolder folder(2);

   {
      AnnotatorSession session(folder.dir, k_label);
      drag(session, 10, 10, 50, 50);
      drag(session, 20, 20, 60, 60);
      press(session, 'n');
      CATCH_REQUIRE(is_regular_file(folder.annotation(0)));
   }

   AnnotatorSession session(folder.dir, k_label);
   CATCH_REQUIRE(session.current_boxes().size() == 2);

   drag(session, 30, 30, 40, 40);
   press(session, 'c');
   CATCH_REQUIRE(session.current_boxes().empty());
   CATCH_REQUIRE(session.is_dirty());

   press(session, 'n');
   CATCH_REQUIRE(!is_regular_file(folder.annotation(0)));
   press(session, 'p');
   CATCH_REQUIRE(session.index() == 0);
   CATCH_REQUIRE(session.current_boxes().empty());
   CATCH_REQUIRE(!is_regular_file(folder.annotation(0)));
}

// ------------------------------------------------------------- reopen a folder

CATCH_TEST_CASE("AnnotatorSession restores prior work", "[annotator-session]")
{
   testing::ImageFolder folder(3);

   {
      AnnotatorSession session(folder.dir, "cat");
      press(session, 'n');
      press(session, 'n');
      drag(session, 5, 6, 7, 8);
      CATCH_REQUIRE(press(session, 'q') == AnnotatorSession::Action::QUIT);
      CATCH_REQUIRE(is_regular_file(folder.annotation(2)));
   }

   // A stray annotation without an image is skipped
   file_put_contents(format("{}/Annotations/orphan.xml", folder.dir),
                     "<annotation></annotation>");

   AnnotatorSession session(folder.dir, "dog");
   CATCH_REQUIRE(session.record(2).size() == 1);
   CATCH_REQUIRE(session.record(2).labels[0] == "cat");
   CATCH_REQUIRE(session.record(2).boxes[0] == BoundingBox(5, 6, 7, 8));

   session.transition_to(2);
   drag(session, 10, 10, 20, 20);
   CATCH_REQUIRE(session.current_labels() == vector<string>{"cat", "dog"});
   session.finish();

   CATCH_REQUIRE(read(folder.annotation(2)).labels
                 == vector<string>{"cat", "dog"});
}

CATCH_TEST_CASE("AnnotatorSession removes empty annotation files",
                "[annotator-session]")
{
   testing::ImageFolder folder(2);
   mkdir_p(format("{}/Annotations", folder.dir));
   write(encode(ImageDimensions{100, 80, 3}, {}, {}), folder.annotation(1), false);
   write(encode(ImageDimensions{100, 80, 3}, {"a"}, {{1, 1, 9, 9}}),
         folder.annotation(0),
         false);

   AnnotatorSession session(folder.dir, k_label);
   CATCH_REQUIRE(!is_regular_file(folder.annotation(1)));
   CATCH_REQUIRE(is_regular_file(folder.annotation(0)));
   CATCH_REQUIRE(session.record(1).empty());
   CATCH_REQUIRE(session.record(0).size() == 1);
}

CATCH_TEST_CASE("AnnotatorSession unparsable annotation is fatal",
                "[annotator-session]")
{
   testing::ImageFolder folder(1);
   mkdir_p(format("{}/Annotations", folder.dir));
   file_put_contents(folder.annotation(0), "<annotation><object>");
   CATCH_REQUIRE_THROWS_AS(AnnotatorSession(folder.dir, k_label), ParseError);
}

// --------------------------------------------------------------- quit/teardown

CATCH_TEST_CASE("AnnotatorSession quit saves the current image",
                "[annotator-session]")
{
   testing::ImageFolder folder(2);
   AnnotatorSession session(folder.dir, k_label);

   CATCH_SECTION("q")
   {
      drag(session, 10, 10, 50, 50);
      CATCH_REQUIRE(press(session, 'q') == AnnotatorSession::Action::QUIT);
      CATCH_REQUIRE(is_regular_file(folder.annotation(0)));
      CATCH_REQUIRE(!session.is_dirty());
   }

   CATCH_SECTION("escape")
   {
      drag(session, 10, 10, 50, 50);
      CATCH_REQUIRE(session.dispatch(InputEvent::key_press(27))
                    == AnnotatorSession::Action::QUIT);
      CATCH_REQUIRE(is_regular_file(folder.annotation(0)));
   }

   CATCH_SECTION("an in-progress drag is not saved")
   {
      session.dispatch(InputEvent::mouse(InputEvent::LBUTTON_DOWN, 10, 10));
      session.dispatch(InputEvent::mouse(InputEvent::MOUSE_MOVE, 50, 50));
      press(session, 'q');
      CATCH_REQUIRE(!is_regular_file(folder.annotation(0)));
   }

   CATCH_SECTION("unbound keys do nothing")
   {
      CATCH_REQUIRE(press(session, 'z') == AnnotatorSession::Action::CONTINUE);
      CATCH_REQUIRE(session.index() == 0);
   }
}

CATCH_TEST_CASE("AnnotatorSession unreadable image aborts",
                "[annotator-session]")
{
   testing::ImageFolder folder(2);
   AnnotatorSession session(folder.dir, k_label);

   file_put_contents(folder.images[1], "not an image");
   drag(session, 10, 10, 50, 50);
   CATCH_REQUIRE_THROWS_AS(press(session, 'n'), ImageReadError);

   // The outgoing image was saved before the failure
   CATCH_REQUIRE(is_regular_file(folder.annotation(0)));

   // ...and is still the current image
   CATCH_REQUIRE(session.index() == 0);
   CATCH_REQUIRE(basename(session.current_image_path()) == "image-000.jpg");
   CATCH_REQUIRE(session.current_boxes().size() == 1);
   CATCH_REQUIRE(!session.is_dirty());
   CATCH_REQUIRE(session.render().size() == cv::Size(100, 80));
}

CATCH_TEST_CASE("AnnotatorSession custom key bindings", "[annotator-session]")
{
   testing::ImageFolder folder(2);
   KeyBindings keys;
   keys.next = 'd';
   keys.quit = 'x';
   AnnotatorSession session(folder.dir, k_label, ".jpg", keys);

   press(session, 'n');
   CATCH_REQUIRE(session.index() == 0);
   press(session, 'd');
   CATCH_REQUIRE(session.index() == 1);
   CATCH_REQUIRE(press(session, 'x') == AnnotatorSession::Action::QUIT);
}

// ------------------------------------------------------------------- the loop

CATCH_TEST_CASE("run-annotator drives a session to quit", "[annotator-loop]")
{
   testing::ImageFolder folder(2);
   AnnotatorSession session(folder.dir, k_label);

   ScriptedDisplay display;
   display.events = {InputEvent::none(),
                     InputEvent::mouse(InputEvent::LBUTTON_DOWN, 10, 10),
                     InputEvent::mouse(InputEvent::MOUSE_MOVE, 30, 30),
                     InputEvent::mouse(InputEvent::LBUTTON_UP, 50, 50),
                     InputEvent::key_press('n'),
                     InputEvent::mouse(InputEvent::LBUTTON_DOWN, 5, 5),
                     InputEvent::mouse(InputEvent::LBUTTON_UP, 15, 25)};

   const auto ticks = run_annotator(session, display);

   // 7 scripted events, then the implicit 'q'
   CATCH_REQUIRE(ticks == 8);
   CATCH_REQUIRE(display.n_frames == 8);
   CATCH_REQUIRE(display.last_frame_size == cv::Size(100, 80));
   CATCH_REQUIRE(session.index() == 1);

   CATCH_REQUIRE(read(folder.annotation(0)).boxes
                 == vector<BoundingBox>{{10, 10, 50, 50}});
   CATCH_REQUIRE(read(folder.annotation(1)).boxes
                 == vector<BoundingBox>{{5, 5, 15, 25}});
}

} // namespace vocmark
