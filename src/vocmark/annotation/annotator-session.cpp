
#include "stdinc.hpp"

#include "annotator-session.hpp"

#include <opencv2/imgproc/imgproc.hpp>

namespace vocmark
{
static constexpr int k_escape_key = 27;

static const cv::Scalar k_rect_colour = cv::Scalar(0, 255, 0);

// ---------------------------------------------------------------- construction
//
AnnotatorSession::AnnotatorSession(const string_view folder,
                                   const string_view label,
                                   const string_view image_extension,
                                   const KeyBindings& keys) noexcept(false)
    : label_(label)
    , keys_(keys)
{
   if(!is_directory(folder))
      throw NotADirectoryError(format("'{}' is not a directory", folder));

   folder_ = absolute_path(folder);

   const auto ext     = string_to_lowercase(image_extension);
   auto has_image_ext = [&ext](const string& fname) {
      return string_to_lowercase(file_ext(fname)) == ext;
   };
   const auto files = list_regular_files(folder_);
   image_paths_
       = files | views::filter(has_image_ext) | ranges::to<vector<string>>();

   if(image_paths_.empty())
      throw NoImagesFoundError(format(
          "no '{}' images were found in directory '{}'", image_extension, folder));

   INFO(format("found {} images in '{}'", image_paths_.size(), folder_));

   load_saved_annotations();
   current_ = load_and_decode(current_image_path());
   log_current();
}

// ------------------------------------------------------ load saved annotations
//
void AnnotatorSession::load_saved_annotations()
{
   const auto dir = annotation_dir();
   if(!is_directory(dir)) return;

   hashmap<string, size_t> index_of_stem;
   for(size_t i = 0; i < image_paths_.size(); ++i)
      index_of_stem[basename(image_paths_[i], true)] = i;

   for(const auto& fname : list_regular_files(dir)) {
      if(string_to_lowercase(file_ext(fname)) != k_annotation_extension)
         continue;

      const auto ii = index_of_stem.find(basename(fname, true));
      if(ii == cend(index_of_stem)) {
         WARN(format("skipping annotation file '{}': no matching image",
                     basename(fname)));
         continue;
      }

      auto rec = read(fname);
      TRACE(format("loaded {} boxes from '{}'", rec.size(), fname));
      if(!rec.empty()) {
         annotations_[ii->second] = std::move(rec);
      } else if(auto ec = delete_file(fname); ec) {
         throw std::runtime_error(format(
             "failed to delete empty annotation '{}': {}", fname, ec.message()));
      } else {
         INFO(format("removed empty annotation '{}'", basename(fname)));
      }
   }

   INFO(format("restored annotations for {} images", annotations_.size()));
}

// --------------------------------------------------------------------- getters
//
const ImageRecord& AnnotatorSession::record(size_t idx) const noexcept
{
   static const ImageRecord empty_record;
   const auto ii = annotations_.find(idx);
   return (ii == cend(annotations_)) ? empty_record : ii->second;
}

const vector<BoundingBox>& AnnotatorSession::current_boxes() const noexcept
{
   return record(index_).boxes;
}

const vector<string>& AnnotatorSession::current_labels() const noexcept
{
   return record(index_).labels;
}

ImageRecord& AnnotatorSession::current_record()
{
   return annotations_[index_];
}

string AnnotatorSession::annotation_dir() const noexcept
{
   return format("{}/{}", folder_, k_annotation_dir);
}

string AnnotatorSession::annotation_path(size_t idx) const noexcept
{
   Expects(idx < image_paths_.size());
   return annotation_path_for(image_paths_[idx], annotation_dir());
}

// ----------------------------------------------------------------- log-current
//
void AnnotatorSession::log_current() const
{
   INFO(format("[{}/{}] '{}' {}, {} boxes",
               index_ + 1,
               n_images(),
               basename(current_image_path()),
               str(current_.dims),
               current_boxes().size()));
}

// ----------------------------------------------------------- reconcile-current
//
void AnnotatorSession::reconcile_current()
{
   const auto fname = annotation_path(index_);
   const auto& rec  = record(index_);

   if(rec.empty()) {
      annotations_.erase(index_);
      if(is_regular_file(fname)) {
         if(auto ec = delete_file(fname); ec)
            throw std::runtime_error(format(
                "failed to delete stale annotation '{}': {}", fname, ec.message()));
         INFO(format("removed '{}'", basename(fname)));
      }
   } else if(dirty_) {
      const auto dir = annotation_dir();
      if(!is_directory(dir) and !mkdir_p(dir))
         throw std::runtime_error(
             format("failed to create annotation directory '{}'", dir));
      write(encode(current_.dims, rec.labels, rec.boxes), fname, true);
      INFO(format("saved {} boxes to '{}'", rec.size(), basename(fname)));
   }

   dirty_ = false;
}

// ------------------------------------------------------------------- drawing
//
void AnnotatorSession::draw_begin(int x, int y) noexcept
{
   in_progress_ = BoundingBox(x, y, x, y);
}

void AnnotatorSession::draw_update(int x, int y) noexcept
{
   if(!in_progress_) return;
   in_progress_->xmax = x;
   in_progress_->ymax = y;
}

void AnnotatorSession::draw_commit(int x, int y)
{
   if(!in_progress_) return;
   draw_update(x, y);
   const auto bb = in_progress_->normalised().clamped(current_.dims.width,
                                                     current_.dims.height);
   in_progress_.reset();

   if(bb.is_degenerate()) {
      TRACE(format("discarding zero-area box {}", str(bb)));
      return;
   }

   current_record().push_back(bb, label_);
   dirty_ = true;
   TRACE(format("committed box {} '{}'", str(bb), label_));
}

// -------------------------------------------------------------------- commands
//
void AnnotatorSession::undo() noexcept
{
   if(is_drawing()) return;
   auto ii = annotations_.find(index_);
   if(ii == end(annotations_) or ii->second.empty()) return;
   ii->second.pop_back();
   dirty_ = true;
}

void AnnotatorSession::clear() noexcept
{
   annotations_.erase(index_);
   in_progress_.reset();
   dirty_ = true;
}

void AnnotatorSession::next() noexcept(false) { transition_to(index_ + 1); }

void AnnotatorSession::previous() noexcept(false)
{
   transition_to(index_ + n_images() - 1);
}

void AnnotatorSession::transition_to(size_t new_index) noexcept(false)
{
   reconcile_current();

   // Nothing changes if the incoming image does not decode
   const auto idx = new_index % n_images();
   auto decoded   = load_and_decode(image_paths_[idx]);

   index_   = idx;
   current_ = std::move(decoded);
   dirty_   = false;
   in_progress_.reset();
   log_current();
}

void AnnotatorSession::finish() noexcept(false)
{
   in_progress_.reset();
   reconcile_current();
}

// -------------------------------------------------------------------- dispatch
//
AnnotatorSession::Action
AnnotatorSession::dispatch(const InputEvent& e) noexcept(false)
{
   switch(e.kind) {
   case InputEvent::NONE: break;
   case InputEvent::LBUTTON_DOWN: draw_begin(e.x, e.y); break;
   case InputEvent::MOUSE_MOVE: draw_update(e.x, e.y); break;
   case InputEvent::LBUTTON_UP: draw_commit(e.x, e.y); break;
   case InputEvent::KEY: {
      const char k = char(e.key);
      if(k == keys_.quit or e.key == k_escape_key) {
         finish();
         return Action::QUIT;
      } else if(k == keys_.next) {
         next();
      } else if(k == keys_.previous) {
         previous();
      } else if(k == keys_.clear) {
         clear();
      } else if(k == keys_.undo) {
         undo();
      }
   } break;
   }
   return Action::CONTINUE;
}

// ---------------------------------------------------------------------- render
//
cv::Mat AnnotatorSession::render() const
{
   cv::Mat frame = current_.image.clone();

   auto draw_rect = [&frame](const BoundingBox& bb) {
      cv::rectangle(frame,
                    cv::Point(bb.xmin, bb.ymin),
                    cv::Point(bb.xmax, bb.ymax),
                    k_rect_colour,
                    k_rect_thickness);
   };

   for(const auto& bb : current_boxes()) draw_rect(bb);
   if(in_progress_) draw_rect(*in_progress_);

   return frame;
}

} // namespace vocmark
