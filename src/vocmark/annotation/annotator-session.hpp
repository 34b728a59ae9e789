
#pragma once

#include "display.hpp"
#include "voc-codec.hpp"

namespace vocmark
{
constexpr const char* k_default_image_extension = ".jpg";

struct KeyBindings
{
   char quit     = 'q';
   char clear    = 'c';
   char next     = 'n';
   char previous = 'p';
   char undo     = 'u';
};

/**
 * Per-folder annotation state: one image is "current" at a time.
 *
 * Images are the files in `folder` with the given extension, sorted by
 * path. Each has at most one annotation file `folder/Annotations/<stem>.xml`,
 * which exists exactly when the image has at least one box once the
 * session has moved off that image. Annotation files with no objects are
 * deleted when the folder is opened.
 *
 * The session owns no window. Drive it with `dispatch()` and draw it
 * with `render()`.
 */
class AnnotatorSession
{
 public:
   enum class Action : int { CONTINUE = 0, QUIT };

   static constexpr int k_rect_thickness = 2;

 private:
   string folder_;
   string label_;
   KeyBindings keys_;
   vector<string> image_paths_;
   std::map<size_t, ImageRecord> annotations_; // keyed by index into paths

   size_t index_ = 0;
   DecodedImage current_;
   bool dirty_ = false;
   std::optional<BoundingBox> in_progress_;

   ImageRecord& current_record();
   void load_saved_annotations();
   void log_current() const;
   void reconcile_current();

 public:
   /**
    * @throws NotADirectoryError if `folder` is not a directory
    * @throws NoImagesFoundError if `folder` has no `image_extension` files
    * @throws ParseError if an existing annotation file is unreadable
    * @throws ImageReadError if the first image does not decode
    */
   AnnotatorSession(const string_view folder,
                    const string_view label,
                    const string_view image_extension
                    = k_default_image_extension,
                    const KeyBindings& keys = {}) noexcept(false);
   AnnotatorSession(const AnnotatorSession&) = delete;
   AnnotatorSession(AnnotatorSession&&)      = default;
   ~AnnotatorSession()                       = default;
   AnnotatorSession& operator=(const AnnotatorSession&) = delete;
   AnnotatorSession& operator=(AnnotatorSession&&) = default;

   // -- Getters
   const string& folder() const noexcept { return folder_; }
   const string& label() const noexcept { return label_; }
   const KeyBindings& key_bindings() const noexcept { return keys_; }
   size_t index() const noexcept { return index_; }
   size_t n_images() const noexcept { return image_paths_.size(); }
   const vector<string>& image_paths() const noexcept { return image_paths_; }
   const string& current_image_path() const noexcept
   {
      return image_paths_[index_];
   }
   const cv::Mat& current_image() const noexcept { return current_.image; }
   const ImageDimensions& current_dims() const noexcept
   {
      return current_.dims;
   }
   bool is_dirty() const noexcept { return dirty_; }
   bool is_drawing() const noexcept { return in_progress_.has_value(); }
   const std::optional<BoundingBox>& in_progress() const noexcept
   {
      return in_progress_;
   }

   const vector<BoundingBox>& current_boxes() const noexcept;
   const vector<string>& current_labels() const noexcept;

   // Boxes held in memory for image `idx`; empty if none
   const ImageRecord& record(size_t idx) const noexcept;

   string annotation_dir() const noexcept;
   string annotation_path(size_t idx) const noexcept;

   // -- Drawing
   void draw_begin(int x, int y) noexcept;
   void draw_update(int x, int y) noexcept;
   void draw_commit(int x, int y);

   // -- Commands
   void undo() noexcept;
   void clear() noexcept;
   void next() noexcept(false);
   void previous() noexcept(false);

   /**
    * Saves (or deletes the now stale annotation file of) the outgoing
    * image, then loads image `new_index % n_images()`.
    *
    * @throws ImageReadError if the incoming image does not decode. The
    *         outgoing image stays current, already saved.
    */
   void transition_to(size_t new_index) noexcept(false);

   // Reconciles the current image with disk. Called on quit.
   void finish() noexcept(false);

   Action dispatch(const InputEvent& e) noexcept(false);

   // A copy of the current image with all boxes drawn on it.
   cv::Mat render() const;
};

} // namespace vocmark
