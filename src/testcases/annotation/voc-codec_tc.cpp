
#define CATCH_CONFIG_PREFIX_ALL

#include "image-folder.hpp"
#include "stdinc.hpp"
#include "vocmark/annotation/voc-codec.hpp"

#include <catch2/catch.hpp>

namespace vocmark
{
static const ImageDimensions k_dims{640, 480, 3};

// --------------------------------------------------------------- encode/decode

CATCH_TEST_CASE("VocCodec write then read", "[voc-codec]")
{
   testing::ImageFolder folder(0);

   CATCH_SECTION("boxes and labels come back in order")
   {
      const vector<string> labels{"red roomba", "green roomba", "red roomba"};
      const vector<BoundingBox> boxes{
          {548, 472, 878, 753}, {697, 293, 982, 531}, {0, 0, 1, 1}};

      const auto fname = format("{}/three.xml", folder.dir);
      write(encode(k_dims, labels, boxes), fname, false);

      const auto rec = read(fname);
      CATCH_REQUIRE(rec.labels == labels);
      CATCH_REQUIRE(rec.boxes == boxes);
   }

   CATCH_SECTION("reversed boxes are stored as given")
   {
      const vector<string> labels{"x"};
      const vector<BoundingBox> boxes{{50, 40, 10, 5}};
      const auto fname = format("{}/reversed.xml", folder.dir);
      write(encode(k_dims, labels, boxes), fname, false);
      CATCH_REQUIRE(read(fname).boxes == boxes);
   }

   CATCH_SECTION("file carries the size block and literal zero flags")
   {
      const auto fname = format("{}/format.xml", folder.dir);
      write(encode(k_dims, {"red roomba"}, {{10, 10, 50, 50}}), fname, false);

      const auto xml = file_get_contents(fname);
      CATCH_REQUIRE(xml.find("<annotation>") != string::npos);
      CATCH_REQUIRE(xml.find("<width>640</width>") != string::npos);
      CATCH_REQUIRE(xml.find("<height>480</height>") != string::npos);
      CATCH_REQUIRE(xml.find("<depth>3</depth>") != string::npos);
      CATCH_REQUIRE(xml.find("<name>red roomba</name>") != string::npos);
      CATCH_REQUIRE(xml.find("<truncated>0</truncated>") != string::npos);
      CATCH_REQUIRE(xml.find("<difficult>0</difficult>") != string::npos);
      CATCH_REQUIRE(xml.find("<xmax>50</xmax>") != string::npos);
      CATCH_REQUIRE(xml.find('\n') != string::npos); // pretty printed
   }

   CATCH_SECTION("labels keep surrounding whitespace")
   {
      const vector<string> labels{" red roomba ", "tab\tlabel\t", "\nx"};
      const vector<BoundingBox> boxes{{1, 1, 5, 5}, {2, 2, 6, 6}, {3, 3, 7, 7}};
      const auto fname = format("{}/whitespace.xml", folder.dir);
      write(encode(k_dims, labels, boxes), fname, false);
      CATCH_REQUIRE(read(fname).labels == labels);
   }

   CATCH_SECTION("an annotation with no objects reads as empty")
   {
      const auto fname = format("{}/empty.xml", folder.dir);
      write(encode(k_dims, {}, {}), fname, false);
      CATCH_REQUIRE(read(fname).empty());
   }
}

CATCH_TEST_CASE("VocCodec encode rejects mismatched sizes", "[voc-codec]")
{
   CATCH_REQUIRE_THROWS_AS(encode(k_dims, {"a", "b"}, {{0, 0, 1, 1}}),
                           std::invalid_argument);
}

// ----------------------------------------------------------------- overwriting

CATCH_TEST_CASE("VocCodec write respects overwrite", "[voc-codec]")
{
   testing::ImageFolder folder(0);
   const auto fname = format("{}/a.xml", folder.dir);

   write(encode(k_dims, {"a", "a"}, {{1, 2, 3, 4}, {5, 6, 7, 8}}), fname, false);

   const auto doc = encode(k_dims, {"b"}, {{9, 9, 19, 19}});
   CATCH_REQUIRE_THROWS_AS(write(doc, fname, false), AlreadyExistsError);
   CATCH_REQUIRE(read(fname).size() == 2);

   write(doc, fname, true);
   const auto rec = read(fname);
   CATCH_REQUIRE(rec.size() == 1);
   CATCH_REQUIRE(rec.labels[0] == "b");
   CATCH_REQUIRE(rec.boxes[0] == BoundingBox(9, 9, 19, 19));
}

// ---------------------------------------------------------------- parse errors

CATCH_TEST_CASE("VocCodec read reports parse errors", "[voc-codec]")
{
   testing::ImageFolder folder(0);
   const auto fname = format("{}/bad.xml", folder.dir);

   auto read_str = [&](const string_view xml) {
      file_put_contents(fname, xml);
      return read(fname);
   };

   CATCH_SECTION("missing file")
   {
      CATCH_REQUIRE_THROWS_AS(read(format("{}/nope.xml", folder.dir)),
                              ParseError);
   }

   CATCH_SECTION("malformed xml")
   {
      CATCH_REQUIRE_THROWS_AS(read_str("<annotation><object>"), ParseError);
   }

   CATCH_SECTION("wrong root")
   {
      CATCH_REQUIRE_THROWS_AS(read_str("<foo></foo>"), ParseError);
   }

   CATCH_SECTION("missing coordinate")
   {
      CATCH_REQUIRE_THROWS_AS(
          read_str("<annotation><object><name>a</name><bndbox>"
                   "<xmin>1</xmin><ymin>2</ymin><xmax>3</xmax>"
                   "</bndbox></object></annotation>"),
          ParseError);
   }

   CATCH_SECTION("non-integer coordinate")
   {
      CATCH_REQUIRE_THROWS_AS(
          read_str("<annotation><object><name>a</name><bndbox>"
                   "<xmin>1</xmin><ymin>2.5</ymin><xmax>3</xmax><ymax>4</ymax>"
                   "</bndbox></object></annotation>"),
          ParseError);
   }

   CATCH_SECTION("missing name")
   {
      CATCH_REQUIRE_THROWS_AS(
          read_str("<annotation><object><bndbox>"
                   "<xmin>1</xmin><ymin>2</ymin><xmax>3</xmax><ymax>4</ymax>"
                   "</bndbox></object></annotation>"),
          ParseError);
   }

   CATCH_SECTION("whitespace around coordinates is tolerated")
   {
      const auto rec = read_str("<annotation>\n  <object>\n"
                                "    <name>red roomba</name>\n"
                                "    <bndbox><xmin> 1 </xmin><ymin>2</ymin>"
                                "<xmax>3</xmax><ymax>4\n</ymax></bndbox>\n"
                                "  </object>\n</annotation>\n");
      CATCH_REQUIRE(rec.size() == 1);
      CATCH_REQUIRE(rec.labels[0] == "red roomba");
      CATCH_REQUIRE(rec.boxes[0] == BoundingBox(1, 2, 3, 4));
   }
}

// ---------------------------------------------------------------- image access

CATCH_TEST_CASE("VocCodec load-and-decode", "[voc-codec]")
{
   testing::ImageFolder folder(1, 32, 24);

   const auto decoded = load_and_decode(folder.images[0]);
   CATCH_REQUIRE(decoded.dims.width == 32);
   CATCH_REQUIRE(decoded.dims.height == 24);
   CATCH_REQUIRE(decoded.dims.depth == 3);

   const auto garbage = format("{}/garbage.jpg", folder.dir);
   file_put_contents(garbage, "this is not a jpeg");
   CATCH_REQUIRE_THROWS_AS(load_and_decode(garbage), ImageReadError);
   CATCH_REQUIRE_THROWS_AS(load_and_decode(format("{}/nope.jpg", folder.dir)),
                           ImageReadError);
}

CATCH_TEST_CASE("VocCodec annotation-for-image-file", "[voc-codec]")
{
   testing::ImageFolder folder(1, 32, 24);
   const auto& image = folder.images[0];

   CATCH_REQUIRE(annotation_path_for("/a/b/frame-01.jpg", "/a/b/Annotations")
                 == "/a/b/Annotations/frame-01.xml");

   const auto fname = write_annotation_for_image_file(
       image, {"red roomba"}, {{1, 2, 30, 20}});
   CATCH_REQUIRE(is_regular_file(folder.annotation(0)));
   CATCH_REQUIRE(absolute_path(fname) == absolute_path(folder.annotation(0)));

   const auto xml = file_get_contents(fname);
   CATCH_REQUIRE(xml.find("<width>32</width>") != string::npos);
   CATCH_REQUIRE(xml.find("<height>24</height>") != string::npos);

   CATCH_REQUIRE_THROWS_AS(
       write_annotation_for_image_file(image, {"x"}, {{0, 0, 1, 1}}),
       AlreadyExistsError);

   write_annotation_for_image_file(
       image, {"x"}, {{0, 0, 1, 1}}, k_annotation_dir, true);
   CATCH_REQUIRE(read(fname).labels == vector<string>{"x"});
}

} // namespace vocmark
