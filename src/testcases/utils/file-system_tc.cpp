
#define CATCH_CONFIG_PREFIX_ALL

#include "stdinc.hpp"

#include <catch2/catch.hpp>

namespace vocmark
{
CATCH_TEST_CASE("Basename", "[basename]")
{
   CATCH_SECTION("basename-dirname-ext")
   {
      CATCH_REQUIRE(basename("/a/b/image-001.jpg") == "image-001.jpg");
      CATCH_REQUIRE(basename("/a/b/image-001.jpg", true) == "image-001");
      CATCH_REQUIRE(basename("image.tar.gz", true) == "image.tar");
      CATCH_REQUIRE(dirname("/a/b/image-001.jpg") == "/a/b");
      CATCH_REQUIRE(dirname("foo") == "");
      CATCH_REQUIRE(file_ext("/a/b/image-001.jpg") == ".jpg");
      CATCH_REQUIRE(file_ext("/a/b/README") == "");
      CATCH_REQUIRE(absolute_path("/a/./b/../c.xml") == "/a/c.xml");
   }
}

CATCH_TEST_CASE("FileGetPutContents", "[file-system]")
{
   const auto dir = make_temp_directory("/tmp/vocmark-fs-testcase-");
   CATCH_REQUIRE(is_directory(dir));

   CATCH_SECTION("get-put-contents")
   {
      const auto fname = format("{}/a.txt", dir);
      CATCH_REQUIRE(!file_put_contents(fname, "hello\nworld"));
      CATCH_REQUIRE(is_regular_file(fname));
      CATCH_REQUIRE(!is_directory(fname));
      CATCH_REQUIRE(file_get_contents(fname) == "hello\nworld");

      string out;
      CATCH_REQUIRE(file_get_contents(format("{}/nope.txt", dir), out));
      CATCH_REQUIRE_THROWS_AS(file_get_contents(format("{}/nope.txt", dir)),
                              std::runtime_error);

      CATCH_REQUIRE(!delete_file(fname));
      CATCH_REQUIRE(!is_regular_file(fname));
   }

   CATCH_SECTION("mkdir-p-and-ls")
   {
      const auto sub = format("{}/x/y/z", dir);
      CATCH_REQUIRE(mkdir_p(sub));
      CATCH_REQUIRE(mkdir_p(sub)); // already there
      CATCH_REQUIRE(is_directory(sub));

      file_put_contents(format("{}/b.jpg", sub), "b");
      file_put_contents(format("{}/a.jpg", sub), "a");
      CATCH_REQUIRE(mkdir_p(format("{}/c", sub)));

      const auto files = list_regular_files(sub);
      CATCH_REQUIRE(files
                    == vector<string>{format("{}/a.jpg", sub),
                                      format("{}/b.jpg", sub)});
      CATCH_REQUIRE(list_regular_files(format("{}/nope", dir)).empty());
   }

   CATCH_REQUIRE(remove_all(dir) > 0);
   CATCH_REQUIRE(!is_directory(dir));
}

} // namespace vocmark
