
#define CATCH_CONFIG_PREFIX_ALL

#include "stdinc.hpp"
#include <catch2/catch.hpp>

#include <filesystem>

#include "anthro/utils/file-system.hpp"

namespace anthro
{
CATCH_TEST_CASE("FileSystem", "[file-system]")
{
   CATCH_SECTION("path-parts")
   {
      CATCH_REQUIRE(dirname("foo") == ".");
      CATCH_REQUIRE(dirname("/foo") == "/");
      CATCH_REQUIRE(dirname("/data/plan.json") == "/data");
      CATCH_REQUIRE(basename("/data/plan.json") == "plan.json");
      CATCH_REQUIRE(basename("/data/plan.json", true) == "plan");
      CATCH_REQUIRE(file_ext("/data/plan.json") == ".json");
      CATCH_REQUIRE(file_ext("/data/plan").empty());
   }

   CATCH_SECTION("get-put-contents")
   {
      const auto dir = std::filesystem::temp_directory_path().string();
      const auto fname = format("{}/anthro-file-system-tc.json", dir);
      const string dat = "{ \"a\": 1 }\n";

      CATCH_REQUIRE(!file_put_contents(fname, dat));
      CATCH_REQUIRE(is_regular_file(fname));
      CATCH_REQUIRE(!is_directory(fname));
      CATCH_REQUIRE(is_directory(dir));
      CATCH_REQUIRE(file_get_contents(fname) == dat);

      string out;
      CATCH_REQUIRE(!file_get_contents(fname, out));
      CATCH_REQUIRE(out == dat);

      std::filesystem::remove(fname);
      CATCH_REQUIRE(!is_regular_file(fname));
      CATCH_REQUIRE(file_get_contents(fname, out));
      CATCH_REQUIRE_THROWS(file_get_contents(fname));
      CATCH_REQUIRE(file_put_contents("/no/such/dir/x.json", dat));
   }
}

} // namespace anthro
