#include "plot_digitizer/core/errors.hpp"
#include "plot_digitizer/core/utils.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <string>
#include <vector>

using plot_digitizer::IOError;
namespace core = plot_digitizer::core;
namespace fs = std::filesystem;

TEST_CASE("glob_match_is_case_insensitive") {
  REQUIRE(core::glob_match("*.png", "chart.PNG"));
  REQUIRE(core::glob_match("chart_??.jpg", "chart_01.jpg"));
  REQUIRE_FALSE(core::glob_match("*.png", "chart.png.bak"));
  REQUIRE_FALSE(core::glob_match("*.tif", "chartXtif"));
}

TEST_CASE("string_helpers") {
  REQUIRE(core::trim("  a b \t\n") == "a b");
  REQUIRE(core::trim("   ").empty());
  REQUIRE(core::to_lower("UnDo") == "undo");
  REQUIRE(core::split("*.png;*.jpg", ';') == std::vector<std::string>{"*.png", "*.jpg"});
}

TEST_CASE("sha256_of_known_input") {
  const std::string abc = "abc";
  std::vector<uint8_t> data(abc.begin(), abc.end());
  REQUIRE(core::sha256_bytes(data) ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("discover_images_filters_and_sorts") {
  const fs::path dir = fs::temp_directory_path() / "plot_digitizer_discover_test";
  fs::remove_all(dir);
  fs::create_directories(dir);
  for (const char* name : {"b.png", "a.JPG", "notes.txt", "c.tiff"}) {
    core::write_text(dir / name, "x");
  }

  auto images = core::discover_images(dir, "*.png;*.jpg; *.tiff");
  REQUIRE(images.size() == 3);
  REQUIRE(images[0].filename() == "a.JPG");
  REQUIRE(images[1].filename() == "b.png");
  REQUIRE(images[2].filename() == "c.tiff");

  REQUIRE(core::discover_images(dir / "missing", "*.png").empty());
  fs::remove_all(dir);
}

TEST_CASE("missing_files_raise_io_error") {
  REQUIRE_THROWS_AS(core::read_bytes("/nonexistent/plot_digitizer.txt"), IOError);
  REQUIRE_THROWS_AS(core::sha256_file("/nonexistent/plot_digitizer.txt"), IOError);
  REQUIRE_THROWS_AS(core::write_text("/nonexistent/dir/out.csv", "x"), IOError);
}

TEST_CASE("run_id_and_timestamp_shapes") {
  REQUIRE(core::get_run_id().size() == 24);
  const std::string ts = core::get_iso_timestamp();
  REQUIRE(ts.size() == 24);
  REQUIRE(ts.back() == 'Z');
}
