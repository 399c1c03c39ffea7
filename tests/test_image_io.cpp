#include "plot_digitizer/core/errors.hpp"
#include "plot_digitizer/io/image_io.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using plot_digitizer::IOError;
using plot_digitizer::RgbColor;
using plot_digitizer::RgbImage;
using namespace plot_digitizer::io;

TEST_CASE("png_keeps_channel_order") {
  RgbImage img(3, 4, {255, 255, 255});
  img.set(1, 2, {250, 10, 40});
  img.set(3, 0, {0, 128, 255});

  const fs::path path = fs::temp_directory_path() / "plot_digitizer_image_io_test.png";
  save_rgb_image(path, img);
  RgbImage back = load_rgb_image(path);
  fs::remove(path);

  REQUIRE(back.width() == 4);
  REQUIRE(back.height() == 3);
  REQUIRE(back.at(1, 2) == RgbColor{250, 10, 40});
  REQUIRE(back.at(3, 0) == RgbColor{0, 128, 255});
  REQUIRE(back.at(0, 0) == RgbColor{255, 255, 255});
}

TEST_CASE("load_missing_or_undecodable_image_raises_io_error") {
  REQUIRE_THROWS_AS(load_rgb_image("/nonexistent/chart.png"), IOError);

  const fs::path path = fs::temp_directory_path() / "plot_digitizer_not_an_image.png";
  {
    std::ofstream out(path);
    out << "not an image";
  }
  REQUIRE_THROWS_AS(load_rgb_image(path), IOError);
  fs::remove(path);
}
