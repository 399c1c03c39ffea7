#include "plot_digitizer/extraction/region_scanner.hpp"

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <vector>

using plot_digitizer::Bounds;
using plot_digitizer::RgbColor;
using plot_digitizer::RgbImage;
using namespace plot_digitizer::extraction;

namespace {

const RgbColor kWhite{255, 255, 255};
const RgbColor kBlue{20, 40, 200};

} // namespace

TEST_CASE("scan_region_returns_one_sorted_set_per_column") {
  RgbImage img(6, 3, kWhite);
  img.set(0, 4, kBlue);
  img.set(0, 1, kBlue);
  img.set(2, 5, kBlue);

  auto matches = scan_region(img, {kBlue, 0}, std::nullopt);
  REQUIRE(matches.size() == 3);
  REQUIRE(matches[0] == std::vector<int>{1, 4});
  REQUIRE(matches[1].empty());
  REQUIRE(matches[2] == std::vector<int>{5});
  REQUIRE(count_matches(matches) == 3);
}

TEST_CASE("scan_region_respects_bounds_inclusively") {
  RgbImage img(10, 1, kBlue);

  auto matches = scan_region(img, {kBlue, 0}, Bounds::make(2, 4));
  REQUIRE(matches[0] == std::vector<int>{2, 3, 4});
}

TEST_CASE("bounds_past_image_are_clamped") {
  RgbImage img(5, 2, kBlue);

  ScanRange r = resolve_scan_range(img, Bounds::make(3, 40));
  REQUIRE(r.first_row == 3);
  REQUIRE(r.last_row == 4);

  auto matches = scan_region(img, {kBlue, 0}, Bounds::make(3, 40));
  REQUIRE(matches[1] == std::vector<int>{3, 4});

  ScanRange outside = resolve_scan_range(img, Bounds::make(10, 20));
  REQUIRE(outside.empty());
  REQUIRE(count_matches(scan_region(img, {kBlue, 0}, Bounds::make(10, 20))) == 0);
}

TEST_CASE("mask_cleanup_fills_enclosed_hole") {
  RgbImage img(7, 7, kWhite);
  for (int y = 2; y <= 4; ++y) {
    for (int x = 2; x <= 4; ++x) {
      if (x == 3 && y == 3) continue;
      img.set(x, y, kBlue);
    }
  }

  MatchMask mask = build_match_mask(img, {kBlue, 0}, std::nullopt);
  REQUIRE(collect_column_matches(mask)[3] == std::vector<int>{2, 4});

  MaskCleanupOptions opts;
  opts.fill_holes = true;
  opts.kernel_size = 1;
  clean_match_mask(mask, resolve_scan_range(img, std::nullopt), opts);

  auto matches = collect_column_matches(mask);
  REQUIRE(matches[3] == std::vector<int>{2, 3, 4});
  REQUIRE(matches[0].empty());
  REQUIRE(count_matches(matches) == 9);
}

TEST_CASE("mask_cleanup_closes_single_pixel_gap") {
  RgbImage img(7, 7, kWhite);
  for (int x = 0; x < 7; ++x) {
    if (x != 3) img.set(x, 3, kBlue);
  }

  MatchMask mask = build_match_mask(img, {kBlue, 0}, std::nullopt);
  REQUIRE(collect_column_matches(mask)[3].empty());

  MaskCleanupOptions opts;
  opts.fill_holes = false;
  opts.kernel_size = 3;
  clean_match_mask(mask, resolve_scan_range(img, std::nullopt), opts);

  REQUIRE(collect_column_matches(mask)[3] == std::vector<int>{3});
}
