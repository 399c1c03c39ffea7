#pragma once

#include "plot_digitizer/core/types.hpp"

#include <filesystem>

namespace plot_digitizer::io {

namespace fs = std::filesystem;

// Decode an 8-bit color image (any format OpenCV reads). Throws IOError.
RgbImage load_rgb_image(const fs::path& path);

// Write the image as PNG (or whatever the extension selects). Throws IOError.
void save_rgb_image(const fs::path& path, const RgbImage& image);

} // namespace plot_digitizer::io
