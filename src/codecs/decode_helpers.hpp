#pragma once

#include <stci/types.hpp>
#include <stci/surface.hpp>
#include <stci/header_layout.hpp>

#include <algorithm>
#include <cstdint>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stci {

// Default dimension limits
constexpr int DEFAULT_MAX_DIMENSION = 16384;

// Get effective dimension limits from options
inline std::pair<int, int> get_dimension_limits(const decode_options& options,
                                                int default_limit = DEFAULT_MAX_DIMENSION) {
    int max_w = options.max_width > 0 ? options.max_width : default_limit;
    int max_h = options.max_height > 0 ? options.max_height : default_limit;
    return {max_w, max_h};
}

// Validate dimensions against limits, returning failure result if exceeded
inline codec_result validate_dimensions(int width, int height,
                                        const decode_options& options,
                                        int default_limit = DEFAULT_MAX_DIMENSION) {
    auto [max_w, max_h] = get_dimension_limits(options, default_limit);
    if (width > max_w || height > max_h) {
        return codec_result::failure(codec_error::dimensions_exceeded,
            "Image dimensions " + std::to_string(width) + "x" + std::to_string(height) +
            " exceed limits");
    }
    return codec_result::success();
}

// Copy pixel data row-by-row to a surface
// data: pointer to pixel data (row-major, contiguous)
// row_bytes: bytes per row in the source data
// x_bytes: byte offset of the first column in the surface row
inline void write_rows(surface& surf, const std::uint8_t* data,
                       std::size_t row_bytes, int height,
                       int x_bytes = 0, int y = 0) {
    for (int row = 0; row < height; ++row) {
        surf.write_pixels(x_bytes, y + row, static_cast<int>(row_bytes),
                          data + static_cast<std::size_t>(row) * row_bytes);
    }
}

// Lay frames out left to right with a one-pixel gap between them.
// boxes carry each frame's w/h on input; x/y are assigned and the canvas
// size (widest extent, tallest frame) is returned.
inline std::pair<int, int> layout_frames(std::vector<image_rect>& boxes) {
    int width = 0;
    int height = 0;
    for (auto& box : boxes) {
        if (width > 0) {
            width += 1;
        }
        box.x = width;
        box.y = 0;
        width += box.w;
        height = std::max(height, box.h);
    }
    return {width, height};
}

// Set several integer fields by name, stopping at the first failure
inline codec_result assign_fields(header_fields& fields,
                                  std::initializer_list<std::pair<std::string_view, std::uint64_t>> values) {
    for (const auto& [name, value] : values) {
        auto result = fields.set(name, value);
        if (!result) {
            return result;
        }
    }
    return codec_result::success();
}

} // namespace stci
