#ifndef STCI_TYPES_HPP_
#define STCI_TYPES_HPP_

#include <stci/stci_export.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace stci {

// ============================================================================
// Pixel Formats
// ============================================================================

enum class pixel_format {
    indexed8,   // 8-bit indices, up to 256 colors
    rgb888,     // 24-bit, 8-bit RGB components, no alpha
    rgba8888    // 32-bit, 8-bit RGBA components
};

[[nodiscard]] constexpr std::size_t bytes_per_pixel(pixel_format fmt) noexcept {
    switch (fmt) {
        case pixel_format::indexed8: return 1;
        case pixel_format::rgb888:   return 3;
        case pixel_format::rgba8888: return 4;
    }
    return 0;
}

// ============================================================================
// Subrect Metadata (for multi-image containers)
// ============================================================================

struct image_rect {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;
};

enum class subrect_kind {
    sprite,
    tile,
    frame
};

struct subrect {
    image_rect rect;
    subrect_kind kind = subrect_kind::sprite;
    std::uint32_t user_tag = 0;
};

// ============================================================================
// Image View (plain pixel input for encoders)
// ============================================================================

/**
 * Non-owning view of tightly packed, row-major pixels.
 * Row pitch is width * bytes_per_pixel(format).
 */
struct image_view {
    int width = 0;
    int height = 0;
    pixel_format format = pixel_format::rgba8888;
    std::span<const std::uint8_t> pixels;

    [[nodiscard]] std::size_t pitch() const noexcept {
        return static_cast<std::size_t>(width) * bytes_per_pixel(format);
    }

    [[nodiscard]] std::size_t byte_size() const noexcept {
        return pitch() * static_cast<std::size_t>(height);
    }
};

// ============================================================================
// Codec Errors
// ============================================================================

enum class codec_error {
    none,
    format_mismatch,      // wrong magic or contradictory RGB/INDEXED flags
    unsupported_feature,  // ZLIB, aux data with RGB, aux data without ETRLE
    truncated_input,
    malformed_run,
    invalid_spec,
    field_overflow,
    invalid_component,
    unknown_flag,
    unknown_field,
    palette_overflow,
    dimensions_exceeded,
    io_error,
    internal_error
};

[[nodiscard]] STCI_EXPORT const char* to_string(codec_error err) noexcept;

// ============================================================================
// Codec Result
// ============================================================================

struct codec_result {
    bool ok = false;
    codec_error error = codec_error::none;
    std::string message;

    [[nodiscard]] static codec_result success() {
        return {true, codec_error::none, {}};
    }

    [[nodiscard]] static codec_result failure(codec_error err, std::string msg = {}) {
        return {false, err, std::move(msg)};
    }

    explicit operator bool() const noexcept { return ok; }
};

// ============================================================================
// Decode Options
// ============================================================================

struct decode_options {
    // Maximum allowed dimensions (0 = use default)
    int max_width = 16384;
    int max_height = 16384;

    // Bytes handed to a streaming decoder per step
    std::size_t stream_chunk_size = 16384;
};

} // namespace stci

#endif // STCI_TYPES_HPP_
