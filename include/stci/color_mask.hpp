#ifndef STCI_COLOR_MASK_HPP_
#define STCI_COLOR_MASK_HPP_

#include <stci/stci_export.h>
#include <stci/types.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace stci {

// ============================================================================
// Color Spec
// ============================================================================

/**
 * Bit-mask description of one packed truecolor pixel.
 * Channel order in masks/depths is R, G, B, A.
 */
struct color_spec {
    std::array<std::uint32_t, 4> masks{};
    std::array<std::uint8_t, 4> depths{};
    std::uint8_t color_depth = 0;  // total bits per pixel

    [[nodiscard]] bool has_alpha() const noexcept { return masks[3] != 0; }

    // Serialized pixel width in bytes
    [[nodiscard]] std::size_t pixel_bytes() const noexcept { return color_depth / 8u; }

    friend bool operator==(const color_spec&, const color_spec&) = default;
};

struct rgba_color {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 0;

    friend bool operator==(const rgba_color&, const rgba_color&) = default;
};

/**
 * The 5-6-5 packing used by official RGB images ("BGR;16").
 */
[[nodiscard]] STCI_EXPORT const color_spec& default_rgb_spec() noexcept;

/**
 * Look up a standard packing by rawmode name (e.g. "BGR;16", "RGBA").
 * @return Pointer to the spec, nullptr if the name is unknown
 */
[[nodiscard]] STCI_EXPORT const color_spec* find_named_spec(std::string_view name) noexcept;

/**
 * Rawmode name of a spec, or an empty view if it is not a standard packing.
 */
[[nodiscard]] STCI_EXPORT std::string_view spec_name(const color_spec& spec) noexcept;

/**
 * Validate a spec.
 *
 * Each mask must be a single run of exactly depth one-bits
 * (mask == ((1 << depth) - 1) << shift), the total depth a positive multiple
 * of 8 no greater than 64, and the channel depths must sum to at most the
 * total depth.
 * @return invalid_spec describing the first violation
 */
[[nodiscard]] STCI_EXPORT codec_result validate_spec(const color_spec& spec);

// ============================================================================
// Pixel Packing
// ============================================================================

/**
 * Expand a raw pixel to 8-bit channels.
 *
 * A channel whose bits are all set yields 255. Narrower channels are scaled
 * with (value * 255) / max (floor division); wider channels keep their top
 * 8 bits. Absent channels yield 0, including alpha: callers treat a missing
 * alpha mask as opaque.
 */
[[nodiscard]] STCI_EXPORT rgba_color unpack_color(std::uint64_t raw, const color_spec& spec) noexcept;

/**
 * Quantize 8-bit channels into a raw pixel.
 * @param r, g, b, a Components; each must be in 0..255
 * @param spec Packing (assumed valid)
 * @param raw Receives the packed value
 * @return invalid_component if a component is out of range
 */
[[nodiscard]] STCI_EXPORT codec_result pack_color(int r, int g, int b, int a,
                                                  const color_spec& spec,
                                                  std::uint64_t& raw);

/**
 * Read one serialized pixel of the given byte width (see write_packed_pixel).
 */
[[nodiscard]] STCI_EXPORT std::uint64_t read_packed_pixel(const std::uint8_t* p,
                                                          std::size_t pixel_bytes) noexcept;

/**
 * Append one serialized pixel.
 *
 * 1 byte: the value. 2 bytes: little-endian 16-bit. 3 bytes: little-endian
 * 16-bit low word, then bits 16-23. 4+ bytes: little-endian 32-bit word, then
 * zero bytes (masks never address bits beyond 32).
 */
STCI_EXPORT void write_packed_pixel(std::uint64_t raw,
                                    std::size_t pixel_bytes,
                                    std::vector<std::uint8_t>& out);

} // namespace stci

#endif // STCI_COLOR_MASK_HPP_
