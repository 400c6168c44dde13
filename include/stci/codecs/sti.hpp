#ifndef STCI_CODECS_STI_HPP_
#define STCI_CODECS_STI_HPP_

#include <stci/stci_export.h>
#include <stci/types.hpp>
#include <stci/surface.hpp>
#include <stci/color_mask.hpp>
#include <stci/header_layout.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace stci {

// ============================================================================
// Format Constants
// ============================================================================

constexpr std::array<std::uint8_t, 4> STI_MAGIC = {'S', 'T', 'C', 'I'};
constexpr std::size_t STI_HEADER_SIZE = 64;
constexpr std::size_t STI_FORMAT_HEADER_SIZE = 20;
constexpr std::size_t STI_SUBIMAGE_HEADER_SIZE = 16;
constexpr std::size_t STI_AUX_DATA_SIZE = 16;
constexpr std::size_t STI_PALETTE_COLORS = 256;
constexpr std::size_t STI_PALETTE_SIZE = STI_PALETTE_COLORS * 3;

// Bit positions in the header's flags field
enum class sti_flag : unsigned {
    aux_object_data = 0,
    rgb = 2,
    indexed = 3,
    zlib = 4,
    etrle = 5
};

// Bit positions in the tile metadata flags field
enum class tile_flag : unsigned {
    full_tile = 0,
    animated_tile = 1,
    dynamic_tile = 2,
    interactive_tile = 3,
    ignores_height = 4,
    uses_land_z = 5
};

[[nodiscard]] constexpr std::uint32_t flag_mask(sti_flag f) noexcept {
    return std::uint32_t{1} << static_cast<unsigned>(f);
}

[[nodiscard]] constexpr std::uint8_t flag_mask(tile_flag f) noexcept {
    return static_cast<std::uint8_t>(1u << static_cast<unsigned>(f));
}

// ============================================================================
// Record Layouts
// ============================================================================

// Main 64-byte header; "flags" carries the sti_flag bits by name
// (AUX_OBJECT_DATA, RGB, INDEXED, ZLIB, ETRLE)
[[nodiscard]] STCI_EXPORT const header_layout& sti_header_layout();

// 20-byte format header of RGB files: four masks, four depths
[[nodiscard]] STCI_EXPORT const header_layout& sti_truecolor_header_layout();

// 20-byte format header of INDEXED files: palette size, image count, depths
[[nodiscard]] STCI_EXPORT const header_layout& sti_indexed_header_layout();

[[nodiscard]] STCI_EXPORT const header_layout& sti_subimage_header_layout();

// Tile metadata; "flags" carries the tile_flag bits by name
// (FULL_TILE, ANIMATED_TILE, DYNAMIC_TILE, INTERACTIVE_TILE, IGNORES_HEIGHT, USES_LAND_Z)
[[nodiscard]] STCI_EXPORT const header_layout& aux_object_data_layout();

// ============================================================================
// Typed Records
// ============================================================================

struct sti_header {
    std::array<std::uint8_t, 4> identifier = STI_MAGIC;
    std::uint32_t initial_size = 0;
    std::uint32_t size_after_compression = 0;
    std::uint32_t transparent_color = 0;
    std::uint32_t flags = 0;
    std::uint16_t height = 0;
    std::uint16_t width = 0;
    std::array<std::uint8_t, STI_FORMAT_HEADER_SIZE> format_header{};
    std::uint8_t color_depth = 0;
    std::uint32_t aux_data_size = 0;

    [[nodiscard]] bool has(sti_flag f) const noexcept { return (flags & flag_mask(f)) != 0; }
};

struct sti_subimage_header {
    std::uint32_t offset = 0;  // relative to the compressed data block
    std::uint32_t length = 0;
    std::uint16_t offset_x = 0;
    std::uint16_t offset_y = 0;
    std::uint16_t height = 0;
    std::uint16_t width = 0;
};

/**
 * Per-frame tile metadata.
 */
struct aux_object_data {
    std::uint8_t wall_orientation = 0;
    std::uint8_t number_of_tiles = 0;
    std::uint16_t tile_location_index = 0;
    std::uint8_t current_frame = 0;
    std::uint8_t number_of_frames = 0;
    std::uint8_t flags = 0;

    [[nodiscard]] bool has(tile_flag f) const noexcept { return (flags & flag_mask(f)) != 0; }

    void set(tile_flag f, bool on) noexcept {
        flags = on ? static_cast<std::uint8_t>(flags | flag_mask(f))
                   : static_cast<std::uint8_t>(flags & ~flag_mask(f));
    }

    [[nodiscard]] bool full_tile() const noexcept { return has(tile_flag::full_tile); }
    [[nodiscard]] bool animated_tile() const noexcept { return has(tile_flag::animated_tile); }
    [[nodiscard]] bool dynamic_tile() const noexcept { return has(tile_flag::dynamic_tile); }
    [[nodiscard]] bool interactive_tile() const noexcept { return has(tile_flag::interactive_tile); }
    [[nodiscard]] bool ignores_height() const noexcept { return has(tile_flag::ignores_height); }
    [[nodiscard]] bool uses_land_z() const noexcept { return has(tile_flag::uses_land_z); }

    friend bool operator==(const aux_object_data&, const aux_object_data&) = default;
};

/**
 * Parse the 64-byte main header (no validation of magic or flags).
 * @return truncated_input if data is shorter than the header
 */
[[nodiscard]] STCI_EXPORT codec_result read_sti_header(std::span<const std::uint8_t> data,
                                                       sti_header& header);

[[nodiscard]] STCI_EXPORT codec_result read_subimage_header(std::span<const std::uint8_t> data,
                                                            sti_subimage_header& header);

[[nodiscard]] STCI_EXPORT codec_result read_aux_object_data(std::span<const std::uint8_t> data,
                                                            aux_object_data& aux);

/**
 * Append one 16-byte tile metadata record.
 */
[[nodiscard]] STCI_EXPORT codec_result write_aux_object_data(const aux_object_data& aux,
                                                             std::vector<std::uint8_t>& out);

// ============================================================================
// Palette
// ============================================================================

// 256 interleaved RGB triples
using sti_palette = std::array<std::uint8_t, STI_PALETTE_SIZE>;

/**
 * Convert the on-disk palette (R plane, G plane, B plane of 256 bytes each)
 * to interleaved triples.
 */
STCI_EXPORT void palette_from_planes(std::span<const std::uint8_t, STI_PALETTE_SIZE> planes,
                                     sti_palette& palette) noexcept;

/**
 * Append the on-disk plane form of interleaved RGB triples. Palettes with
 * fewer than 256 colors are padded with black, longer ones truncated.
 */
STCI_EXPORT void palette_to_planes(std::span<const std::uint8_t> palette,
                                   std::vector<std::uint8_t>& out);

// ============================================================================
// Probes
// ============================================================================

/**
 * Check the flag combination of a header.
 * @return format_mismatch unless exactly one of RGB/INDEXED is set,
 *         unsupported_feature if ZLIB is set
 */
[[nodiscard]] STCI_EXPORT codec_result validate_flags(std::uint32_t flags);

// Magic plus RGB without INDEXED
[[nodiscard]] STCI_EXPORT bool is_truecolor_sti(std::span<const std::uint8_t> data) noexcept;

// Magic plus INDEXED without RGB
[[nodiscard]] STCI_EXPORT bool is_indexed_sti(std::span<const std::uint8_t> data) noexcept;

// ============================================================================
// Loaded Image
// ============================================================================

enum class sti_kind {
    truecolor,    // RGB flag: one packed-pixel image
    indexed,      // INDEXED flag: one raw index image
    etrle         // INDEXED + ETRLE: compressed sub-images
};

struct sti_subimage {
    int offset_x = 0;
    int offset_y = 0;
    int width = 0;
    int height = 0;
    std::vector<std::uint8_t> pixels;  // width*height palette indices
    std::optional<aux_object_data> aux;

    [[nodiscard]] image_view view() const noexcept {
        return {width, height, pixel_format::indexed8, pixels};
    }
};

struct sti_image {
    sti_header header;
    sti_kind kind = sti_kind::truecolor;

    // Canvas size. For ETRLE files this is the composed size of the
    // sub-images laid out left to right with one-pixel gaps.
    int width = 0;
    int height = 0;

    // True when the composed canvas disagrees with the header's size
    bool canvas_overridden = false;

    pixel_format format = pixel_format::rgb888;
    color_spec spec;                    // truecolor only
    std::vector<std::uint8_t> pixels;   // truecolor or raw indexed pixels
    sti_palette palette{};              // indexed kinds only
    std::vector<sti_subimage> subimages;
    std::vector<image_rect> boxes;      // canvas placement of each sub-image
    std::uint32_t transparent_index = 0;

    /**
     * Truecolor or raw indexed pixels as an encoder input. Empty for ETRLE
     * images; use subimages instead.
     */
    [[nodiscard]] image_view view() const noexcept {
        return {width, height, format, pixels};
    }
};

/**
 * Load an STI file.
 *
 * No partial result is produced on failure; image is only assigned on
 * success.
 * @return format_mismatch for a wrong magic or RGB/INDEXED conflict;
 *         unsupported_feature for ZLIB, aux data outside ETRLE files, a
 *         palette other than 256 x 8-bit colors, or an ETRLE file without
 *         images; truncated_input when data ends early; malformed_run for
 *         bad ETRLE data; invalid_spec for an unusable color spec;
 *         dimensions_exceeded past the configured limits
 */
[[nodiscard]] STCI_EXPORT codec_result load_sti(std::span<const std::uint8_t> data,
                                                sti_image& image,
                                                const decode_options& options = {});

// ============================================================================
// STI Decoder
// ============================================================================

class STCI_EXPORT sti_decoder {
public:
    static constexpr std::string_view name = "sti";
    static constexpr std::string_view extensions[] = {".sti"};

    /**
     * Check if data appears to be an STI file.
     * @param data Raw file data
     * @return true if the STCI magic is present
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Decode STI data to a surface.
     *
     * Truecolor files produce rgb888 or rgba8888. Indexed files produce
     * indexed8 with a 256-color palette and a transparent index. ETRLE
     * sub-images are placed on the composed canvas, pre-filled with the
     * transparent index, and each is reported as a frame subrect whose
     * user_tag is its index.
     * @param data Raw file data
     * @param surf Destination surface
     * @param options Decode options
     * @return Same errors as load_sti(), or internal_error if the surface
     *         cannot be allocated
     */
    [[nodiscard]] static codec_result decode(std::span<const std::uint8_t> data,
                                             surface& surf,
                                             const decode_options& options = {});
};

// ============================================================================
// Encoders
// ============================================================================

struct truecolor_save_options {
    color_spec spec = default_rgb_spec();
    std::size_t chunk_size = 16384;
};

struct indexed_save_options {
    std::uint32_t transparent_index = 0;  // stored in the header
    std::size_t chunk_size = 16384;
};

// Handling of pixels with 0 < alpha < 255 when quantizing to a palette
enum class semi_transparent_policy {
    reject,
    transparent,
    opaque
};

struct etrle_save_options {
    // Color stored at palette index 0 when building a new palette
    rgba_color transparent_color{0, 0, 0, 0};

    semi_transparent_policy semi_transparent = semi_transparent_policy::reject;

    // Interleaved RGB triples to reuse (index 0 is transparent). Empty means
    // build a palette from the frames.
    std::vector<std::uint8_t> palette;

    // Header canvas size; 0 uses the composed size of the frames
    int canvas_width = 0;
    int canvas_height = 0;

    std::size_t chunk_size = 16384;
};

struct sti_frame {
    image_view image;    // indexed8 (against the palette), rgb888 or rgba8888
    int offset_x = 0;
    int offset_y = 0;
    std::optional<aux_object_data> aux;
};

/**
 * Encode a truecolor STI file (RGB flag) from rgb888 or rgba8888 pixels.
 * Output is appended to out only on success.
 * @return invalid_spec, field_overflow, invalid_component,
 *         unsupported_feature for indexed input
 */
[[nodiscard]] STCI_EXPORT codec_result save_sti_truecolor(const image_view& image,
                                                          std::vector<std::uint8_t>& out,
                                                          const truecolor_save_options& options = {});

/**
 * Encode an uncompressed indexed STI file (INDEXED flag, no ETRLE).
 * @param image indexed8 pixels
 * @param palette Interleaved RGB triples, padded or truncated to 256
 */
[[nodiscard]] STCI_EXPORT codec_result save_sti_indexed(const image_view& image,
                                                        std::span<const std::uint8_t> palette,
                                                        std::vector<std::uint8_t>& out,
                                                        const indexed_save_options& options = {});

/**
 * Encode one or more frames as an ETRLE STI file (INDEXED + ETRLE).
 *
 * All frames share one palette with index 0 transparent. Color frames are
 * quantized into it: alpha 0 maps to index 0, opaque colors to their own
 * entry (never 0), semi-transparent ones per options.semi_transparent.
 * If any frame has aux data, every frame gets a record (defaulting to all
 * zero) and AUX_OBJECT_DATA is set.
 * @return palette_overflow past 256 colors, invalid_component for a
 *         rejected semi-transparent pixel, unsupported_feature for no frames
 *         or indexed frames without a palette, field_overflow for sizes that
 *         do not fit the header fields
 */
[[nodiscard]] STCI_EXPORT codec_result save_sti_etrle(std::span<const sti_frame> frames,
                                                      std::vector<std::uint8_t>& out,
                                                      const etrle_save_options& options = {});

} // namespace stci

#endif // STCI_CODECS_STI_HPP_
