#include <stci/codecs/sti.hpp>
#include "decode_helpers.hpp"
#include "byte_io.hpp"

#include <algorithm>
#include <string>

namespace stci {

namespace {

constexpr std::size_t FLAGS_OFFSET = 16;

} // namespace

// ============================================================================
// Record Layouts
// ============================================================================

const header_layout& sti_header_layout() {
    static const header_layout layout(
        "StiHeader",
        {
            {"file_identifier", field_type::bytes, 4},
            {"initial_size", field_type::integer, 4},
            {"size_after_compression", field_type::integer, 4},
            {"transparent_color", field_type::integer, 4},
            {"flags", field_type::integer, 4},
            {"height", field_type::integer, 2},
            {"width", field_type::integer, 2},
            {"format_specific_header", field_type::bytes, STI_FORMAT_HEADER_SIZE},
            {"color_depth", field_type::integer, 1},
            {"", field_type::padding, 3},
            {"aux_data_size", field_type::integer, 4},
            {"", field_type::padding, 12},
        },
        "flags",
        {
            {"AUX_OBJECT_DATA", static_cast<unsigned>(sti_flag::aux_object_data)},
            {"RGB", static_cast<unsigned>(sti_flag::rgb)},
            {"INDEXED", static_cast<unsigned>(sti_flag::indexed)},
            {"ZLIB", static_cast<unsigned>(sti_flag::zlib)},
            {"ETRLE", static_cast<unsigned>(sti_flag::etrle)},
        });
    return layout;
}

const header_layout& sti_truecolor_header_layout() {
    static const header_layout layout(
        "Sti16BitHeader",
        {
            {"red_color_mask", field_type::integer, 4},
            {"green_color_mask", field_type::integer, 4},
            {"blue_color_mask", field_type::integer, 4},
            {"alpha_channel_mask", field_type::integer, 4},
            {"red_color_depth", field_type::integer, 1},
            {"green_color_depth", field_type::integer, 1},
            {"blue_color_depth", field_type::integer, 1},
            {"alpha_channel_depth", field_type::integer, 1},
        });
    return layout;
}

const header_layout& sti_indexed_header_layout() {
    static const header_layout layout(
        "Sti8BitHeader",
        {
            {"number_of_palette_colors", field_type::integer, 4},
            {"number_of_images", field_type::integer, 2},
            {"red_color_depth", field_type::integer, 1},
            {"green_color_depth", field_type::integer, 1},
            {"blue_color_depth", field_type::integer, 1},
            {"", field_type::padding, 11},
        });
    return layout;
}

const header_layout& sti_subimage_header_layout() {
    static const header_layout layout(
        "StiSubImageHeader",
        {
            {"offset", field_type::integer, 4},
            {"length", field_type::integer, 4},
            {"offset_x", field_type::integer, 2},
            {"offset_y", field_type::integer, 2},
            {"height", field_type::integer, 2},
            {"width", field_type::integer, 2},
        });
    return layout;
}

const header_layout& aux_object_data_layout() {
    static const header_layout layout(
        "AuxObjectData",
        {
            {"wall_orientation", field_type::integer, 1},
            {"number_of_tiles", field_type::integer, 1},
            {"tile_location_index", field_type::integer, 2},
            {"", field_type::padding, 3},
            {"current_frame", field_type::integer, 1},
            {"number_of_frames", field_type::integer, 1},
            {"flags", field_type::integer, 1},
            {"", field_type::padding, 6},
        },
        "flags",
        {
            {"FULL_TILE", static_cast<unsigned>(tile_flag::full_tile)},
            {"ANIMATED_TILE", static_cast<unsigned>(tile_flag::animated_tile)},
            {"DYNAMIC_TILE", static_cast<unsigned>(tile_flag::dynamic_tile)},
            {"INTERACTIVE_TILE", static_cast<unsigned>(tile_flag::interactive_tile)},
            {"IGNORES_HEIGHT", static_cast<unsigned>(tile_flag::ignores_height)},
            {"USES_LAND_Z", static_cast<unsigned>(tile_flag::uses_land_z)},
        });
    return layout;
}

// ============================================================================
// Typed Records
// ============================================================================

codec_result read_sti_header(std::span<const std::uint8_t> data, sti_header& header) {
    header_fields fields(sti_header_layout());
    auto result = decode_header(sti_header_layout(), data, fields);
    if (!result) {
        return result;
    }

    sti_header h;
    const auto identifier = fields.get_bytes("file_identifier");
    std::copy_n(identifier.begin(), h.identifier.size(), h.identifier.begin());
    h.initial_size = static_cast<std::uint32_t>(fields.get("initial_size"));
    h.size_after_compression = static_cast<std::uint32_t>(fields.get("size_after_compression"));
    h.transparent_color = static_cast<std::uint32_t>(fields.get("transparent_color"));
    h.flags = static_cast<std::uint32_t>(fields.get("flags"));
    h.height = static_cast<std::uint16_t>(fields.get("height"));
    h.width = static_cast<std::uint16_t>(fields.get("width"));
    const auto format_header = fields.get_bytes("format_specific_header");
    std::copy_n(format_header.begin(), h.format_header.size(), h.format_header.begin());
    h.color_depth = static_cast<std::uint8_t>(fields.get("color_depth"));
    h.aux_data_size = static_cast<std::uint32_t>(fields.get("aux_data_size"));

    header = h;
    return codec_result::success();
}

codec_result read_subimage_header(std::span<const std::uint8_t> data, sti_subimage_header& header) {
    header_fields fields(sti_subimage_header_layout());
    auto result = decode_header(sti_subimage_header_layout(), data, fields);
    if (!result) {
        return result;
    }

    header.offset = static_cast<std::uint32_t>(fields.get("offset"));
    header.length = static_cast<std::uint32_t>(fields.get("length"));
    header.offset_x = static_cast<std::uint16_t>(fields.get("offset_x"));
    header.offset_y = static_cast<std::uint16_t>(fields.get("offset_y"));
    header.height = static_cast<std::uint16_t>(fields.get("height"));
    header.width = static_cast<std::uint16_t>(fields.get("width"));
    return codec_result::success();
}

codec_result read_aux_object_data(std::span<const std::uint8_t> data, aux_object_data& aux) {
    header_fields fields(aux_object_data_layout());
    auto result = decode_header(aux_object_data_layout(), data, fields);
    if (!result) {
        return result;
    }

    aux.wall_orientation = static_cast<std::uint8_t>(fields.get("wall_orientation"));
    aux.number_of_tiles = static_cast<std::uint8_t>(fields.get("number_of_tiles"));
    aux.tile_location_index = static_cast<std::uint16_t>(fields.get("tile_location_index"));
    aux.current_frame = static_cast<std::uint8_t>(fields.get("current_frame"));
    aux.number_of_frames = static_cast<std::uint8_t>(fields.get("number_of_frames"));
    aux.flags = static_cast<std::uint8_t>(fields.get("flags"));
    return codec_result::success();
}

codec_result write_aux_object_data(const aux_object_data& aux, std::vector<std::uint8_t>& out) {
    header_fields fields(aux_object_data_layout());
    auto result = assign_fields(fields, {
        {"wall_orientation", aux.wall_orientation},
        {"number_of_tiles", aux.number_of_tiles},
        {"tile_location_index", aux.tile_location_index},
        {"current_frame", aux.current_frame},
        {"number_of_frames", aux.number_of_frames},
    });
    if (!result) {
        return result;
    }

    for (const auto& flag : aux_object_data_layout().flags()) {
        result = fields.set_flag(flag.name, aux.has(static_cast<tile_flag>(flag.bit)));
        if (!result) {
            return result;
        }
    }

    return encode_header(fields, out);
}

// ============================================================================
// Palette
// ============================================================================

void palette_from_planes(std::span<const std::uint8_t, STI_PALETTE_SIZE> planes,
                         sti_palette& palette) noexcept {
    for (std::size_t i = 0; i < STI_PALETTE_COLORS; ++i) {
        palette[i * 3 + 0] = planes[i];
        palette[i * 3 + 1] = planes[STI_PALETTE_COLORS + i];
        palette[i * 3 + 2] = planes[2 * STI_PALETTE_COLORS + i];
    }
}

void palette_to_planes(std::span<const std::uint8_t> palette, std::vector<std::uint8_t>& out) {
    const std::size_t colors = std::min(palette.size() / 3, STI_PALETTE_COLORS);
    const std::size_t start = out.size();
    out.resize(start + STI_PALETTE_SIZE, 0);
    for (std::size_t c = 0; c < 3; ++c) {
        auto* plane = out.data() + start + c * STI_PALETTE_COLORS;
        for (std::size_t i = 0; i < colors; ++i) {
            plane[i] = palette[i * 3 + c];
        }
    }
}

// ============================================================================
// Probes
// ============================================================================

codec_result validate_flags(std::uint32_t flags) {
    const bool rgb = (flags & flag_mask(sti_flag::rgb)) != 0;
    const bool indexed = (flags & flag_mask(sti_flag::indexed)) != 0;
    if (rgb && indexed) {
        return codec_result::failure(codec_error::format_mismatch,
            "RGB and INDEXED flags are both set");
    }
    if (!rgb && !indexed) {
        return codec_result::failure(codec_error::format_mismatch,
            "Neither RGB nor INDEXED flag is set");
    }
    if (flags & flag_mask(sti_flag::zlib)) {
        return codec_result::failure(codec_error::unsupported_feature,
            "ZLIB compression is not supported");
    }
    return codec_result::success();
}

bool sti_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < STI_HEADER_SIZE) {
        return false;
    }
    return std::equal(STI_MAGIC.begin(), STI_MAGIC.end(), data.begin());
}

bool is_truecolor_sti(std::span<const std::uint8_t> data) noexcept {
    if (!sti_decoder::sniff(data)) {
        return false;
    }
    const std::uint32_t flags = read_le32(data.data() + FLAGS_OFFSET);
    return (flags & flag_mask(sti_flag::rgb)) && !(flags & flag_mask(sti_flag::indexed));
}

bool is_indexed_sti(std::span<const std::uint8_t> data) noexcept {
    if (!sti_decoder::sniff(data)) {
        return false;
    }
    const std::uint32_t flags = read_le32(data.data() + FLAGS_OFFSET);
    return (flags & flag_mask(sti_flag::indexed)) && !(flags & flag_mask(sti_flag::rgb));
}

} // namespace stci
