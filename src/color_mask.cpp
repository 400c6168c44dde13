#include <stci/color_mask.hpp>
#include "byte_io.hpp"

#include <bit>
#include <string>

namespace stci {

namespace {

struct named_spec {
    std::string_view name;
    color_spec spec;
};

// Standard packings, keyed by the rawmode names used by image toolchains
const named_spec NAMED_SPECS[] = {
    {"BGR;16",  {{0xF800, 0x07E0, 0x001F, 0x0000}, {5, 6, 5, 0}, 16}},
    {"BGR;15",  {{0x7C00, 0x03E0, 0x001F, 0x0000}, {5, 5, 5, 0}, 16}},
    {"BGRA;15", {{0x7C00, 0x03E0, 0x001F, 0x8000}, {5, 5, 5, 1}, 16}},
    {"RGBA;15", {{0x001F, 0x03E0, 0x7C00, 0x8000}, {5, 5, 5, 1}, 16}},
    {"RGB;4B",  {{0x000F, 0x00F0, 0x0F00, 0x0000}, {4, 4, 4, 0}, 16}},
    {"RGBA;4B", {{0x000F, 0x00F0, 0x0F00, 0xF000}, {4, 4, 4, 4}, 16}},

    {"BGR", {{0xFF0000, 0x00FF00, 0x0000FF, 0x000000}, {8, 8, 8, 0}, 24}},
    {"RGB", {{0x0000FF, 0x00FF00, 0xFF0000, 0x000000}, {8, 8, 8, 0}, 24}},

    {"ABGR", {{0xFF000000, 0x00FF0000, 0x0000FF00, 0x000000FF}, {8, 8, 8, 8}, 32}},
    {"XBGR", {{0xFF000000, 0x00FF0000, 0x0000FF00, 0x00000000}, {8, 8, 8, 0}, 32}},
    {"ARGB", {{0x0000FF00, 0x00FF0000, 0xFF000000, 0x000000FF}, {8, 8, 8, 8}, 32}},
    {"XRGB", {{0x0000FF00, 0x00FF0000, 0xFF000000, 0x00000000}, {8, 8, 8, 0}, 32}},
    {"BGRA", {{0x00FF0000, 0x0000FF00, 0x000000FF, 0xFF000000}, {8, 8, 8, 8}, 32}},
    {"BGRX", {{0x00FF0000, 0x0000FF00, 0x000000FF, 0x00000000}, {8, 8, 8, 0}, 32}},
    {"RGBA", {{0x000000FF, 0x0000FF00, 0x00FF0000, 0xFF000000}, {8, 8, 8, 8}, 32}},
    {"RGBX", {{0x000000FF, 0x0000FF00, 0x00FF0000, 0x00000000}, {8, 8, 8, 0}, 32}},

    {"R", {{0xFF, 0x00, 0x00, 0x00}, {8, 0, 0, 0}, 8}},
    {"G", {{0x00, 0xFF, 0x00, 0x00}, {0, 8, 0, 0}, 8}},
    {"B", {{0x00, 0x00, 0xFF, 0x00}, {0, 0, 8, 0}, 8}},
    {"A", {{0x00, 0x00, 0x00, 0xFF}, {0, 0, 0, 8}, 8}},

    {"RGBAX",  {{0x000000FF, 0x0000FF00, 0x00FF0000, 0xFF000000}, {8, 8, 8, 8}, 40}},
    {"RGBAXX", {{0x000000FF, 0x0000FF00, 0x00FF0000, 0xFF000000}, {8, 8, 8, 8}, 48}},
};

constexpr const char* CHANNEL_NAMES[] = {"red", "green", "blue", "alpha"};

std::uint8_t expand_channel(std::uint64_t raw, std::uint32_t mask, unsigned bits) noexcept {
    if (mask == 0 || bits == 0) {
        return 0;
    }

    const std::uint64_t value = raw & mask;
    if (value == mask) {
        return 255;  // saturated channel is always pure white/opaque
    }

    const auto width = static_cast<unsigned>(std::bit_width(mask));
    if (bits > 8) {
        // Keep the top 8 bits
        return static_cast<std::uint8_t>((value >> (width - 8)) & 0xFF);
    }
    if (bits > width) {
        bits = width;
    }

    const unsigned shift = width - bits;
    const std::uint64_t max_value = (std::uint64_t{1} << bits) - 1;
    return static_cast<std::uint8_t>(((value >> shift) * 255) / max_value);
}

std::uint64_t quantize_channel(int component, std::uint32_t mask) noexcept {
    if (component == 0 || mask == 0) {
        return 0;
    }

    const int shift = static_cast<int>(std::bit_width(mask)) - 8;
    const auto c = static_cast<std::uint64_t>(component);
    if (shift > 0) {
        return (c << shift) & mask;
    }
    if (shift < 0) {
        return (c >> -shift) & mask;
    }
    return c & mask;
}

} // namespace

const color_spec& default_rgb_spec() noexcept {
    return NAMED_SPECS[0].spec;
}

const color_spec* find_named_spec(std::string_view name) noexcept {
    for (const auto& entry : NAMED_SPECS) {
        if (entry.name == name) {
            return &entry.spec;
        }
    }
    return nullptr;
}

std::string_view spec_name(const color_spec& spec) noexcept {
    for (const auto& entry : NAMED_SPECS) {
        if (entry.spec == spec) {
            return entry.name;
        }
    }
    return {};
}

codec_result validate_spec(const color_spec& spec) {
    const unsigned total = spec.color_depth;
    if (total == 0 || total % 8 != 0 || total > 64) {
        return codec_result::failure(codec_error::invalid_spec,
            "Color depth must be a positive multiple of 8 up to 64, got " + std::to_string(total));
    }

    unsigned depth_sum = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        const std::uint32_t mask = spec.masks[i];
        const unsigned depth = spec.depths[i];
        depth_sum += depth;

        if (depth == 0 && mask == 0) {
            continue;
        }

        const auto width = static_cast<unsigned>(std::bit_width(mask));
        if (depth == 0 || depth > 32 || width < depth) {
            return codec_result::failure(codec_error::invalid_spec,
                std::string("Mask/depth mismatch for ") + CHANNEL_NAMES[i] + " channel");
        }

        const std::uint64_t expected = ((std::uint64_t{1} << depth) - 1) << (width - depth);
        if (mask != expected) {
            return codec_result::failure(codec_error::invalid_spec,
                std::string("Mask bits of ") + CHANNEL_NAMES[i] +
                " channel are not a contiguous run of " + std::to_string(depth));
        }

        if (width > total) {
            return codec_result::failure(codec_error::invalid_spec,
                std::string("Mask of ") + CHANNEL_NAMES[i] + " channel exceeds the color depth");
        }
    }

    if (depth_sum > total) {
        return codec_result::failure(codec_error::invalid_spec,
            "Channel depths sum to " + std::to_string(depth_sum) +
            ", more than the color depth " + std::to_string(total));
    }

    return codec_result::success();
}

rgba_color unpack_color(std::uint64_t raw, const color_spec& spec) noexcept {
    return {
        expand_channel(raw, spec.masks[0], spec.depths[0]),
        expand_channel(raw, spec.masks[1], spec.depths[1]),
        expand_channel(raw, spec.masks[2], spec.depths[2]),
        expand_channel(raw, spec.masks[3], spec.depths[3]),
    };
}

codec_result pack_color(int r, int g, int b, int a,
                        const color_spec& spec,
                        std::uint64_t& raw) {
    const int components[4] = {r, g, b, a};

    std::uint64_t color = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        if (components[i] < 0 || components[i] > 255) {
            return codec_result::failure(codec_error::invalid_component,
                std::string("Component ") + CHANNEL_NAMES[i] + " out of range: " +
                std::to_string(components[i]));
        }
        color |= quantize_channel(components[i], spec.masks[i]);
    }

    raw = color;
    return codec_result::success();
}

std::uint64_t read_packed_pixel(const std::uint8_t* p, std::size_t pixel_bytes) noexcept {
    switch (pixel_bytes) {
        case 0:
            return 0;
        case 1:
            return p[0];
        case 2:
            return read_le16(p);
        case 3:
            return static_cast<std::uint64_t>(read_le16(p)) |
                   (static_cast<std::uint64_t>(p[2]) << 16);
        default:
            // Extra bytes past the 32-bit word are ignored
            return read_le32(p);
    }
}

void write_packed_pixel(std::uint64_t raw, std::size_t pixel_bytes, std::vector<std::uint8_t>& out) {
    switch (pixel_bytes) {
        case 0:
            break;
        case 1:
            out.push_back(static_cast<std::uint8_t>(raw & 0xFF));
            break;
        case 2:
            write_le16(out, static_cast<std::uint16_t>(raw & 0xFFFF));
            break;
        case 3:
            write_le16(out, static_cast<std::uint16_t>(raw & 0xFFFF));
            out.push_back(static_cast<std::uint8_t>((raw >> 16) & 0xFF));
            break;
        default:
            write_le32(out, static_cast<std::uint32_t>(raw & 0xFFFFFFFF));
            out.insert(out.end(), pixel_bytes - 4, 0);
            break;
    }
}

} // namespace stci
