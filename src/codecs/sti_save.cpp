#include <stci/codecs/sti.hpp>
#include <stci/streaming.hpp>
#include "decode_helpers.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>

namespace stci {

namespace {

using field_values = std::initializer_list<std::pair<std::string_view, std::uint64_t>>;

codec_result with_context(codec_result result, const std::string& context) {
    result.message = context + ": " + result.message;
    return result;
}

codec_result encode_record(const header_layout& layout,
                           field_values values,
                           std::vector<std::uint8_t>& out) {
    header_fields fields(layout);
    auto result = assign_fields(fields, values);
    if (!result) {
        return result;
    }
    return encode_header(fields, out);
}

codec_result encode_sti_header(field_values values,
                               std::span<const std::uint8_t> format_header,
                               const std::vector<std::string_view>& flags,
                               std::vector<std::uint8_t>& out) {
    header_fields fields(sti_header_layout());
    auto result = fields.set_bytes("file_identifier", STI_MAGIC);
    if (!result) {
        return result;
    }
    result = fields.set_bytes("format_specific_header", format_header);
    if (!result) {
        return result;
    }
    result = assign_fields(fields, values);
    if (!result) {
        return result;
    }
    for (const auto flag : flags) {
        result = fields.set_flag(flag, true);
        if (!result) {
            return result;
        }
    }
    return encode_header(fields, out);
}

codec_result encode_indexed_format_header(std::size_t number_of_images, std::vector<std::uint8_t>& out) {
    return encode_record(sti_indexed_header_layout(), {
        {"number_of_palette_colors", STI_PALETTE_COLORS},
        {"number_of_images", number_of_images},
        {"red_color_depth", 8},
        {"green_color_depth", 8},
        {"blue_color_depth", 8},
    }, out);
}

codec_result check_pixels(const image_view& image) {
    if (image.width < 0 || image.height < 0) {
        return codec_result::failure(codec_error::field_overflow,
            "Negative image dimensions " + std::to_string(image.width) + "x" +
            std::to_string(image.height));
    }
    if (image.pixels.size() < image.byte_size()) {
        return codec_result::failure(codec_error::truncated_input,
            "Pixel data has " + std::to_string(image.pixels.size()) + " bytes, " +
            std::to_string(image.width) + "x" + std::to_string(image.height) + " image needs " +
            std::to_string(image.byte_size()));
    }
    return codec_result::success();
}

// Shared palette for ETRLE frames; index 0 is the transparent color
class palette_builder {
public:
    explicit palette_builder(const etrle_save_options& options) {
        if (options.palette.size() < 3) {
            const auto& c = options.transparent_color;
            colors_ = {c.r, c.g, c.b};
            return;
        }

        const std::size_t count = std::min(options.palette.size() / 3, STI_PALETTE_COLORS);
        colors_.assign(options.palette.begin(),
                       options.palette.begin() + static_cast<std::ptrdiff_t>(count * 3));
        for (std::size_t i = 1; i < count; ++i) {
            lookup_.emplace(key(colors_[i * 3], colors_[i * 3 + 1], colors_[i * 3 + 2]),
                            static_cast<std::uint8_t>(i));
        }
    }

    // Index of an opaque color, adding it if needed. Never 0.
    codec_result index_of(std::uint8_t r, std::uint8_t g, std::uint8_t b, std::uint8_t& index) {
        const auto k = key(r, g, b);
        auto it = lookup_.find(k);
        if (it != lookup_.end()) {
            index = it->second;
            return codec_result::success();
        }

        const std::size_t count = colors_.size() / 3;
        if (count >= STI_PALETTE_COLORS) {
            return codec_result::failure(codec_error::palette_overflow,
                "More than " + std::to_string(STI_PALETTE_COLORS) + " palette colors needed");
        }

        colors_.push_back(r);
        colors_.push_back(g);
        colors_.push_back(b);
        index = static_cast<std::uint8_t>(count);
        lookup_.emplace(k, index);
        return codec_result::success();
    }

    [[nodiscard]] std::span<const std::uint8_t> colors() const noexcept { return colors_; }

private:
    static std::uint32_t key(std::uint8_t r, std::uint8_t g, std::uint8_t b) noexcept {
        return (static_cast<std::uint32_t>(r) << 16) | (static_cast<std::uint32_t>(g) << 8) | b;
    }

    std::vector<std::uint8_t> colors_;
    std::unordered_map<std::uint32_t, std::uint8_t> lookup_;
};

codec_result quantize_frame(const image_view& image,
                            semi_transparent_policy policy,
                            palette_builder& palette,
                            std::vector<std::uint8_t>& indices) {
    const std::size_t bpp = bytes_per_pixel(image.format);
    const bool has_alpha = image.format == pixel_format::rgba8888;

    indices.clear();
    indices.reserve(static_cast<std::size_t>(image.width) * static_cast<std::size_t>(image.height));
    for (int y = 0; y < image.height; ++y) {
        const auto* row = image.pixels.data() + static_cast<std::size_t>(y) * image.pitch();
        for (int x = 0; x < image.width; ++x) {
            const auto* p = row + static_cast<std::size_t>(x) * bpp;
            std::uint8_t alpha = has_alpha ? p[3] : 255;
            if (alpha != 0 && alpha != 255) {
                switch (policy) {
                    case semi_transparent_policy::transparent:
                        alpha = 0;
                        break;
                    case semi_transparent_policy::opaque:
                        alpha = 255;
                        break;
                    case semi_transparent_policy::reject:
                        return codec_result::failure(codec_error::invalid_component,
                            "Semi-transparent pixel at (" + std::to_string(x) + ", " +
                            std::to_string(y) + ") with alpha " + std::to_string(alpha));
                }
            }

            std::uint8_t index = 0;
            if (alpha != 0) {
                auto result = palette.index_of(p[0], p[1], p[2], index);
                if (!result) {
                    return result;
                }
            }
            indices.push_back(index);
        }
    }
    return codec_result::success();
}

} // namespace

// ============================================================================
// Truecolor
// ============================================================================

codec_result save_sti_truecolor(const image_view& image,
                                std::vector<std::uint8_t>& out,
                                const truecolor_save_options& options) {
    const auto& spec = options.spec;
    auto result = validate_spec(spec);
    if (!result) {
        return result;
    }
    if (image.format == pixel_format::indexed8) {
        return codec_result::failure(codec_error::unsupported_feature,
            "Truecolor STI requires rgb888 or rgba8888 pixels");
    }
    result = check_pixels(image);
    if (!result) {
        return result;
    }

    const std::uint64_t data_size = static_cast<std::uint64_t>(image.width) *
                                    static_cast<std::uint64_t>(image.height) * spec.pixel_bytes();

    std::vector<std::uint8_t> format_header;
    result = encode_record(sti_truecolor_header_layout(), {
        {"red_color_mask", spec.masks[0]},
        {"green_color_mask", spec.masks[1]},
        {"blue_color_mask", spec.masks[2]},
        {"alpha_channel_mask", spec.masks[3]},
        {"red_color_depth", spec.depths[0]},
        {"green_color_depth", spec.depths[1]},
        {"blue_color_depth", spec.depths[2]},
        {"alpha_channel_depth", spec.depths[3]},
    }, format_header);
    if (!result) {
        return result;
    }

    std::vector<std::uint8_t> encoded;
    result = encode_sti_header({
        {"initial_size", data_size},
        {"size_after_compression", data_size},
        {"transparent_color", 0},
        {"width", static_cast<std::uint64_t>(image.width)},
        {"height", static_cast<std::uint64_t>(image.height)},
        {"color_depth", spec.color_depth},
        {"aux_data_size", 0},
    }, format_header, {"RGB"}, encoded);
    if (!result) {
        return result;
    }

    color_stream_encoder encoder(image, spec);
    result = run_encoder(encoder, encoded, options.chunk_size);
    if (!result) {
        return result;
    }

    out.insert(out.end(), encoded.begin(), encoded.end());
    return codec_result::success();
}

// ============================================================================
// Raw Indexed
// ============================================================================

codec_result save_sti_indexed(const image_view& image,
                              std::span<const std::uint8_t> palette,
                              std::vector<std::uint8_t>& out,
                              const indexed_save_options& options) {
    if (image.format != pixel_format::indexed8) {
        return codec_result::failure(codec_error::unsupported_feature,
            "Indexed STI requires indexed8 pixels");
    }
    auto result = check_pixels(image);
    if (!result) {
        return result;
    }

    const std::uint64_t data_size = static_cast<std::uint64_t>(image.width) *
                                    static_cast<std::uint64_t>(image.height);

    std::vector<std::uint8_t> format_header;
    result = encode_indexed_format_header(0, format_header);
    if (!result) {
        return result;
    }

    std::vector<std::uint8_t> encoded;
    result = encode_sti_header({
        {"initial_size", data_size},
        {"size_after_compression", data_size},
        {"transparent_color", options.transparent_index},
        {"width", static_cast<std::uint64_t>(image.width)},
        {"height", static_cast<std::uint64_t>(image.height)},
        {"color_depth", 8},
        {"aux_data_size", 0},
    }, format_header, {"INDEXED"}, encoded);
    if (!result) {
        return result;
    }

    palette_to_planes(palette, encoded);

    index_stream_encoder encoder(image);
    result = run_encoder(encoder, encoded, options.chunk_size);
    if (!result) {
        return result;
    }

    out.insert(out.end(), encoded.begin(), encoded.end());
    return codec_result::success();
}

// ============================================================================
// ETRLE
// ============================================================================

codec_result save_sti_etrle(std::span<const sti_frame> frames,
                            std::vector<std::uint8_t>& out,
                            const etrle_save_options& options) {
    if (frames.empty()) {
        return codec_result::failure(codec_error::unsupported_feature,
            "ETRLE images need at least one frame");
    }

    // Map every frame onto the shared palette
    palette_builder palette(options);
    std::vector<std::vector<std::uint8_t>> indexed(frames.size());
    std::uint64_t initial_size = 0;
    bool has_aux = false;

    for (std::size_t i = 0; i < frames.size(); ++i) {
        const std::string context = "Frame " + std::to_string(i);
        const auto& image = frames[i].image;

        auto result = check_pixels(image);
        if (!result) {
            return with_context(std::move(result), context);
        }

        if (image.format == pixel_format::indexed8) {
            if (options.palette.size() < 3) {
                return codec_result::failure(codec_error::unsupported_feature,
                    context + ": indexed frames need a palette");
            }
            indexed[i].assign(image.pixels.begin(),
                              image.pixels.begin() + static_cast<std::ptrdiff_t>(image.byte_size()));
        } else {
            result = quantize_frame(image, options.semi_transparent, palette, indexed[i]);
            if (!result) {
                return with_context(std::move(result), context);
            }
        }

        initial_size += indexed[i].size();
        has_aux = has_aux || frames[i].aux.has_value();
    }

    // Compress each frame and describe it
    std::vector<std::uint8_t> subimage_headers;
    std::vector<std::uint8_t> compressed;
    std::vector<image_rect> boxes;

    for (std::size_t i = 0; i < frames.size(); ++i) {
        const std::string context = "Frame " + std::to_string(i);
        const auto& frame = frames[i];
        const std::size_t offset = compressed.size();

        const image_view view{frame.image.width, frame.image.height, pixel_format::indexed8, indexed[i]};
        etrle_stream_encoder encoder(view);
        auto result = run_encoder(encoder, compressed, options.chunk_size);
        if (!result) {
            return with_context(std::move(result), context);
        }

        result = encode_record(sti_subimage_header_layout(), {
            {"offset", offset},
            {"length", compressed.size() - offset},
            {"offset_x", static_cast<std::uint64_t>(frame.offset_x)},
            {"offset_y", static_cast<std::uint64_t>(frame.offset_y)},
            {"height", static_cast<std::uint64_t>(view.height)},
            {"width", static_cast<std::uint64_t>(view.width)},
        }, subimage_headers);
        if (!result) {
            return with_context(std::move(result), context);
        }

        boxes.push_back({0, 0, view.width, view.height});
    }

    std::vector<std::uint8_t> aux_records;
    if (has_aux) {
        for (std::size_t i = 0; i < frames.size(); ++i) {
            auto result = write_aux_object_data(frames[i].aux.value_or(aux_object_data{}), aux_records);
            if (!result) {
                return with_context(std::move(result), "Frame " + std::to_string(i));
            }
        }
    }

    auto [canvas_width, canvas_height] = layout_frames(boxes);
    if (options.canvas_width > 0) {
        canvas_width = options.canvas_width;
    }
    if (options.canvas_height > 0) {
        canvas_height = options.canvas_height;
    }

    std::vector<std::uint8_t> format_header;
    auto result = encode_indexed_format_header(frames.size(), format_header);
    if (!result) {
        return result;
    }

    std::vector<std::string_view> flags = {"INDEXED", "ETRLE"};
    if (has_aux) {
        flags.push_back("AUX_OBJECT_DATA");
    }

    std::vector<std::uint8_t> encoded;
    result = encode_sti_header({
        {"initial_size", initial_size},
        {"size_after_compression", compressed.size()},
        {"transparent_color", 0},
        {"width", static_cast<std::uint64_t>(canvas_width)},
        {"height", static_cast<std::uint64_t>(canvas_height)},
        {"color_depth", 8},
        {"aux_data_size", aux_records.size()},
    }, format_header, flags, encoded);
    if (!result) {
        return result;
    }

    palette_to_planes(palette.colors(), encoded);
    encoded.insert(encoded.end(), subimage_headers.begin(), subimage_headers.end());
    encoded.insert(encoded.end(), compressed.begin(), compressed.end());
    encoded.insert(encoded.end(), aux_records.begin(), aux_records.end());

    out.insert(out.end(), encoded.begin(), encoded.end());
    return codec_result::success();
}

} // namespace stci
