#include <stci/codecs/sti.hpp>
#include <stci/streaming.hpp>
#include "decode_helpers.hpp"

#include <algorithm>
#include <string>

namespace stci {

namespace {

codec_result with_context(codec_result result, const std::string& context) {
    result.message = context + ": " + result.message;
    return result;
}

codec_result load_truecolor(std::span<const std::uint8_t> body,
                            sti_image& image,
                            const decode_options& options) {
    const auto& h = image.header;
    if (h.has(sti_flag::aux_object_data)) {
        return codec_result::failure(codec_error::unsupported_feature,
            "Aux object data in RGB images is not supported");
    }

    header_fields fields(sti_truecolor_header_layout());
    auto result = decode_header(sti_truecolor_header_layout(), h.format_header, fields);
    if (!result) {
        return result;
    }

    color_spec spec;
    spec.masks = {
        static_cast<std::uint32_t>(fields.get("red_color_mask")),
        static_cast<std::uint32_t>(fields.get("green_color_mask")),
        static_cast<std::uint32_t>(fields.get("blue_color_mask")),
        static_cast<std::uint32_t>(fields.get("alpha_channel_mask")),
    };
    spec.depths = {
        static_cast<std::uint8_t>(fields.get("red_color_depth")),
        static_cast<std::uint8_t>(fields.get("green_color_depth")),
        static_cast<std::uint8_t>(fields.get("blue_color_depth")),
        static_cast<std::uint8_t>(fields.get("alpha_channel_depth")),
    };
    spec.color_depth = h.color_depth;

    result = validate_spec(spec);
    if (!result) {
        return result;
    }

    image.kind = sti_kind::truecolor;
    image.spec = spec;
    image.format = spec.has_alpha() ? pixel_format::rgba8888 : pixel_format::rgb888;

    color_stream_decoder decoder(spec, image.width, image.height, image.format);
    result = run_decoder(decoder, body, options.stream_chunk_size);
    if (!result) {
        return with_context(std::move(result), "RGB pixel data");
    }
    image.pixels = decoder.take_pixels();
    return codec_result::success();
}

codec_result load_raw_indexes(std::span<const std::uint8_t> body,
                              sti_image& image,
                              const decode_options& options) {
    if (image.header.has(sti_flag::aux_object_data)) {
        return codec_result::failure(codec_error::unsupported_feature,
            "Aux object data in INDEXED images without ETRLE is not supported");
    }

    image.kind = sti_kind::indexed;

    index_stream_decoder decoder(image.width, image.height);
    auto result = run_decoder(decoder, body, options.stream_chunk_size);
    if (!result) {
        return with_context(std::move(result), "Index data");
    }
    image.pixels = decoder.take_pixels();
    return codec_result::success();
}

void compose_canvas(sti_image& image) {
    image.boxes.clear();
    for (const auto& sub : image.subimages) {
        image.boxes.push_back({0, 0, sub.width, sub.height});
    }

    const auto [width, height] = layout_frames(image.boxes);
    image.canvas_overridden = width != image.width || height != image.height;
    image.width = width;
    image.height = height;
}

codec_result load_etrle(std::span<const std::uint8_t> body,
                        std::size_t count,
                        sti_image& image,
                        const decode_options& options) {
    const auto& h = image.header;
    if (count == 0) {
        return codec_result::failure(codec_error::unsupported_feature,
            "ETRLE images without sub-images are not supported");
    }

    const std::size_t headers_size = count * STI_SUBIMAGE_HEADER_SIZE;
    if (body.size() < headers_size) {
        return codec_result::failure(codec_error::truncated_input,
            "Sub-image headers need " + std::to_string(headers_size) + " bytes, got " +
            std::to_string(body.size()));
    }
    const auto block = body.subspan(headers_size);

    image.kind = sti_kind::etrle;
    image.subimages.resize(count);

    for (std::size_t i = 0; i < count; ++i) {
        const std::string context = "Sub-image " + std::to_string(i);

        sti_subimage_header sh;
        auto result = read_subimage_header(body.subspan(i * STI_SUBIMAGE_HEADER_SIZE), sh);
        if (!result) {
            return with_context(std::move(result), context);
        }

        result = validate_dimensions(sh.width, sh.height, options);
        if (!result) {
            return with_context(std::move(result), context);
        }

        const std::size_t offset = sh.offset;
        const std::size_t length = sh.length;
        if (offset > block.size() || length > block.size() - offset) {
            return codec_result::failure(codec_error::truncated_input,
                context + ": data at offset " + std::to_string(offset) + " with length " +
                std::to_string(length) + " exceeds the " + std::to_string(block.size()) +
                " byte compressed block");
        }

        etrle_stream_decoder decoder(sh.width, sh.height, length);
        result = run_decoder(decoder, block.subspan(offset, length), options.stream_chunk_size);
        if (!result) {
            return with_context(std::move(result), context);
        }

        auto& sub = image.subimages[i];
        sub.offset_x = sh.offset_x;
        sub.offset_y = sh.offset_y;
        sub.width = sh.width;
        sub.height = sh.height;
        sub.pixels = decoder.take_pixels();
    }

    if (h.has(sti_flag::aux_object_data)) {
        // Records follow the compressed data block
        const std::size_t aux_start = h.size_after_compression;
        const std::size_t aux_size = count * STI_AUX_DATA_SIZE;
        if (aux_start > block.size() || aux_size > block.size() - aux_start) {
            return codec_result::failure(codec_error::truncated_input,
                "Aux object data needs " + std::to_string(aux_size) + " bytes at offset " +
                std::to_string(aux_start) + " of the compressed block");
        }
        for (std::size_t i = 0; i < count; ++i) {
            aux_object_data aux;
            auto result = read_aux_object_data(block.subspan(aux_start + i * STI_AUX_DATA_SIZE), aux);
            if (!result) {
                return with_context(std::move(result), "Aux object data " + std::to_string(i));
            }
            image.subimages[i].aux = aux;
        }
    }

    compose_canvas(image);
    return validate_dimensions(image.width, image.height, options);
}

codec_result load_indexed(std::span<const std::uint8_t> body,
                          sti_image& image,
                          const decode_options& options) {
    const auto& h = image.header;

    header_fields fields(sti_indexed_header_layout());
    auto result = decode_header(sti_indexed_header_layout(), h.format_header, fields);
    if (!result) {
        return result;
    }

    const auto colors = fields.get("number_of_palette_colors");
    if (colors != STI_PALETTE_COLORS) {
        return codec_result::failure(codec_error::unsupported_feature,
            "Palettes with " + std::to_string(colors) + " colors are not supported");
    }
    for (const char* depth : {"red_color_depth", "green_color_depth", "blue_color_depth"}) {
        if (fields.get(depth) != 8) {
            return codec_result::failure(codec_error::unsupported_feature,
                std::string("Palette ") + depth + " " + std::to_string(fields.get(depth)) +
                " is not supported");
        }
    }

    if (body.size() < STI_PALETTE_SIZE) {
        return codec_result::failure(codec_error::truncated_input,
            "Palette needs " + std::to_string(STI_PALETTE_SIZE) + " bytes, got " +
            std::to_string(body.size()));
    }
    palette_from_planes(body.first<STI_PALETTE_SIZE>(), image.palette);

    image.format = pixel_format::indexed8;
    image.transparent_index = h.transparent_color;

    const auto rest = body.subspan(STI_PALETTE_SIZE);
    if (!h.has(sti_flag::etrle)) {
        return load_raw_indexes(rest, image, options);
    }
    return load_etrle(rest, static_cast<std::size_t>(fields.get("number_of_images")), image, options);
}

} // namespace

// ============================================================================
// Loader
// ============================================================================

codec_result load_sti(std::span<const std::uint8_t> data,
                      sti_image& image,
                      const decode_options& options) {
    sti_image loaded;
    auto result = read_sti_header(data, loaded.header);
    if (!result) {
        return result;
    }

    const auto& h = loaded.header;
    if (h.identifier != STI_MAGIC) {
        return codec_result::failure(codec_error::format_mismatch, "Not an STCI file");
    }

    result = validate_flags(h.flags);
    if (!result) {
        return result;
    }

    result = validate_dimensions(h.width, h.height, options);
    if (!result) {
        return result;
    }

    loaded.width = h.width;
    loaded.height = h.height;

    const auto body = data.subspan(STI_HEADER_SIZE);
    if (h.has(sti_flag::rgb)) {
        result = load_truecolor(body, loaded, options);
    } else {
        result = load_indexed(body, loaded, options);
    }
    if (!result) {
        return result;
    }

    image = std::move(loaded);
    return codec_result::success();
}

// ============================================================================
// Surface Decoder
// ============================================================================

codec_result sti_decoder::decode(std::span<const std::uint8_t> data,
                                 surface& surf,
                                 const decode_options& options) {
    sti_image image;
    auto result = load_sti(data, image, options);
    if (!result) {
        return result;
    }

    if (!surf.set_size(image.width, image.height, image.format)) {
        return codec_result::failure(codec_error::internal_error,
            "Failed to allocate " + std::to_string(image.width) + "x" +
            std::to_string(image.height) + " surface");
    }

    if (image.kind == sti_kind::truecolor) {
        write_rows(surf, image.pixels.data(), image.view().pitch(), image.height);
        return codec_result::success();
    }

    surf.set_palette_size(static_cast<int>(STI_PALETTE_COLORS));
    surf.write_palette(0, image.palette);

    const bool has_transparent = image.transparent_index < STI_PALETTE_COLORS;
    surf.set_transparent_index(has_transparent ? static_cast<int>(image.transparent_index) : -1);

    if (image.kind == sti_kind::indexed) {
        write_rows(surf, image.pixels.data(), image.view().pitch(), image.height);
        return codec_result::success();
    }

    // Background between and below sub-images
    const auto fill = static_cast<std::uint8_t>(has_transparent ? image.transparent_index : 0);
    const std::vector<std::uint8_t> background(static_cast<std::size_t>(image.width), fill);
    for (int y = 0; y < image.height; ++y) {
        surf.write_pixels(0, y, image.width, background.data());
    }

    for (std::size_t i = 0; i < image.subimages.size(); ++i) {
        const auto& sub = image.subimages[i];
        const auto& box = image.boxes[i];
        write_rows(surf, sub.pixels.data(), static_cast<std::size_t>(sub.width), sub.height, box.x, box.y);

        subrect sr;
        sr.rect = box;
        sr.kind = subrect_kind::frame;
        sr.user_tag = static_cast<std::uint32_t>(i);
        surf.set_subrect(static_cast<int>(i), sr);
    }

    return codec_result::success();
}

} // namespace stci
