// STI conversion tool: STI -> PNG and PNG/JPEG/TGA/GIF -> STI

#define STB_IMAGE_IMPLEMENTATION
#define STBI_NO_PNG  // lodepng handles PNG
#define STBI_NO_BMP
#define STBI_NO_PSD
#define STBI_NO_HDR
#define STBI_NO_PIC
#define STBI_NO_PNM

#include <stb_image.h>
#include <lodepng.h>

#include <stci/stci.hpp>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <input> [output]\n";
    std::cerr << "Converts STI sprites to PNG, or images to STI.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -i, --info          Describe an STI file\n";
    std::cerr << "  -f, --frames        Write each ETRLE sub-image to its own PNG\n";
    std::cerr << "  -r, --to-rgb SPEC   Encode an image as truecolor STI (e.g. BGR;16, RGBA)\n";
    std::cerr << "  -e, --to-etrle      Encode an image as a one-frame ETRLE STI\n";
    std::cerr << "  -h, --help          Show this help\n";
}

std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return {};
    }

    const auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
    file.read(reinterpret_cast<char*>(data.data()), size);

    return data;
}

bool write_file(const std::filesystem::path& path, const std::vector<std::uint8_t>& data) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return file.good();
}

// ============================================================================
// PNG output
// ============================================================================

// Palette indices to RGBA; the transparent index (if any) gets alpha 0
std::vector<std::uint8_t> expand_indices(std::span<const std::uint8_t> indices,
                                         std::span<const std::uint8_t> palette,
                                         int transparent_index) {
    std::vector<std::uint8_t> rgba(indices.size() * 4);
    for (std::size_t i = 0; i < indices.size(); ++i) {
        const std::size_t pal_offset = static_cast<std::size_t>(indices[i]) * 3;
        if (pal_offset + 2 < palette.size()) {
            rgba[i * 4 + 0] = palette[pal_offset + 0];
            rgba[i * 4 + 1] = palette[pal_offset + 1];
            rgba[i * 4 + 2] = palette[pal_offset + 2];
        }
        rgba[i * 4 + 3] = indices[i] == transparent_index ? 0 : 255;
    }
    return rgba;
}

std::vector<std::uint8_t> to_rgba(const stci::memory_surface& surf) {
    const auto pixels = surf.pixels();
    switch (surf.format()) {
        case stci::pixel_format::rgba8888:
            return {pixels.begin(), pixels.end()};
        case stci::pixel_format::rgb888: {
            std::vector<std::uint8_t> rgba(pixels.size() / 3 * 4);
            for (std::size_t i = 0; i < pixels.size() / 3; ++i) {
                rgba[i * 4 + 0] = pixels[i * 3 + 0];
                rgba[i * 4 + 1] = pixels[i * 3 + 1];
                rgba[i * 4 + 2] = pixels[i * 3 + 2];
                rgba[i * 4 + 3] = 255;
            }
            return rgba;
        }
        case stci::pixel_format::indexed8:
            return expand_indices(pixels, surf.palette(), surf.transparent_index());
    }
    return {};
}

bool save_png(const std::vector<std::uint8_t>& rgba, int width, int height,
              const std::filesystem::path& path) {
    std::vector<std::uint8_t> png_data;
    const unsigned error = lodepng::encode(png_data, rgba,
                                           static_cast<unsigned>(width), static_cast<unsigned>(height));
    if (error) {
        std::cerr << "Error: PNG encode failed: " << lodepng_error_text(error) << "\n";
        return false;
    }
    return write_file(path, png_data);
}

// ============================================================================
// Image input
// ============================================================================

struct rgba_image {
    int width = 0;
    int height = 0;
    std::vector<std::uint8_t> pixels;
};

bool load_image(const std::vector<std::uint8_t>& data, rgba_image& image) {
    if (data.size() >= 8 && data[0] == 0x89 && data[1] == 'P' && data[2] == 'N' && data[3] == 'G') {
        unsigned width = 0;
        unsigned height = 0;
        const unsigned error = lodepng::decode(image.pixels, width, height, data.data(), data.size());
        if (error) {
            std::cerr << "Error: PNG decode failed: " << lodepng_error_text(error) << "\n";
            return false;
        }
        image.width = static_cast<int>(width);
        image.height = static_cast<int>(height);
        return true;
    }

    if (data.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        std::cerr << "Error: Input too large\n";
        return false;
    }

    int width = 0;
    int height = 0;
    int channels = 0;
    stbi_uc* pixels = stbi_load_from_memory(data.data(), static_cast<int>(data.size()),
                                            &width, &height, &channels, 4);
    if (!pixels) {
        std::cerr << "Error: Image decode failed: " << stbi_failure_reason() << "\n";
        return false;
    }
    std::unique_ptr<stbi_uc, decltype(&stbi_image_free)> pixel_guard(pixels, stbi_image_free);

    image.width = width;
    image.height = height;
    image.pixels.assign(pixels, pixels + static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4);
    return true;
}

// ============================================================================
// Commands
// ============================================================================

const char* kind_name(stci::sti_kind kind) {
    switch (kind) {
        case stci::sti_kind::truecolor: return "truecolor";
        case stci::sti_kind::indexed:   return "indexed";
        case stci::sti_kind::etrle:     return "ETRLE";
    }
    return "unknown";
}

int print_info(const std::vector<std::uint8_t>& data) {
    stci::sti_image image;
    auto result = stci::load_sti(data, image);
    if (!result) {
        std::cerr << "Error: " << stci::to_string(result.error) << ": " << result.message << "\n";
        return 1;
    }

    std::cout << "Kind: " << kind_name(image.kind) << "\n";
    std::cout << "Size: " << image.width << "x" << image.height;
    if (image.canvas_overridden) {
        std::cout << " (header says " << image.header.width << "x" << image.header.height << ")";
    }
    std::cout << "\n";

    if (image.kind == stci::sti_kind::truecolor) {
        const auto name = stci::spec_name(image.spec);
        std::cout << "Packing: " << (name.empty() ? std::string_view("custom") : name)
                  << ", " << static_cast<int>(image.spec.color_depth) << " bits\n";
        return 0;
    }

    std::cout << "Transparent index: " << image.transparent_index << "\n";
    for (std::size_t i = 0; i < image.subimages.size(); ++i) {
        const auto& sub = image.subimages[i];
        std::cout << "  #" << i << ": " << sub.width << "x" << sub.height
                  << " at (" << sub.offset_x << ", " << sub.offset_y << ")";
        if (sub.aux) {
            std::cout << " frame " << static_cast<int>(sub.aux->current_frame)
                      << "/" << static_cast<int>(sub.aux->number_of_frames)
                      << " tiles " << static_cast<int>(sub.aux->number_of_tiles);
        }
        std::cout << "\n";
    }
    return 0;
}

int export_frames(const std::vector<std::uint8_t>& data, const std::filesystem::path& dir) {
    stci::sti_image image;
    auto result = stci::load_sti(data, image);
    if (!result) {
        std::cerr << "Error: " << stci::to_string(result.error) << ": " << result.message << "\n";
        return 1;
    }
    if (image.kind != stci::sti_kind::etrle) {
        std::cerr << "Error: Only ETRLE files have sub-images\n";
        return 1;
    }

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        std::cerr << "Error: Cannot create " << dir << ": " << ec.message() << "\n";
        return 1;
    }

    const auto transparent = static_cast<int>(image.transparent_index);
    for (std::size_t i = 0; i < image.subimages.size(); ++i) {
        const auto& sub = image.subimages[i];
        const auto path = dir / ("frame_" + std::to_string(i) + ".png");
        if (!save_png(expand_indices(sub.pixels, image.palette, transparent), sub.width, sub.height, path)) {
            std::cerr << "Error: Failed to save: " << path << "\n";
            return 1;
        }
        std::cout << "Saved: " << path << "\n";
    }
    return 0;
}

int sti_to_png(const std::vector<std::uint8_t>& data, const std::filesystem::path& output_path) {
    stci::memory_surface surface;
    auto result = stci::sti_decoder::decode(data, surface);
    if (!result) {
        std::cerr << "Error: Failed to decode: " << result.message << "\n";
        return 1;
    }

    std::cout << "Decoded: " << surface.width() << "x" << surface.height() << "\n";

    if (!save_png(to_rgba(surface), surface.width(), surface.height(), output_path)) {
        std::cerr << "Error: Failed to save: " << output_path << "\n";
        return 1;
    }

    std::cout << "Saved: " << output_path << "\n";
    return 0;
}

int image_to_sti(const std::vector<std::uint8_t>& data,
                 const std::filesystem::path& output_path,
                 const char* spec_name) {
    rgba_image source;
    if (!load_image(data, source)) {
        return 1;
    }

    const stci::image_view view{source.width, source.height, stci::pixel_format::rgba8888, source.pixels};
    std::vector<std::uint8_t> out;
    stci::codec_result result;

    if (spec_name) {
        const auto* spec = stci::find_named_spec(spec_name);
        if (!spec) {
            std::cerr << "Error: Unknown packing: " << spec_name << "\n";
            return 1;
        }
        stci::truecolor_save_options options;
        options.spec = *spec;
        result = stci::save_sti_truecolor(view, out, options);
    } else {
        const stci::sti_frame frame{view, 0, 0, std::nullopt};
        stci::etrle_save_options options;
        options.semi_transparent = stci::semi_transparent_policy::opaque;
        result = stci::save_sti_etrle(std::span<const stci::sti_frame>(&frame, 1), out, options);
    }

    if (!result) {
        std::cerr << "Error: " << stci::to_string(result.error) << ": " << result.message << "\n";
        return 1;
    }
    if (!write_file(output_path, out)) {
        std::cerr << "Error: Failed to save: " << output_path << "\n";
        return 1;
    }

    std::cout << "Saved: " << output_path << " (" << out.size() << " bytes)\n";
    return 0;
}

bool is_option(const char* arg, const char* short_name, const char* long_name) {
    return std::strcmp(arg, short_name) == 0 || std::strcmp(arg, long_name) == 0;
}

enum class command { to_png, info, frames, to_rgb, to_etrle };

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    if (is_option(argv[1], "-h", "--help")) {
        print_usage(argv[0]);
        return 0;
    }

    command cmd = command::to_png;
    const char* spec_name = nullptr;
    int arg = 1;

    if (is_option(argv[arg], "-i", "--info")) {
        cmd = command::info;
        ++arg;
    } else if (is_option(argv[arg], "-f", "--frames")) {
        cmd = command::frames;
        ++arg;
    } else if (is_option(argv[arg], "-e", "--to-etrle")) {
        cmd = command::to_etrle;
        ++arg;
    } else if (is_option(argv[arg], "-r", "--to-rgb")) {
        cmd = command::to_rgb;
        if (++arg < argc) {
            spec_name = argv[arg++];
        }
    }

    if (arg >= argc) {
        print_usage(argv[0]);
        return 1;
    }

    const std::filesystem::path input_path(argv[arg++]);
    if (!std::filesystem::exists(input_path)) {
        std::cerr << "Error: File not found: " << input_path << "\n";
        return 1;
    }

    auto data = read_file(input_path);
    if (data.empty()) {
        std::cerr << "Error: Failed to read file: " << input_path << "\n";
        return 1;
    }

    const bool to_sti = cmd == command::to_rgb || cmd == command::to_etrle;
    if (!to_sti && !stci::sti_decoder::sniff(data)) {
        std::cerr << "Error: Not an STI file: " << input_path << "\n";
        return 1;
    }

    // Second positional argument is the output, otherwise derive it from the input
    std::filesystem::path output_path;
    if (arg < argc) {
        output_path = argv[arg];
    } else {
        output_path = input_path;
        if (to_sti) {
            output_path.replace_extension(".sti");
        } else if (cmd == command::frames) {
            output_path.replace_extension("");
        } else {
            output_path.replace_extension(".png");
        }
    }

    switch (cmd) {
        case command::info:
            return print_info(data);
        case command::frames:
            return export_frames(data, output_path);
        case command::to_rgb:
        case command::to_etrle:
            return image_to_sti(data, output_path, spec_name);
        case command::to_png:
            break;
    }
    return sti_to_png(data, output_path);
}
