#include <stci/etrle.hpp>

#include <algorithm>
#include <string>

namespace stci {

namespace {

// Length and kind of the next run at the head of a line
std::uint8_t next_run(std::span<const std::uint8_t> line, std::size_t& length) {
    std::size_t n = line.size();
    std::uint8_t control = 0;

    bool split = false;
    for (std::size_t i = 1; i < line.size(); ++i) {
        if (line[i] != 0) {
            continue;
        }
        if (line[i - 1] != 0) {
            // A single zero at the end of the line joins the next (zero) run
            if (i + 1 == line.size()) {
                n -= 1;
                split = true;
                break;
            }
            continue;
        }
        // Two zeros in a row at [i-1, i]
        if (i == 1) {
            control = ETRLE_COMPRESSED_FLAG;
            n = line.size();
            for (std::size_t j = 2; j < line.size(); ++j) {
                if (line[j] != 0) {
                    n = j;
                    break;
                }
            }
        } else {
            n = i - 1;
        }
        split = true;
        break;
    }

    if (!split && n == 1 && line[0] == 0) {
        control = ETRLE_COMPRESSED_FLAG;
    }

    length = std::min(n, ETRLE_MAX_RUN);
    return control;
}

} // namespace

void etrle_compress_line(std::span<const std::uint8_t> line, std::vector<std::uint8_t>& out) {
    while (!line.empty()) {
        std::size_t length = 0;
        const std::uint8_t control = next_run(line, length);
        out.push_back(static_cast<std::uint8_t>(control | length));
        if (control == 0) {
            out.insert(out.end(), line.begin(), line.begin() + static_cast<std::ptrdiff_t>(length));
        }
        line = line.subspan(length);
    }
    out.push_back(ETRLE_END_OF_LINE);
}

codec_result etrle_compress(const image_view& image, std::vector<std::uint8_t>& out) {
    if (image.format != pixel_format::indexed8) {
        return codec_result::failure(codec_error::unsupported_feature,
            "ETRLE compression requires indexed pixels");
    }
    if (image.width < 0 || image.height < 0 || image.pixels.size() < image.byte_size()) {
        return codec_result::failure(codec_error::truncated_input,
            "Pixel data too small for " + std::to_string(image.width) + "x" +
            std::to_string(image.height) + " image");
    }

    const auto width = static_cast<std::size_t>(image.width);
    for (int y = 0; y < image.height; ++y) {
        etrle_compress_line(image.pixels.subspan(static_cast<std::size_t>(y) * width, width), out);
    }
    return codec_result::success();
}

codec_result etrle_decompress(std::span<const std::uint8_t> data,
                              std::vector<std::uint8_t>& out,
                              int width) {
    std::vector<std::uint8_t> decoded;
    std::size_t line_start = 0;
    bool in_line = false;

    auto finish_line = [&]() -> codec_result {
        const std::size_t line_length = decoded.size() - line_start;
        if (width > 0) {
            const auto w = static_cast<std::size_t>(width);
            if (line_length > w) {
                return codec_result::failure(codec_error::malformed_run,
                    "ETRLE line decodes to " + std::to_string(line_length) +
                    " pixels, wider than " + std::to_string(width));
            }
            decoded.resize(line_start + w, 0);
        }
        line_start = decoded.size();
        in_line = false;
        return codec_result::success();
    };

    std::size_t pos = 0;
    while (pos < data.size()) {
        const std::size_t control_pos = pos;
        const std::uint8_t control = data[pos++];

        if (control == ETRLE_END_OF_LINE) {
            auto result = finish_line();
            if (!result) {
                return result;
            }
            continue;
        }

        in_line = true;
        const std::size_t length = control & ETRLE_LENGTH_MASK;
        if (control & ETRLE_COMPRESSED_FLAG) {
            decoded.insert(decoded.end(), length, 0);
            continue;
        }

        if (length > data.size() - pos) {
            return codec_result::failure(codec_error::malformed_run,
                "ETRLE literal run at offset " + std::to_string(control_pos) +
                " needs " + std::to_string(length) + " bytes, " +
                std::to_string(data.size() - pos) + " left");
        }
        decoded.insert(decoded.end(), data.begin() + static_cast<std::ptrdiff_t>(pos),
                       data.begin() + static_cast<std::ptrdiff_t>(pos + length));
        pos += length;
    }

    // Unterminated final line
    if (in_line) {
        auto result = finish_line();
        if (!result) {
            return result;
        }
    }

    out = std::move(decoded);
    return codec_result::success();
}

} // namespace stci
