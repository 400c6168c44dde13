#include <stci/streaming.hpp>
#include <stci/etrle.hpp>

#include <algorithm>
#include <string>

namespace stci {

namespace {

std::size_t pixel_count(int width, int height) {
    if (width <= 0 || height <= 0) {
        return 0;
    }
    return static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
}

} // namespace

// ============================================================================
// stream_decoder
// ============================================================================

stream_decoder::stream_decoder(std::size_t target_bytes)
    : target_(target_bytes) {}

decode_step stream_decoder::step(std::span<const std::uint8_t> chunk, std::size_t size_hint) {
    if (state_ == state::done) {
        return {step_status::done, 0, codec_result::success()};
    }
    if (state_ == state::failed) {
        return {step_status::failed, 0, error_};
    }

    if (buffer_.empty() && size_hint > 0) {
        buffer_.reserve(std::min(size_hint, target_));
    }

    const std::size_t take = std::min(chunk.size(), target_ - buffer_.size());
    buffer_.insert(buffer_.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(take));

    if (buffer_.size() < target_) {
        return {step_status::need_more_input, take, codec_result::success()};
    }

    auto result = decode_block(buffer_, pixels_);
    buffer_.clear();
    buffer_.shrink_to_fit();
    if (!result) {
        state_ = state::failed;
        error_ = result;
        pixels_.clear();
        return {step_status::failed, take, std::move(result)};
    }

    state_ = state::done;
    return {step_status::done, take, codec_result::success()};
}

// ============================================================================
// Concrete decoders
// ============================================================================

color_stream_decoder::color_stream_decoder(const color_spec& spec, int width, int height, pixel_format format)
    : stream_decoder(pixel_count(width, height) * spec.pixel_bytes()),
      spec_(spec),
      format_(format) {}

codec_result color_stream_decoder::decode_block(std::span<const std::uint8_t> block,
                                                std::vector<std::uint8_t>& pixels) {
    if (format_ == pixel_format::indexed8) {
        return codec_result::failure(codec_error::unsupported_feature,
            "Truecolor pixels cannot be decoded to indexed8");
    }

    const std::size_t pixel_bytes = spec_.pixel_bytes();
    if (pixel_bytes == 0) {
        return codec_result::failure(codec_error::invalid_spec, "Color depth is zero");
    }

    const bool with_alpha = format_ == pixel_format::rgba8888;
    const bool opaque = !spec_.has_alpha();
    const std::size_t count = block.size() / pixel_bytes;

    pixels.clear();
    pixels.reserve(count * bytes_per_pixel(format_));
    for (std::size_t i = 0; i < count; ++i) {
        const auto c = unpack_color(read_packed_pixel(block.data() + i * pixel_bytes, pixel_bytes), spec_);
        pixels.push_back(c.r);
        pixels.push_back(c.g);
        pixels.push_back(c.b);
        if (with_alpha) {
            pixels.push_back(opaque ? 255 : c.a);
        }
    }
    return codec_result::success();
}

index_stream_decoder::index_stream_decoder(int width, int height)
    : stream_decoder(pixel_count(width, height)) {}

codec_result index_stream_decoder::decode_block(std::span<const std::uint8_t> block,
                                                std::vector<std::uint8_t>& pixels) {
    pixels.assign(block.begin(), block.end());
    return codec_result::success();
}

etrle_stream_decoder::etrle_stream_decoder(int width, int height, std::size_t compressed_size)
    : stream_decoder(compressed_size),
      width_(width),
      height_(height) {}

codec_result etrle_stream_decoder::decode_block(std::span<const std::uint8_t> block,
                                                std::vector<std::uint8_t>& pixels) {
    auto result = etrle_decompress(block, pixels, width_);
    if (!result) {
        return result;
    }

    const std::size_t expected = pixel_count(width_, height_);
    if (pixels.size() != expected) {
        return codec_result::failure(codec_error::malformed_run,
            "ETRLE data decodes to " + std::to_string(pixels.size()) + " pixels, expected " +
            std::to_string(expected) + " (" + std::to_string(width_) + "x" +
            std::to_string(height_) + ")");
    }
    return codec_result::success();
}

// ============================================================================
// stream_encoder
// ============================================================================

encode_step stream_encoder::step(std::size_t max_bytes, std::vector<std::uint8_t>& out) {
    if (failed_) {
        return {step_status::failed, 0, error_};
    }

    while (!exhausted_ && pending_.size() - pending_pos_ <= max_bytes) {
        auto result = produce(pending_, exhausted_);
        if (!result) {
            failed_ = true;
            error_ = result;
            pending_.clear();
            pending_pos_ = 0;
            return {step_status::failed, 0, std::move(result)};
        }
    }

    const std::size_t available = pending_.size() - pending_pos_;
    const std::size_t n = std::min(available, max_bytes);
    const auto first = pending_.begin() + static_cast<std::ptrdiff_t>(pending_pos_);
    out.insert(out.end(), first, first + static_cast<std::ptrdiff_t>(n));
    pending_pos_ += n;

    // Drop what has been handed out once it dominates the buffer
    if (pending_pos_ == pending_.size()) {
        pending_.clear();
        pending_pos_ = 0;
    } else if (pending_pos_ > pending_.size() / 2) {
        pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(pending_pos_));
        pending_pos_ = 0;
    }

    const auto status = finished() ? step_status::done : step_status::more_pending;
    return {status, n, codec_result::success()};
}

bool stream_encoder::finished() const noexcept {
    return exhausted_ && !failed_ && pending_pos_ == pending_.size();
}

// ============================================================================
// Concrete encoders
// ============================================================================

color_stream_encoder::color_stream_encoder(const image_view& image, const color_spec& spec)
    : image_(image), spec_(spec) {}

codec_result color_stream_encoder::produce(std::vector<std::uint8_t>& pending, bool& exhausted) {
    if (row_ >= image_.height) {
        exhausted = true;
        return codec_result::success();
    }
    if (image_.format == pixel_format::indexed8) {
        return codec_result::failure(codec_error::unsupported_feature,
            "Truecolor encoding requires rgb888 or rgba8888 pixels");
    }
    if (image_.pixels.size() < image_.byte_size()) {
        return codec_result::failure(codec_error::truncated_input,
            "Pixel data too small for " + std::to_string(image_.width) + "x" +
            std::to_string(image_.height) + " image");
    }

    const std::size_t bpp = bytes_per_pixel(image_.format);
    const bool has_alpha = image_.format == pixel_format::rgba8888;
    const auto row = image_.pixels.subspan(static_cast<std::size_t>(row_) * image_.pitch(), image_.pitch());

    // Encode into a scratch row so a failure leaves no partial row behind
    std::vector<std::uint8_t> encoded;
    encoded.reserve(static_cast<std::size_t>(image_.width) * spec_.pixel_bytes());
    for (int x = 0; x < image_.width; ++x) {
        const auto* p = row.data() + static_cast<std::size_t>(x) * bpp;
        std::uint64_t raw = 0;
        auto result = pack_color(p[0], p[1], p[2], has_alpha ? p[3] : 255, spec_, raw);
        if (!result) {
            result.message += " at (" + std::to_string(x) + ", " + std::to_string(row_) + ")";
            return result;
        }
        write_packed_pixel(raw, spec_.pixel_bytes(), encoded);
    }

    pending.insert(pending.end(), encoded.begin(), encoded.end());
    ++row_;
    return codec_result::success();
}

index_stream_encoder::index_stream_encoder(const image_view& image)
    : image_(image) {}

codec_result index_stream_encoder::produce(std::vector<std::uint8_t>& pending, bool& exhausted) {
    if (image_.format != pixel_format::indexed8) {
        return codec_result::failure(codec_error::unsupported_feature,
            "Raw index encoding requires indexed8 pixels");
    }

    const std::size_t total = pixel_count(image_.width, image_.height);
    if (next_ >= total) {
        exhausted = true;
        return codec_result::success();
    }
    if (next_ >= image_.pixels.size()) {
        return codec_result::failure(codec_error::truncated_input,
            "Pixel data ends at index " + std::to_string(next_) + " of " + std::to_string(total));
    }

    pending.push_back(image_.pixels[next_++]);
    return codec_result::success();
}

etrle_stream_encoder::etrle_stream_encoder(const image_view& image)
    : image_(image) {}

codec_result etrle_stream_encoder::produce(std::vector<std::uint8_t>& pending, bool& exhausted) {
    if (image_.format != pixel_format::indexed8) {
        return codec_result::failure(codec_error::unsupported_feature,
            "ETRLE compression requires indexed pixels");
    }
    if (row_ >= image_.height) {
        exhausted = true;
        return codec_result::success();
    }
    if (image_.pixels.size() < image_.byte_size()) {
        return codec_result::failure(codec_error::truncated_input,
            "Pixel data too small for " + std::to_string(image_.width) + "x" +
            std::to_string(image_.height) + " image");
    }

    etrle_compress_line(image_.pixels.subspan(static_cast<std::size_t>(row_) * image_.pitch(), image_.pitch()),
                        pending);
    ++row_;
    return codec_result::success();
}

// ============================================================================
// Drivers
// ============================================================================

codec_result run_decoder(stream_decoder& decoder,
                         std::span<const std::uint8_t> data,
                         std::size_t chunk_size) {
    if (chunk_size == 0) {
        chunk_size = data.size();
    }

    std::size_t pos = 0;
    for (;;) {
        const auto chunk = data.subspan(pos, std::min(chunk_size, data.size() - pos));
        auto step = decoder.step(chunk, data.size());
        pos += step.consumed;

        switch (step.status) {
            case step_status::done:
                return codec_result::success();
            case step_status::failed:
                return step.result;
            case step_status::need_more_input:
            case step_status::more_pending:
                break;
        }

        if (pos >= data.size()) {
            return codec_result::failure(codec_error::truncated_input,
                "Stream needs " + std::to_string(decoder.target_bytes()) + " bytes, got " +
                std::to_string(decoder.buffered()));
        }
    }
}

codec_result run_encoder(stream_encoder& encoder,
                         std::vector<std::uint8_t>& out,
                         std::size_t chunk_size) {
    if (chunk_size == 0) {
        chunk_size = 16384;
    }

    for (;;) {
        auto step = encoder.step(chunk_size, out);
        switch (step.status) {
            case step_status::done:
                return codec_result::success();
            case step_status::failed:
                return step.result;
            case step_status::need_more_input:
            case step_status::more_pending:
                break;
        }
    }
}

} // namespace stci
