#ifndef STCI_STREAMING_HPP_
#define STCI_STREAMING_HPP_

#include <stci/stci_export.h>
#include <stci/types.hpp>
#include <stci/color_mask.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace stci {

// ============================================================================
// Step Protocol
// ============================================================================

enum class step_status {
    need_more_input,  // decoder: feed another chunk
    more_pending,     // encoder: call step() again for more output
    done,
    failed
};

struct decode_step {
    step_status status = step_status::need_more_input;
    std::size_t consumed = 0;  // bytes taken from the chunk
    codec_result result;
};

struct encode_step {
    step_status status = step_status::more_pending;
    std::size_t produced = 0;  // bytes appended to the output
    codec_result result;
};

// ============================================================================
// Stream Decoders
// ============================================================================

/**
 * Resumable decoder. Input is accumulated until target_bytes have arrived,
 * then the whole block is decoded at once and the pixels become available.
 *
 * Each session owns its buffers; separate sessions need no coordination.
 */
class STCI_EXPORT stream_decoder {
public:
    explicit stream_decoder(std::size_t target_bytes);
    virtual ~stream_decoder() = default;

    stream_decoder(const stream_decoder&) = delete;
    stream_decoder& operator=(const stream_decoder&) = delete;

    /**
     * Feed the next chunk.
     * @param chunk Raw bytes; only up to the remaining target is consumed
     * @param size_hint Expected total input size, used to pre-size the buffer
     * @return need_more_input until the target is reached, then done (or
     *         failed if the block does not decode). Further steps repeat the
     *         final status without consuming anything.
     */
    [[nodiscard]] decode_step step(std::span<const std::uint8_t> chunk, std::size_t size_hint = 0);

    [[nodiscard]] std::size_t target_bytes() const noexcept { return target_; }
    [[nodiscard]] std::size_t buffered() const noexcept { return buffer_.size(); }
    [[nodiscard]] bool finished() const noexcept { return state_ == state::done; }

    // Decoded pixels, valid once finished()
    [[nodiscard]] const std::vector<std::uint8_t>& pixels() const noexcept { return pixels_; }
    [[nodiscard]] std::vector<std::uint8_t> take_pixels() noexcept { return std::move(pixels_); }

protected:
    [[nodiscard]] virtual codec_result decode_block(std::span<const std::uint8_t> block,
                                                    std::vector<std::uint8_t>& pixels) = 0;

private:
    enum class state { accumulating, done, failed };

    std::size_t target_;
    std::vector<std::uint8_t> buffer_;
    std::vector<std::uint8_t> pixels_;
    state state_ = state::accumulating;
    codec_result error_;
};

/**
 * Packed truecolor pixels -> rgb888 or rgba8888. Alpha is 255 when the
 * spec has no alpha mask.
 */
class STCI_EXPORT color_stream_decoder : public stream_decoder {
public:
    color_stream_decoder(const color_spec& spec, int width, int height, pixel_format format);

protected:
    [[nodiscard]] codec_result decode_block(std::span<const std::uint8_t> block,
                                            std::vector<std::uint8_t>& pixels) override;

private:
    color_spec spec_;
    pixel_format format_;
};

/**
 * Raw palette indices, one byte per pixel.
 */
class STCI_EXPORT index_stream_decoder : public stream_decoder {
public:
    index_stream_decoder(int width, int height);

protected:
    [[nodiscard]] codec_result decode_block(std::span<const std::uint8_t> block,
                                            std::vector<std::uint8_t>& pixels) override;
};

/**
 * One ETRLE-compressed image of compressed_size bytes. Fails with
 * malformed_run unless the data decodes to exactly width*height indices.
 */
class STCI_EXPORT etrle_stream_decoder : public stream_decoder {
public:
    etrle_stream_decoder(int width, int height, std::size_t compressed_size);

protected:
    [[nodiscard]] codec_result decode_block(std::span<const std::uint8_t> block,
                                            std::vector<std::uint8_t>& pixels) override;

private:
    int width_;
    int height_;
};

// ============================================================================
// Stream Encoders
// ============================================================================

/**
 * Resumable encoder. Subclasses append one unit (a row or a pixel) at a time
 * to a pending buffer; step() hands out at most max_bytes of it per call and
 * keeps the remainder for the next call.
 */
class STCI_EXPORT stream_encoder {
public:
    stream_encoder() = default;
    virtual ~stream_encoder() = default;

    stream_encoder(const stream_encoder&) = delete;
    stream_encoder& operator=(const stream_encoder&) = delete;

    /**
     * Append up to max_bytes of encoded output to out.
     * @return more_pending while output remains, done once everything has
     *         been handed out, failed on an encoding error (nothing more is
     *         produced after that)
     */
    [[nodiscard]] encode_step step(std::size_t max_bytes, std::vector<std::uint8_t>& out);

    [[nodiscard]] bool finished() const noexcept;

protected:
    /**
     * Append the next unit to pending, or set exhausted when there is none.
     */
    [[nodiscard]] virtual codec_result produce(std::vector<std::uint8_t>& pending, bool& exhausted) = 0;

private:
    std::vector<std::uint8_t> pending_;
    std::size_t pending_pos_ = 0;
    bool exhausted_ = false;
    bool failed_ = false;
    codec_result error_;
};

/**
 * rgb888/rgba8888 rows -> packed pixels. Rows are atomic.
 */
class STCI_EXPORT color_stream_encoder : public stream_encoder {
public:
    color_stream_encoder(const image_view& image, const color_spec& spec);

protected:
    [[nodiscard]] codec_result produce(std::vector<std::uint8_t>& pending, bool& exhausted) override;

private:
    image_view image_;
    color_spec spec_;
    int row_ = 0;
};

/**
 * indexed8 pixels written raw, one pixel per unit.
 */
class STCI_EXPORT index_stream_encoder : public stream_encoder {
public:
    explicit index_stream_encoder(const image_view& image);

protected:
    [[nodiscard]] codec_result produce(std::vector<std::uint8_t>& pending, bool& exhausted) override;

private:
    image_view image_;
    std::size_t next_ = 0;
};

/**
 * indexed8 rows -> ETRLE lines. Rows are atomic.
 */
class STCI_EXPORT etrle_stream_encoder : public stream_encoder {
public:
    explicit etrle_stream_encoder(const image_view& image);

protected:
    [[nodiscard]] codec_result produce(std::vector<std::uint8_t>& pending, bool& exhausted) override;

private:
    image_view image_;
    int row_ = 0;
};

// ============================================================================
// Drivers
// ============================================================================

/**
 * Feed data to a decoder in chunks of chunk_size bytes until it finishes.
 * @return truncated_input if data runs out first, or the decoder's error
 */
[[nodiscard]] STCI_EXPORT codec_result run_decoder(stream_decoder& decoder,
                                                   std::span<const std::uint8_t> data,
                                                   std::size_t chunk_size);

/**
 * Step an encoder with a budget of chunk_size bytes until it is done,
 * appending everything to out.
 */
[[nodiscard]] STCI_EXPORT codec_result run_encoder(stream_encoder& encoder,
                                                   std::vector<std::uint8_t>& out,
                                                   std::size_t chunk_size);

} // namespace stci

#endif // STCI_STREAMING_HPP_
