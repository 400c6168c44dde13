#ifndef STCI_ETRLE_HPP_
#define STCI_ETRLE_HPP_

#include <stci/stci_export.h>
#include <stci/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace stci {

// ============================================================================
// ETRLE Scanline Compression
// ============================================================================
//
// Each line is a sequence of runs, each introduced by a control byte:
//   0x80 | n   n transparent (index 0) pixels, no literal bytes
//   n          n literal index bytes follow
//   0x00       end of line
// Run lengths are 1..127.

constexpr std::uint8_t ETRLE_COMPRESSED_FLAG = 0x80;
constexpr std::uint8_t ETRLE_LENGTH_MASK = 0x7F;
constexpr std::size_t ETRLE_MAX_RUN = 0x7F;
constexpr std::uint8_t ETRLE_END_OF_LINE = 0x00;

/**
 * Compress one scanline of palette indices and append it to out,
 * terminated by the end-of-line control byte.
 *
 * Zero runs of two or more become compressed runs. A lone zero between
 * non-zero bytes stays inside the surrounding literal run.
 */
STCI_EXPORT void etrle_compress_line(std::span<const std::uint8_t> line,
                                     std::vector<std::uint8_t>& out);

/**
 * Compress every row of an indexed8 image.
 * @return unsupported_feature if the image is not indexed8,
 *         truncated_input if the pixel span is smaller than the image
 */
[[nodiscard]] STCI_EXPORT codec_result etrle_compress(const image_view& image,
                                                      std::vector<std::uint8_t>& out);

/**
 * Decompress ETRLE data.
 * @param data Compressed bytes (one or more lines)
 * @param out Receives the decoded indices (replaced)
 * @param width If positive, each line is checked to be at most this wide
 *              and short lines are padded with index 0
 * @return malformed_run if a literal run reads past the buffer or a line
 *         exceeds width
 */
[[nodiscard]] STCI_EXPORT codec_result etrle_decompress(std::span<const std::uint8_t> data,
                                                        std::vector<std::uint8_t>& out,
                                                        int width = 0);

} // namespace stci

#endif // STCI_ETRLE_HPP_
