#ifndef STCI_STCI_HPP_
#define STCI_STCI_HPP_

#include <stci/stci_export.h>
#include <stci/types.hpp>
#include <stci/surface.hpp>
#include <stci/header_layout.hpp>
#include <stci/color_mask.hpp>
#include <stci/etrle.hpp>
#include <stci/streaming.hpp>
#include <stci/codecs/sti.hpp>

namespace stci {

// All public API is included via the headers above.
// See:
//   - types.hpp:         pixel_format, codec_error, codec_result, decode_options, image_view
//   - surface.hpp:       surface interface, memory_surface
//   - header_layout.hpp: fixed-layout binary records with named flags
//   - color_mask.hpp:    bit-mask truecolor packing, named specs
//   - etrle.hpp:         ETRLE scanline compression
//   - streaming.hpp:     resumable chunked encoders and decoders
//   - codecs/sti.hpp:    STI load/save, sti_decoder

} // namespace stci

#endif // STCI_STCI_HPP_
