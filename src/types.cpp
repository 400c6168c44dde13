#include <stci/types.hpp>

namespace stci {

const char* to_string(codec_error err) noexcept {
    switch (err) {
        case codec_error::none:                return "none";
        case codec_error::format_mismatch:     return "format_mismatch";
        case codec_error::unsupported_feature: return "unsupported_feature";
        case codec_error::truncated_input:     return "truncated_input";
        case codec_error::malformed_run:       return "malformed_run";
        case codec_error::invalid_spec:        return "invalid_spec";
        case codec_error::field_overflow:      return "field_overflow";
        case codec_error::invalid_component:   return "invalid_component";
        case codec_error::unknown_flag:        return "unknown_flag";
        case codec_error::unknown_field:       return "unknown_field";
        case codec_error::palette_overflow:    return "palette_overflow";
        case codec_error::dimensions_exceeded: return "dimensions_exceeded";
        case codec_error::io_error:            return "io_error";
        case codec_error::internal_error:      return "internal_error";
    }
    return "unknown";
}

} // namespace stci
