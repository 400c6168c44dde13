#include <stci/header_layout.hpp>
#include "byte_io.hpp"

#include <algorithm>
#include <string>

namespace stci {

// ============================================================================
// Header Layout
// ============================================================================

header_layout::header_layout(std::string_view name, std::initializer_list<field_def> fields)
    : name_(name), fields_(fields) {
    offsets_.reserve(fields_.size());
    for (const auto& field : fields_) {
        offsets_.push_back(size_);
        size_ += field.width;
    }
}

header_layout::header_layout(std::string_view name,
                             std::initializer_list<field_def> fields,
                             std::string_view flag_field,
                             std::initializer_list<flag_def> flags)
    : header_layout(name, fields) {
    flag_field_ = flag_field;
    flags_.assign(flags.begin(), flags.end());
}

int header_layout::field_index(std::string_view name) const noexcept {
    if (name.empty()) {
        return -1;
    }
    for (std::size_t i = 0; i < fields_.size(); ++i) {
        if (fields_[i].type != field_type::padding && fields_[i].name == name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

const flag_def* header_layout::find_flag(std::string_view name) const noexcept {
    auto it = std::find_if(flags_.begin(), flags_.end(),
                           [name](const flag_def& f) { return f.name == name; });
    return it != flags_.end() ? &*it : nullptr;
}

// ============================================================================
// Header Fields
// ============================================================================

header_fields::header_fields(const header_layout& layout)
    : layout_(&layout),
      integers_(layout.fields().size(), 0),
      bytes_(layout.fields().size()) {
    const auto fields = layout.fields();
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (fields[i].type == field_type::bytes) {
            bytes_[i].assign(fields[i].width, 0);
        }
    }
}

codec_result header_fields::set(std::string_view name, std::uint64_t value) {
    const int index = layout_->field_index(name);
    if (index < 0 || layout_->fields()[static_cast<std::size_t>(index)].type != field_type::integer) {
        return codec_result::failure(codec_error::unknown_field,
            std::string(layout_->name()) + ": no integer field '" + std::string(name) + "'");
    }
    integers_[static_cast<std::size_t>(index)] = value;
    return codec_result::success();
}

codec_result header_fields::set_bytes(std::string_view name, std::span<const std::uint8_t> value) {
    const int index = layout_->field_index(name);
    if (index < 0 || layout_->fields()[static_cast<std::size_t>(index)].type != field_type::bytes) {
        return codec_result::failure(codec_error::unknown_field,
            std::string(layout_->name()) + ": no byte field '" + std::string(name) + "'");
    }
    const auto width = layout_->fields()[static_cast<std::size_t>(index)].width;
    if (value.size() != width) {
        return codec_result::failure(codec_error::field_overflow,
            std::string(layout_->name()) + ": field '" + std::string(name) + "' takes exactly " +
            std::to_string(width) + " bytes, got " + std::to_string(value.size()));
    }
    assign_at(static_cast<std::size_t>(index), value);
    return codec_result::success();
}

std::uint64_t header_fields::get(std::string_view name) const noexcept {
    const int index = layout_->field_index(name);
    if (index < 0 || layout_->fields()[static_cast<std::size_t>(index)].type != field_type::integer) {
        return 0;
    }
    return integers_[static_cast<std::size_t>(index)];
}

std::span<const std::uint8_t> header_fields::get_bytes(std::string_view name) const noexcept {
    const int index = layout_->field_index(name);
    if (index < 0) {
        return {};
    }
    return bytes_[static_cast<std::size_t>(index)];
}

void header_fields::assign_at(std::size_t index, std::span<const std::uint8_t> value) {
    bytes_[index].assign(value.begin(), value.end());
}

codec_result header_fields::flag_location(std::string_view flag, std::size_t& field, unsigned& bit) const {
    const flag_def* def = layout_->find_flag(flag);
    const int index = layout_->field_index(layout_->flag_field());
    if (!def || index < 0) {
        return codec_result::failure(codec_error::unknown_flag,
            std::string(layout_->name()) + ": unknown flag '" + std::string(flag) + "'");
    }
    field = static_cast<std::size_t>(index);
    bit = def->bit;
    return codec_result::success();
}

codec_result header_fields::get_flag(std::string_view flag, bool& value) const {
    std::size_t field = 0;
    unsigned bit = 0;
    auto result = flag_location(flag, field, bit);
    if (!result) {
        return result;
    }
    value = ((integers_[field] >> bit) & 1u) != 0;
    return codec_result::success();
}

codec_result header_fields::set_flag(std::string_view flag, bool value) {
    std::size_t field = 0;
    unsigned bit = 0;
    auto result = flag_location(flag, field, bit);
    if (!result) {
        return result;
    }
    const std::uint64_t mask = std::uint64_t{1} << bit;
    integers_[field] = value ? (integers_[field] | mask) : (integers_[field] & ~mask);
    return codec_result::success();
}

// ============================================================================
// Header Codec
// ============================================================================

codec_result decode_header(const header_layout& layout,
                           std::span<const std::uint8_t> data,
                           header_fields& fields) {
    if (data.size() < layout.size()) {
        return codec_result::failure(codec_error::truncated_input,
            std::string(layout.name()) + ": need " + std::to_string(layout.size()) +
            " bytes, got " + std::to_string(data.size()));
    }

    header_fields decoded(layout);
    const auto defs = layout.fields();
    for (std::size_t i = 0; i < defs.size(); ++i) {
        const auto* p = data.data() + layout.offset_of(i);
        switch (defs[i].type) {
            case field_type::integer:
                decoded.assign_at(i, read_le(p, defs[i].width));
                break;
            case field_type::bytes:
                decoded.assign_at(i, std::span<const std::uint8_t>(p, defs[i].width));
                break;
            case field_type::padding:
                break;
        }
    }

    fields = std::move(decoded);
    return codec_result::success();
}

codec_result encode_header(const header_fields& fields, std::vector<std::uint8_t>& out) {
    const auto& layout = fields.layout();
    const auto defs = layout.fields();

    // Validate everything before touching the output
    for (std::size_t i = 0; i < defs.size(); ++i) {
        if (defs[i].type != field_type::integer || defs[i].width >= 8) {
            continue;
        }
        const std::uint64_t value = fields.integer_at(i);
        if ((value >> (8 * defs[i].width)) != 0) {
            return codec_result::failure(codec_error::field_overflow,
                std::string(layout.name()) + ": value " + std::to_string(value) +
                " does not fit field '" + std::string(defs[i].name) + "' (" +
                std::to_string(defs[i].width) + " bytes)");
        }
    }

    const std::size_t start = out.size();
    out.resize(start + layout.size(), 0);
    for (std::size_t i = 0; i < defs.size(); ++i) {
        auto* p = out.data() + start + layout.offset_of(i);
        switch (defs[i].type) {
            case field_type::integer:
                store_le(p, fields.integer_at(i), defs[i].width);
                break;
            case field_type::bytes: {
                const auto value = fields.bytes_at(i);
                std::copy_n(value.begin(), std::min(value.size(), defs[i].width), p);
                break;
            }
            case field_type::padding:
                break;  // already zero
        }
    }

    return codec_result::success();
}

} // namespace stci
