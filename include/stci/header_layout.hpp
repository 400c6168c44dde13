#ifndef STCI_HEADER_LAYOUT_HPP_
#define STCI_HEADER_LAYOUT_HPP_

#include <stci/stci_export.h>
#include <stci/types.hpp>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string_view>
#include <vector>

namespace stci {

// ============================================================================
// Header Layout
// ============================================================================

enum class field_type {
    integer,  // unsigned little-endian, 1..8 bytes
    bytes,    // fixed-length byte string
    padding   // zero-filled on encode, skipped on decode
};

struct field_def {
    std::string_view name;  // empty for padding
    field_type type = field_type::integer;
    std::size_t width = 0;  // in bytes
};

struct flag_def {
    std::string_view name;
    unsigned bit = 0;
};

/**
 * Ordered, fixed-size binary record description.
 *
 * The total size is the sum of the field widths. One integer field may be
 * declared as a bit-flag set, whose bits are then addressed by name.
 */
class STCI_EXPORT header_layout {
public:
    header_layout(std::string_view name, std::initializer_list<field_def> fields);

    header_layout(std::string_view name,
                  std::initializer_list<field_def> fields,
                  std::string_view flag_field,
                  std::initializer_list<flag_def> flags);

    [[nodiscard]] std::string_view name() const noexcept { return name_; }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] std::span<const field_def> fields() const noexcept { return fields_; }

    /**
     * Index of the named field, or -1 if there is none.
     * Padding fields are never found.
     */
    [[nodiscard]] int field_index(std::string_view name) const noexcept;

    /**
     * Byte offset of the field at index (index must be valid).
     */
    [[nodiscard]] std::size_t offset_of(std::size_t index) const noexcept { return offsets_[index]; }

    [[nodiscard]] std::string_view flag_field() const noexcept { return flag_field_; }
    [[nodiscard]] std::span<const flag_def> flags() const noexcept { return flags_; }

    /**
     * Look up a flag by name.
     * @return Pointer to the flag definition, nullptr if unknown
     */
    [[nodiscard]] const flag_def* find_flag(std::string_view name) const noexcept;

private:
    std::string_view name_;
    std::vector<field_def> fields_;
    std::vector<std::size_t> offsets_;
    std::size_t size_ = 0;
    std::string_view flag_field_;
    std::vector<flag_def> flags_;
};

// ============================================================================
// Header Fields
// ============================================================================

/**
 * Field values for one header_layout. Integers default to 0 and byte
 * strings to all-zero bytes of the field's width.
 *
 * The layout must outlive the field set; layouts are normally statics.
 */
class STCI_EXPORT header_fields {
public:
    explicit header_fields(const header_layout& layout);

    [[nodiscard]] const header_layout& layout() const noexcept { return *layout_; }

    /**
     * Set an integer field. Values wider than the field are accepted here and
     * rejected by encode_header() with field_overflow.
     */
    [[nodiscard]] codec_result set(std::string_view name, std::uint64_t value);

    /**
     * Set a byte-string field. The value must be exactly the field width;
     * callers pad shorter strings themselves.
     */
    [[nodiscard]] codec_result set_bytes(std::string_view name, std::span<const std::uint8_t> value);

    /**
     * Integer value of a field, 0 if the name is not an integer field.
     */
    [[nodiscard]] std::uint64_t get(std::string_view name) const noexcept;

    /**
     * Byte-string value of a field, empty if the name is not a byte field.
     */
    [[nodiscard]] std::span<const std::uint8_t> get_bytes(std::string_view name) const noexcept;

    [[nodiscard]] codec_result get_flag(std::string_view flag, bool& value) const;
    [[nodiscard]] codec_result set_flag(std::string_view flag, bool value);

    // Raw access by field index (index must be valid)
    [[nodiscard]] std::uint64_t integer_at(std::size_t index) const noexcept { return integers_[index]; }
    [[nodiscard]] std::span<const std::uint8_t> bytes_at(std::size_t index) const noexcept { return bytes_[index]; }
    void assign_at(std::size_t index, std::uint64_t value) noexcept { integers_[index] = value; }
    void assign_at(std::size_t index, std::span<const std::uint8_t> value);

private:
    [[nodiscard]] codec_result flag_location(std::string_view flag, std::size_t& field, unsigned& bit) const;

    const header_layout* layout_;
    std::vector<std::uint64_t> integers_;
    std::vector<std::vector<std::uint8_t>> bytes_;
};

// ============================================================================
// Header Codec
// ============================================================================

/**
 * Decode a fixed-layout header.
 * @param layout Record layout
 * @param data Input bytes; bytes past layout.size() are ignored
 * @param fields Destination (rebound to layout)
 * @return truncated_input if fewer than layout.size() bytes are supplied
 */
[[nodiscard]] STCI_EXPORT codec_result decode_header(const header_layout& layout,
                                                     std::span<const std::uint8_t> data,
                                                     header_fields& fields);

/**
 * Encode a header. Appends exactly layout.size() bytes to out, or nothing
 * on failure.
 * @return field_overflow if an integer does not fit its field width
 */
[[nodiscard]] STCI_EXPORT codec_result encode_header(const header_fields& fields,
                                                     std::vector<std::uint8_t>& out);

} // namespace stci

#endif // STCI_HEADER_LAYOUT_HPP_
