#ifndef STCI_SURFACE_HPP_
#define STCI_SURFACE_HPP_

#include <stci/stci_export.h>
#include <stci/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace stci {

// ============================================================================
// Surface Interface
// ============================================================================

/**
 * Abstract base class for image surfaces.
 * The STI decoder writes pixels to surfaces, so hosts can receive decoded
 * images in whatever representation they favor.
 */
class STCI_EXPORT surface {
public:
    virtual ~surface() = default;

    /**
     * Set the surface dimensions and pixel format.
     * Called before any pixel writes.
     * @param width Image width in pixels
     * @param height Image height in pixels
     * @param format Pixel format
     * @return true if allocation succeeded
     */
    virtual bool set_size(int width, int height, pixel_format format) = 0;

    /**
     * Write a horizontal run of pixel data.
     *
     * NOTE: The x parameter is a BYTE OFFSET within the row, not a pixel coordinate.
     * For RGB formats, use x = pixel_x * 3; for RGBA, use x = pixel_x * 4.
     *
     * @param x Starting byte offset within the row (NOT pixel coordinate)
     * @param y Y coordinate (row number)
     * @param count Number of bytes to write
     * @param pixels Pointer to pixel data
     */
    virtual void write_pixels(int x, int y, int count, const std::uint8_t* pixels) = 0;

    /**
     * Set the palette size (for indexed formats).
     * @param count Number of palette entries (max 256)
     */
    virtual void set_palette_size(int count) { (void)count; }

    /**
     * Write palette entries.
     * @param start Starting palette index
     * @param colors RGB triplets (3 bytes per color)
     */
    virtual void write_palette(int start, std::span<const std::uint8_t> colors) {
        (void)start;
        (void)colors;
    }

    /**
     * Declare which palette index is transparent (indexed formats only).
     * @param index Palette index, or -1 for none
     */
    virtual void set_transparent_index(int index) { (void)index; }

    /**
     * Set a subrect for multi-image containers.
     * @param index Subrect index
     * @param sr Subrect metadata
     */
    virtual void set_subrect(int index, const subrect& sr) {
        (void)index;
        (void)sr;
    }
};

// ============================================================================
// Memory Surface (default implementation)
// ============================================================================

/**
 * Simple in-memory surface implementation.
 * Stores pixels in a contiguous buffer with optional palette.
 */
class STCI_EXPORT memory_surface : public surface {
public:
    memory_surface() = default;
    ~memory_surface() override = default;

    memory_surface(const memory_surface&) = delete;
    memory_surface& operator=(const memory_surface&) = delete;
    memory_surface(memory_surface&&) noexcept = default;
    memory_surface& operator=(memory_surface&&) noexcept = default;

    // Surface interface
    bool set_size(int width, int height, pixel_format format) override;
    void write_pixels(int x, int y, int count, const std::uint8_t* pixels) override;
    void set_palette_size(int count) override;
    void write_palette(int start, std::span<const std::uint8_t> colors) override;
    void set_transparent_index(int index) override;
    void set_subrect(int index, const subrect& sr) override;

    // Accessors (read-only)
    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] pixel_format format() const noexcept { return format_; }
    [[nodiscard]] std::span<const std::uint8_t> pixels() const noexcept { return pixels_; }
    [[nodiscard]] std::span<const std::uint8_t> palette() const noexcept { return palette_; }
    [[nodiscard]] const std::vector<subrect>& subrects() const noexcept { return subrects_; }
    [[nodiscard]] std::size_t pitch() const noexcept { return pitch_; }
    [[nodiscard]] int transparent_index() const noexcept { return transparent_index_; }

    /**
     * Pixel row y, or an empty span when out of range.
     */
    [[nodiscard]] std::span<const std::uint8_t> row(int y) const noexcept;

    /**
     * View the surface contents as encoder input.
     */
    [[nodiscard]] image_view view() const noexcept {
        return {width_, height_, format_, pixels_};
    }

private:
    std::vector<std::uint8_t> pixels_;
    std::vector<std::uint8_t> palette_;  // RGB triplets
    std::vector<subrect> subrects_;
    int width_ = 0;
    int height_ = 0;
    int transparent_index_ = -1;
    std::size_t pitch_ = 0;
    pixel_format format_ = pixel_format::rgba8888;
};

} // namespace stci

#endif // STCI_SURFACE_HPP_
