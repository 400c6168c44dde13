#include <doctest/doctest.h>
#include <stci/stci.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace {

std::vector<std::uint8_t> bytes_of(const std::string& s) {
    return {s.begin(), s.end()};
}

std::vector<std::uint8_t> concat(std::initializer_list<std::vector<std::uint8_t>> parts) {
    std::vector<std::uint8_t> out;
    for (const auto& p : parts) {
        out.insert(out.end(), p.begin(), p.end());
    }
    return out;
}

} // namespace

TEST_CASE("Header layout: sizes") {
    CHECK(stci::sti_header_layout().size() == 64);
    CHECK(stci::sti_truecolor_header_layout().size() == 20);
    CHECK(stci::sti_indexed_header_layout().size() == 20);
    CHECK(stci::sti_subimage_header_layout().size() == 16);
    CHECK(stci::aux_object_data_layout().size() == 16);
}

TEST_CASE("Header layout: field lookup and offsets") {
    const stci::header_layout layout("Test", {
        {"a", stci::field_type::integer, 1},
        {"", stci::field_type::padding, 2},
        {"b", stci::field_type::integer, 3},
        {"tag", stci::field_type::bytes, 2},
    });

    CHECK(layout.size() == 8);
    CHECK(layout.field_index("a") == 0);
    CHECK(layout.field_index("b") == 2);
    CHECK(layout.field_index("tag") == 3);
    CHECK(layout.field_index("") == -1);
    CHECK(layout.field_index("missing") == -1);
    CHECK(layout.offset_of(2) == 3);
    CHECK(layout.offset_of(3) == 6);
}

TEST_CASE("Header layout: decode") {
    SUBCASE("Truecolor format header") {
        const std::vector<std::uint8_t> data = {
            0x01, 0x00, 0x00, 0x00, 0x02, 0x00, 0x00, 0x00,
            0x03, 0x00, 0x00, 0x00, 0x04, 0x00, 0x00, 0x00,
            0x05, 0x06, 0x07, 0x08};

        stci::header_fields fields(stci::sti_truecolor_header_layout());
        REQUIRE(stci::decode_header(stci::sti_truecolor_header_layout(), data, fields).ok);

        CHECK(fields.get("red_color_mask") == 1);
        CHECK(fields.get("green_color_mask") == 2);
        CHECK(fields.get("blue_color_mask") == 3);
        CHECK(fields.get("alpha_channel_mask") == 4);
        CHECK(fields.get("red_color_depth") == 5);
        CHECK(fields.get("green_color_depth") == 6);
        CHECK(fields.get("blue_color_depth") == 7);
        CHECK(fields.get("alpha_channel_depth") == 8);
    }

    SUBCASE("Indexed format header") {
        std::vector<std::uint8_t> data = {0x01, 0x00, 0x00, 0x00, 0x02, 0x00, 0x03, 0x04, 0x05};
        data.resize(20, 0);

        stci::header_fields fields(stci::sti_indexed_header_layout());
        REQUIRE(stci::decode_header(stci::sti_indexed_header_layout(), data, fields).ok);

        CHECK(fields.get("number_of_palette_colors") == 1);
        CHECK(fields.get("number_of_images") == 2);
        CHECK(fields.get("red_color_depth") == 3);
        CHECK(fields.get("green_color_depth") == 4);
        CHECK(fields.get("blue_color_depth") == 5);
    }

    SUBCASE("Main header") {
        const auto data = concat({
            bytes_of("TEST"),
            {0x01, 0x00, 0x00, 0x00}, {0x02, 0x00, 0x00, 0x00},
            {0x03, 0x00, 0x00, 0x00}, {0x04, 0x00, 0x00, 0x00},
            {0x05, 0x00}, {0x06, 0x00},
            bytes_of("a"), std::vector<std::uint8_t>(18, 0x01), bytes_of("b"),
            {0x07, 0x00, 0x00, 0x00},
            {0x08, 0x00, 0x00, 0x00},
            std::vector<std::uint8_t>(12, 0x00)});
        REQUIRE(data.size() == 64);

        stci::header_fields fields(stci::sti_header_layout());
        REQUIRE(stci::decode_header(stci::sti_header_layout(), data, fields).ok);

        const auto id = fields.get_bytes("file_identifier");
        CHECK(std::string(id.begin(), id.end()) == "TEST");
        CHECK(fields.get("initial_size") == 1);
        CHECK(fields.get("size_after_compression") == 2);
        CHECK(fields.get("transparent_color") == 3);
        CHECK(fields.get("flags") == 4);
        CHECK(fields.get("height") == 5);
        CHECK(fields.get("width") == 6);
        const auto format = fields.get_bytes("format_specific_header");
        REQUIRE(format.size() == 20);
        CHECK(format[0] == 'a');
        CHECK(format[1] == 0x01);
        CHECK(format[19] == 'b');
        CHECK(fields.get("color_depth") == 7);
        CHECK(fields.get("aux_data_size") == 8);
    }

    SUBCASE("One byte short is truncated") {
        const std::vector<std::uint8_t> data(15, 0);
        stci::header_fields fields(stci::sti_subimage_header_layout());
        auto result = stci::decode_header(stci::sti_subimage_header_layout(), data, fields);
        CHECK_FALSE(result.ok);
        CHECK(result.error == stci::codec_error::truncated_input);
        CHECK(result.message.find("StiSubImageHeader") != std::string::npos);
    }

    SUBCASE("Excess bytes are ignored") {
        std::vector<std::uint8_t> data = {0x01, 0x02, 0x03, 0x00, 0x00, 0x00, 0x00, 0x04,
                                          0x05, 0x06, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
        data.push_back(0xFF);
        data.push_back(0xFF);

        stci::header_fields fields(stci::aux_object_data_layout());
        REQUIRE(stci::decode_header(stci::aux_object_data_layout(), data, fields).ok);
        CHECK(fields.get("wall_orientation") == 1);
        CHECK(fields.get("number_of_tiles") == 2);
        CHECK(fields.get("tile_location_index") == 3);
        CHECK(fields.get("current_frame") == 4);
        CHECK(fields.get("number_of_frames") == 5);
        CHECK(fields.get("flags") == 6);
    }
}

TEST_CASE("Header layout: encode") {
    SUBCASE("Truecolor format header bytes") {
        stci::header_fields fields(stci::sti_truecolor_header_layout());
        REQUIRE(fields.set("red_color_mask", 8).ok);
        REQUIRE(fields.set("green_color_mask", 7).ok);
        REQUIRE(fields.set("blue_color_mask", 6).ok);
        REQUIRE(fields.set("alpha_channel_mask", 5).ok);
        REQUIRE(fields.set("red_color_depth", 4).ok);
        REQUIRE(fields.set("green_color_depth", 3).ok);
        REQUIRE(fields.set("blue_color_depth", 2).ok);
        REQUIRE(fields.set("alpha_channel_depth", 1).ok);

        std::vector<std::uint8_t> out;
        REQUIRE(stci::encode_header(fields, out).ok);

        const std::vector<std::uint8_t> expected = {
            0x08, 0x00, 0x00, 0x00, 0x07, 0x00, 0x00, 0x00,
            0x06, 0x00, 0x00, 0x00, 0x05, 0x00, 0x00, 0x00,
            0x04, 0x03, 0x02, 0x01};
        CHECK(out == expected);
    }

    SUBCASE("Main header bytes with zeroed padding") {
        const std::vector<std::uint8_t> id = bytes_of("STSI");
        auto format = concat({bytes_of("b"), std::vector<std::uint8_t>(18, 0x01), bytes_of("a")});

        stci::header_fields fields(stci::sti_header_layout());
        REQUIRE(fields.set_bytes("file_identifier", id).ok);
        REQUIRE(fields.set("initial_size", 8).ok);
        REQUIRE(fields.set("size_after_compression", 7).ok);
        REQUIRE(fields.set("transparent_color", 6).ok);
        REQUIRE(fields.set("flags", 5).ok);
        REQUIRE(fields.set("height", 4).ok);
        REQUIRE(fields.set("width", 3).ok);
        REQUIRE(fields.set_bytes("format_specific_header", format).ok);
        REQUIRE(fields.set("color_depth", 2).ok);
        REQUIRE(fields.set("aux_data_size", 1).ok);

        std::vector<std::uint8_t> out;
        REQUIRE(stci::encode_header(fields, out).ok);

        const auto expected = concat({
            bytes_of("STSI"),
            {0x08, 0x00, 0x00, 0x00}, {0x07, 0x00, 0x00, 0x00},
            {0x06, 0x00, 0x00, 0x00}, {0x05, 0x00, 0x00, 0x00},
            {0x04, 0x00}, {0x03, 0x00},
            format,
            {0x02, 0x00, 0x00, 0x00},
            {0x01, 0x00, 0x00, 0x00},
            std::vector<std::uint8_t>(12, 0x00)});
        CHECK(out == expected);
    }

    SUBCASE("Decode then encode reproduces exact input") {
        std::vector<std::uint8_t> data = {0x06, 0x00, 0x00, 0x00, 0x05, 0x00, 0x00, 0x00,
                                          0x04, 0x00, 0x03, 0x00, 0x02, 0x00, 0x01, 0x00};
        stci::header_fields fields(stci::sti_subimage_header_layout());
        REQUIRE(stci::decode_header(stci::sti_subimage_header_layout(), data, fields).ok);

        std::vector<std::uint8_t> out;
        REQUIRE(stci::encode_header(fields, out).ok);
        CHECK(out == data);
    }

    SUBCASE("Nonzero padding is not carried over") {
        std::vector<std::uint8_t> data(20, 0xAA);
        stci::header_fields fields(stci::sti_indexed_header_layout());
        REQUIRE(stci::decode_header(stci::sti_indexed_header_layout(), data, fields).ok);

        std::vector<std::uint8_t> out;
        REQUIRE(stci::encode_header(fields, out).ok);
        REQUIRE(out.size() == 20);
        for (std::size_t i = 9; i < 20; ++i) {
            CHECK(out[i] == 0);
        }
    }

    SUBCASE("Value too wide for its field") {
        stci::header_fields fields(stci::sti_header_layout());
        REQUIRE(fields.set("width", 70000).ok);

        std::vector<std::uint8_t> out = {0xEE};
        auto result = stci::encode_header(fields, out);
        CHECK_FALSE(result.ok);
        CHECK(result.error == stci::codec_error::field_overflow);
        CHECK(result.message.find("width") != std::string::npos);
        CHECK(out.size() == 1);  // nothing appended
    }

    SUBCASE("Encoding appends") {
        stci::header_fields fields(stci::aux_object_data_layout());
        std::vector<std::uint8_t> out = {0xEE};
        REQUIRE(stci::encode_header(fields, out).ok);
        CHECK(out.size() == 17);
        CHECK(out[0] == 0xEE);
    }
}

TEST_CASE("Header layout: field errors") {
    stci::header_fields fields(stci::sti_header_layout());

    SUBCASE("Unknown integer field") {
        auto result = fields.set("depth", 1);
        CHECK(result.error == stci::codec_error::unknown_field);
        CHECK(fields.get("depth") == 0);
    }

    SUBCASE("Integer set on a byte field") {
        CHECK(fields.set("file_identifier", 1).error == stci::codec_error::unknown_field);
    }

    SUBCASE("Byte field of the wrong width") {
        const std::vector<std::uint8_t> id = bytes_of("STC");
        auto result = fields.set_bytes("file_identifier", id);
        CHECK(result.error == stci::codec_error::field_overflow);
    }
}

TEST_CASE("Header layout: flags") {
    stci::header_fields fields(stci::sti_header_layout());

    SUBCASE("Flags accumulate bits") {
        REQUIRE(fields.set_flag("RGB", true).ok);
        CHECK(fields.get("flags") == 4);
        REQUIRE(fields.set_flag("INDEXED", true).ok);
        CHECK(fields.get("flags") == 12);
        REQUIRE(fields.set_flag("ZLIB", true).ok);
        CHECK(fields.get("flags") == 28);
        REQUIRE(fields.set_flag("ETRLE", true).ok);
        CHECK(fields.get("flags") == 60);
        REQUIRE(fields.set_flag("AUX_OBJECT_DATA", true).ok);
        CHECK(fields.get("flags") == 61);
    }

    SUBCASE("Clearing and reading") {
        REQUIRE(fields.set("flags", 0x2C).ok);
        bool value = false;
        REQUIRE(fields.get_flag("ETRLE", value).ok);
        CHECK(value);
        REQUIRE(fields.set_flag("ETRLE", false).ok);
        REQUIRE(fields.get_flag("ETRLE", value).ok);
        CHECK_FALSE(value);
        CHECK(fields.get("flags") == 0x0C);
    }

    SUBCASE("Unknown flag") {
        bool value = false;
        CHECK(fields.get_flag("FULL_TILE", value).error == stci::codec_error::unknown_flag);
        CHECK(fields.set_flag("PALETTE", true).error == stci::codec_error::unknown_flag);
    }

    SUBCASE("Layout without flags") {
        stci::header_fields sub(stci::sti_subimage_header_layout());
        CHECK(sub.set_flag("RGB", true).error == stci::codec_error::unknown_flag);
    }

    SUBCASE("Tile flags") {
        stci::header_fields aux(stci::aux_object_data_layout());
        REQUIRE(aux.set_flag("USES_LAND_Z", true).ok);
        REQUIRE(aux.set_flag("FULL_TILE", true).ok);
        CHECK(aux.get("flags") == 0x21);
    }
}
