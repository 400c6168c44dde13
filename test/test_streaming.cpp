#include <doctest/doctest.h>
#include <stci/stci.hpp>

#include <cstdint>
#include <span>
#include <vector>

namespace {

using bytes = std::vector<std::uint8_t>;

} // namespace

TEST_CASE("Streaming: decoders") {
    SUBCASE("Input accumulates across steps") {
        stci::index_stream_decoder decoder(3, 2);
        CHECK(decoder.target_bytes() == 6);

        const bytes first = {0, 1, 2, 3};
        auto step = decoder.step(first);
        CHECK(step.status == stci::step_status::need_more_input);
        CHECK(step.consumed == 4);
        CHECK(decoder.buffered() == 4);
        CHECK_FALSE(decoder.finished());

        const bytes second = {4, 5, 6, 7};
        step = decoder.step(second);
        CHECK(step.status == stci::step_status::done);
        CHECK(step.consumed == 2);
        REQUIRE(decoder.finished());

        const bytes expected = {0, 1, 2, 3, 4, 5};
        CHECK(decoder.pixels() == expected);

        // Finished sessions consume nothing
        step = decoder.step(second);
        CHECK(step.status == stci::step_status::done);
        CHECK(step.consumed == 0);
    }

    SUBCASE("Packed pixels fed one byte at a time") {
        stci::color_stream_decoder decoder(stci::default_rgb_spec(), 2, 1, stci::pixel_format::rgb888);
        const bytes data = {0x00, 0xF8, 0x1F, 0x00};

        stci::decode_step step;
        for (std::size_t i = 0; i < data.size(); ++i) {
            step = decoder.step(std::span<const std::uint8_t>(data).subspan(i, 1));
            CHECK(step.consumed == 1);
        }
        REQUIRE(step.status == stci::step_status::done);

        const bytes expected = {255, 0, 0, 0, 0, 255};
        CHECK(decoder.pixels() == expected);
    }

    SUBCASE("Missing alpha mask decodes as opaque") {
        stci::color_stream_decoder decoder(stci::default_rgb_spec(), 1, 1, stci::pixel_format::rgba8888);
        const bytes data = {0x00, 0x00};
        REQUIRE(stci::run_decoder(decoder, data, 1).ok);

        const bytes expected = {0, 0, 0, 255};
        CHECK(decoder.pixels() == expected);
    }

    SUBCASE("Indexed output is not a truecolor target") {
        stci::color_stream_decoder decoder(stci::default_rgb_spec(), 1, 1, stci::pixel_format::indexed8);
        const bytes data = {0x00, 0x00};
        CHECK(stci::run_decoder(decoder, data, 16).error == stci::codec_error::unsupported_feature);
    }

    SUBCASE("ETRLE block must match the image size") {
        const bytes data = {0x82, 0x00, 0x81, 0x00};
        stci::etrle_stream_decoder decoder(2, 3, data.size());

        auto step = decoder.step(data);
        CHECK(step.status == stci::step_status::failed);
        CHECK(step.result.error == stci::codec_error::malformed_run);
        CHECK(decoder.pixels().empty());

        // Failure is sticky
        step = decoder.step(data);
        CHECK(step.status == stci::step_status::failed);
        CHECK(step.consumed == 0);
        CHECK(step.result.error == stci::codec_error::malformed_run);
    }

    SUBCASE("ETRLE block with padded lines") {
        const bytes data = {0x01, 0x07, 0x00, 0x82, 0x00};
        stci::etrle_stream_decoder decoder(2, 2, data.size());
        REQUIRE(stci::run_decoder(decoder, data, 2).ok);

        const bytes expected = {7, 0, 0, 0};
        CHECK(decoder.take_pixels() == expected);
    }

    SUBCASE("Data runs out") {
        stci::index_stream_decoder decoder(4, 4);
        const bytes data(10, 1);
        auto result = stci::run_decoder(decoder, data, 3);
        CHECK(result.error == stci::codec_error::truncated_input);
        CHECK_FALSE(decoder.finished());
    }

    SUBCASE("Empty image needs no input") {
        stci::index_stream_decoder decoder(0, 0);
        auto step = decoder.step({});
        CHECK(step.status == stci::step_status::done);
        CHECK(decoder.pixels().empty());
    }
}

TEST_CASE("Streaming: encoders") {
    SUBCASE("Output is sliced to the budget") {
        const bytes pixels = {10, 20, 30, 40, 50, 60, 70, 80, 90, 100};
        stci::image_view image{5, 2, stci::pixel_format::indexed8, pixels};
        stci::index_stream_encoder encoder(image);

        bytes out;
        auto step = encoder.step(4, out);
        CHECK(step.status == stci::step_status::more_pending);
        CHECK(step.produced == 4);
        step = encoder.step(4, out);
        CHECK(step.status == stci::step_status::more_pending);
        CHECK(step.produced == 4);
        step = encoder.step(4, out);
        CHECK(step.status == stci::step_status::done);
        CHECK(step.produced == 2);
        CHECK(encoder.finished());
        CHECK(out == pixels);
    }

    SUBCASE("Rows carry over between steps") {
        const bytes pixels = {
            255, 0, 0, 0, 255, 0, 0, 0, 255,
            0, 0, 0, 255, 255, 255, 255, 0, 0};
        stci::image_view image{3, 2, stci::pixel_format::rgb888, pixels};
        stci::color_stream_encoder encoder(image, stci::default_rgb_spec());

        bytes out;
        std::vector<stci::step_status> statuses;
        for (int i = 0; i < 3; ++i) {
            auto step = encoder.step(4, out);
            CHECK(step.produced == 4);
            statuses.push_back(step.status);
        }
        CHECK(statuses[0] == stci::step_status::more_pending);
        CHECK(statuses[1] == stci::step_status::more_pending);
        CHECK(statuses[2] == stci::step_status::done);

        const bytes expected = {
            0x00, 0xF8, 0xE0, 0x07, 0x1F, 0x00,
            0x00, 0x00, 0xFF, 0xFF, 0x00, 0xF8};
        CHECK(out == expected);
    }

    SUBCASE("ETRLE output is independent of the budget") {
        const bytes pixels = {0, 0, 5, 6, 0, 7, 0, 0, 0, 0, 0, 0, 1, 2, 3, 4, 5, 0};
        stci::image_view image{6, 3, stci::pixel_format::indexed8, pixels};

        bytes whole;
        REQUIRE(stci::etrle_compress(image, whole).ok);

        for (std::size_t budget : {1u, 2u, 3u, 7u, 64u}) {
            INFO("budget: " << budget);
            stci::etrle_stream_encoder encoder(image);
            bytes out;
            REQUIRE(stci::run_encoder(encoder, out, budget).ok);
            CHECK(out == whole);
        }
    }

    SUBCASE("Indexed input fails the session") {
        const bytes pixels = {1, 2, 3};
        stci::image_view image{3, 1, stci::pixel_format::indexed8, pixels};
        stci::color_stream_encoder encoder(image, stci::default_rgb_spec());

        bytes out;
        auto step = encoder.step(16, out);
        CHECK(step.status == stci::step_status::failed);
        CHECK(step.result.error == stci::codec_error::unsupported_feature);
        CHECK(out.empty());

        step = encoder.step(16, out);
        CHECK(step.status == stci::step_status::failed);
        CHECK_FALSE(encoder.finished());
    }

    SUBCASE("Short pixel data") {
        const bytes pixels = {1, 2, 3};
        stci::image_view image{2, 2, stci::pixel_format::indexed8, pixels};
        stci::index_stream_encoder encoder(image);

        bytes out;
        CHECK(stci::run_encoder(encoder, out, 2).error == stci::codec_error::truncated_input);
    }

    SUBCASE("Zero budget means the default chunk") {
        const bytes pixels(100, 3);
        stci::image_view image{10, 10, stci::pixel_format::indexed8, pixels};
        stci::index_stream_encoder encoder(image);

        bytes out;
        REQUIRE(stci::run_encoder(encoder, out, 0).ok);
        CHECK(out == pixels);
    }
}
