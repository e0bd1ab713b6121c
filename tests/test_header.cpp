// tests/test_header.cpp
#include "tests.hpp"

#include "tars/codec/header.hpp"
#include "tars/codec/error.hpp"

using namespace tars::core;
using namespace tars::codec;
using tars::tests::hex;

TEST_SUITE("codec/header") {

    TEST_CASE("small tags share the byte with the wire type") {
        output_buffer out;
        encode_header(out, 0, wire_type::struct_begin);
        encode_header(out, 1, wire_type::string1);
        encode_header(out, 14, wire_type::i32);
        CHECK(hex(out.view()) == "0A 16 E2");
    }

    TEST_CASE("tags from 15 take a second byte") {
        output_buffer out;
        encode_header(out, 15, wire_type::i8);
        encode_header(out, 200, wire_type::simple_list);
        encode_header(out, 255, wire_type::zero_tag);
        CHECK(hex(out.view()) == "F0 0F FD C8 FC FF");
    }

    TEST_CASE("peek does not move the cursor, read does") {
        const auto data = make_buffer({ 0x2D, 0xF3, 0x20 });
        input_cursor in(data);

        const auto first = peek_header(in);
        CHECK(first.tag == 2);
        CHECK(first.type == wire_type::simple_list);
        CHECK(first.length == 1);
        CHECK(in.position() == 0);

        read_header(in);
        CHECK(in.position() == 1);

        const auto second = peek_header(in);
        CHECK(second.tag == 32);
        CHECK(second.type == wire_type::i64);
        CHECK(second.length == 2);
        CHECK(in.position() == 1);

        read_header(in);
        CHECK(in.empty());
    }

    TEST_CASE("every tag survives the header packing") {
        for (unsigned tag = 0; tag <= 255; ++tag) {
            output_buffer out;
            encode_header(out, static_cast<std::uint8_t>(tag), wire_type::map);
            CHECK(out.size() == (tag < 15 ? 1u : 2u));
            input_cursor in(out.view());
            const auto hdr = read_header(in);
            CHECK(hdr.tag == tag);
            CHECK(hdr.type == wire_type::map);
            CHECK(in.empty());
        }
    }

    TEST_CASE("truncated headers underflow") {
        SUBCASE("empty input") {
            input_cursor in(byte_view{});
            CHECK_THROWS_AS(peek_header(in), codec_error);
        }
        SUBCASE("extended tag without its second byte") {
            const auto data = make_buffer({ 0xF2 });
            input_cursor in(data);
            try {
                peek_header(in);
                FAIL("expected underflow");
            }
            catch (const codec_error& e) {
                CHECK(e.kind() == errc::buffer_underflow);
                CHECK(e.code() == make_error_code(errc::buffer_underflow));
            }
            CHECK(in.position() == 0);
        }
    }

    TEST_CASE("error codes carry the codec category") {
        const std::error_code ec = errc::type_mismatch;
        CHECK(ec.category() == error_category());
        CHECK(std::string(ec.category().name()) == "tars.codec");
        CHECK(ec.message() == "type mismatch");

        const codec_error e(errc::required_field_missing, 7, "missing");
        CHECK(e.kind() == errc::required_field_missing);
        REQUIRE(e.tag().has_value());
        CHECK(*e.tag() == 7);
        CHECK_FALSE(codec_error(errc::invalid_wire_type, "bad").tag().has_value());
    }
}
