// tests/test_wire_view.cpp
#include "tests.hpp"
#include "test_records.hpp"

#include "tars/codec/wire_view.hpp"

#include <map>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

using namespace tars::core;
using namespace tars::codec;
using tars::tests::hex;
using tars::tests::point;

static output_buffer make_mixed_record() {
    output_buffer out;
    encode_int32(out, 0, 0);
    encode_int32(out, -5, 1);
    encode_double(out, 1.5, 2);
    encode_string(out, "hi", 3);
    encode_bytes(out, make_buffer({ 1, 2, 3 }), 4);
    encode_list(out, std::vector<std::int32_t>{ 7, 300 }, 5);
    encode_map(out, std::map<std::string, std::int32_t>{ { "k", 1 } }, 6);
    encode_struct(out, point{ 1, 0 }, 20);
    return out;
}

static std::string dump(byte_view data, int indent = 0) {
    std::ostringstream os;
    wire_view::debug_print(os, data, indent);
    return os.str();
}

TEST_SUITE("codec/wire_view") {

    TEST_CASE("for_each_field walks top-level records") {
        const auto out = make_mixed_record();
        wire_view view(out.view());

        std::vector<std::uint8_t> tags;
        std::vector<wire_type> types;
        std::string last;
        view.for_each_field([&](const field_header& hdr, byte_view record) {
            tags.push_back(hdr.tag);
            types.push_back(hdr.type);
            last = hex(record);
            return true;
        });

        CHECK(tags == std::vector<std::uint8_t>{ 0, 1, 2, 3, 4, 5, 6, 20 });
        CHECK(types.front() == wire_type::zero_tag);
        CHECK(types[4] == wire_type::simple_list);
        CHECK(types.back() == wire_type::struct_begin);
        CHECK(last == "FA 14 00 01 1C 0B");
        CHECK(view.field_count() == 8);
    }

    TEST_CASE("for_each_field stops when asked") {
        const auto out = make_mixed_record();
        wire_view view(out.view());

        int visited = 0;
        view.for_each_field([&](const field_header&, byte_view) {
            return ++visited < 2;
        });
        CHECK(visited == 2);
    }

    TEST_CASE("empty view") {
        wire_view view;
        CHECK(view.get().empty());
        CHECK(view.field_count() == 0);
        std::ostringstream os;
        view.debug_print(os);
        CHECK(os.str().empty());
    }

    TEST_CASE("debug_print renders the tree") {
        const auto out = make_mixed_record();
        const std::string expected =
            "<0> zero_tag: 0\n"
            "<1> i8: -5\n"
            "<2> fp64: 1.5\n"
            "<3> string1: \"hi\"\n"
            "<4> simple_list: [len:3]\n"
            "<5> list[2]:\n"
            "  <0> i8: 7\n"
            "  <0> i16: 300\n"
            "<6> map[1]:\n"
            "  <0> string1: \"k\"\n"
            "  <1> i8: 1\n"
            "<20> struct_begin:\n"
            "  <0> i8: 1\n"
            "  <1> zero_tag: 0\n";
        CHECK(dump(out.view()) == expected);

        std::ostringstream os;
        wire_view(out.view()).debug_print(os);
        CHECK(os.str() == expected);
    }

    TEST_CASE("debug_print indents nested structs") {
        output_buffer out;
        encode_header(out, 0, wire_type::struct_begin);
        encode_struct(out, point{ 2, 3 }, 1);
        encode_header(out, 0, wire_type::struct_end);

        CHECK(dump(out.view(), 2) ==
            "  <0> struct_begin:\n"
            "    <1> struct_begin:\n"
            "      <0> i8: 2\n"
            "      <1> i8: 3\n");
    }

    TEST_CASE("dump_field consumes exactly one field") {
        output_buffer out;
        encode_string(out, std::string(256, 's'), 9);
        encode_int32(out, 1, 10);

        input_cursor in(out.view());
        const auto hdr = read_header(in);
        std::ostringstream os;
        wire_view::dump_field(os, in, hdr, 4);
        CHECK(os.str() == "    <9> string4: \"" + std::string(256, 's') + "\"\n");
        CHECK(decode_int32(in, 10, true) == 1);
    }

    TEST_CASE("malformed input raises codec errors") {
        SUBCASE("unknown wire type") {
            const auto data = make_buffer({ 0x0F });
            try {
                dump(data);
                FAIL("expected invalid wire type");
            }
            catch (const codec_error& e) {
                CHECK(e.kind() == errc::invalid_wire_type);
            }
            CHECK_THROWS_AS(wire_view(data).field_count(), codec_error);
        }
        SUBCASE("truncated list") {
            const auto data = make_buffer({ 0x09, 0x00, 0x02, 0x0C });
            try {
                dump(data);
                FAIL("expected underflow");
            }
            catch (const codec_error& e) {
                CHECK(e.kind() == errc::buffer_underflow);
            }
        }
        SUBCASE("bad simple list marker") {
            const auto data = make_buffer({ 0x3D, 0x06, 0x00 });
            try {
                dump(data);
                FAIL("expected type mismatch");
            }
            catch (const codec_error& e) {
                CHECK(e.kind() == errc::type_mismatch);
                CHECK(*e.tag() == 3);
            }
        }
    }

    TEST_CASE("runaway nesting is cut off") {
        byte_buffer data(100000, byte{ 0x0A });
        try {
            dump(data);
            FAIL("expected nesting limit");
        }
        catch (const codec_error& e) {
            CHECK(e.kind() == errc::buffer_underflow);
        }
        CHECK_THROWS_AS(wire_view(data).field_count(), codec_error);
    }

    TEST_CASE("views only borrow named buffers") {
        static_assert(std::is_constructible_v<wire_view, const byte_buffer&>);
        static_assert(!std::is_constructible_v<wire_view, byte_buffer&&>);
        const auto data = make_buffer({ 0x0C });
        CHECK(wire_view(data).get().data() == data.data());
    }
}
