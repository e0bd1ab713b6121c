// tests/test_records.hpp
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include "tars/codec/field_codec.hpp"

// Hand-written records in the shape generated code would have.
namespace tars::tests {

    using codec::output_buffer;
    using codec::input_cursor;
    using core::byte_buffer;

    // {0: int32, 1: string, 2: bytes}
    struct packet {
        std::int32_t id = 0;
        std::string name;
        byte_buffer payload;

        void encode(output_buffer& out) const {
            codec::encode_int32(out, id, 0);
            codec::encode_string(out, name, 1);
            codec::encode_bytes(out, payload, 2);
        }

        void decode(input_cursor& in) {
            id = codec::decode_int32(in, 0, true);
            name = codec::decode_string(in, 1, true);
            payload = codec::decode_bytes(in, 2, true);
        }

        bool operator == (const packet&) const = default;
    };

    // An older reader of `packet` that only knows tags 0 and 1.
    struct packet_v0 {
        std::int32_t id = 0;
        std::string name;

        void encode(output_buffer& out) const {
            codec::encode_int32(out, id, 0);
            codec::encode_string(out, name, 1);
        }

        void decode(input_cursor& in) {
            id = codec::decode_int32(in, 0, true);
            name = codec::decode_string(in, 1, true);
        }

        bool operator == (const packet_v0&) const = default;
    };

    struct point {
        std::int32_t x = 0;
        std::int32_t y = 0;

        void encode(output_buffer& out) const {
            codec::encode_field(out, x, 0);
            codec::encode_field(out, y, 1);
        }

        void decode(input_cursor& in) {
            codec::decode_field(in, x, 0, true);
            codec::decode_field(in, y, 1, true);
        }

        bool operator == (const point&) const = default;
    };

    // Exercises every field kind, including an extended tag.
    struct shape {
        std::string name;
        std::vector<point> vertices;
        std::map<std::string, std::int64_t> attrs;
        point origin;
        double scale = 1.0;
        std::vector<std::string> labels;
        std::unordered_map<std::int32_t, std::vector<std::int16_t>> groups;
        std::uint16_t flags = 0;
        bool closed = false;
        float weight = 0.0f;
        std::vector<std::uint8_t> thumbnail;
        std::map<std::string, point> anchors;

        void encode(output_buffer& out) const {
            codec::encode_field(out, name, 0);
            codec::encode_field(out, vertices, 1);
            codec::encode_field(out, attrs, 2);
            codec::encode_field(out, origin, 3);
            codec::encode_field(out, scale, 4);
            codec::encode_field(out, labels, 5);
            codec::encode_field(out, groups, 6);
            codec::encode_field(out, flags, 7);
            codec::encode_field(out, closed, 14);
            codec::encode_field(out, weight, 15);
            codec::encode_field(out, thumbnail, 100);
            codec::encode_field(out, anchors, 255);
        }

        void decode(input_cursor& in) {
            codec::decode_field(in, name, 0, true);
            codec::decode_field(in, vertices, 1, true);
            codec::decode_field(in, attrs, 2, false);
            codec::decode_field(in, origin, 3, false);
            codec::decode_field(in, scale, 4, false);
            codec::decode_field(in, labels, 5, false);
            codec::decode_field(in, groups, 6, false);
            codec::decode_field(in, flags, 7, false);
            codec::decode_field(in, closed, 14, false);
            codec::decode_field(in, weight, 15, false);
            codec::decode_field(in, thumbnail, 100, false);
            codec::decode_field(in, anchors, 255, false);
        }

        bool operator == (const shape&) const = default;
    };

} // namespace tars::tests
