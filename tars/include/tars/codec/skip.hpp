/*
 * File: skip.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-18
 * License: MIT
 */

#pragma once

#include <cstdint>

#include "tars/codec/header.hpp"
#include "tars/codec/primitive.hpp"

namespace tars::codec {

	struct seek_result {
		bool found = false;
		wire_type type = wire_type::zero_tag;
		explicit operator bool() const noexcept { return found; }
	};

	inline seek_result skip_to_tag(input_cursor& in, std::uint8_t tag);
	inline void skip_field(input_cursor& in, wire_type type);

	// Element count of a list/map or byte length of a simple list. It is an
	// ordinary integer field with tag 0 that may not be wider than i32.
	inline std::size_t read_length(input_cursor& in) {
		const auto res = skip_to_tag(in, 0);
		if (!res) {
			throw_required_missing(0, "length");
		}
		const auto len = read_integer<std::int32_t>(in, res.type, 0);
		if (len < 0) {
			throw codec_error(errc::buffer_underflow, 0,
				std::format("negative length: {}", len));
		}
		return static_cast<std::size_t>(len);
	}

	inline void skip_one_field(input_cursor& in) {
		const auto hdr = read_header(in);
		skip_field(in, hdr.type);
	}

	// Consumes everything up to and including the next struct_end at this
	// nesting level. Running out of input first is an underflow.
	inline void skip_to_struct_end(input_cursor& in) {
		while (true) {
			const auto hdr = read_header(in);
			if (hdr.type == wire_type::struct_end) {
				return;
			}
			skip_field(in, hdr.type);
		}
	}

	inline void skip_field(input_cursor& in, wire_type type) {
		switch (type) {
		case wire_type::i8:
		case wire_type::i16:
		case wire_type::i32:
		case wire_type::i64:
		case wire_type::fp32:
		case wire_type::fp64:
			in.advance(fixed_size(type));
			break;
		case wire_type::string1:
			in.advance(in.read_u8());
			break;
		case wire_type::string4:
			in.advance(in.read_be<std::uint32_t>());
			break;
		case wire_type::map: {
			nesting_guard guard(in);
			const auto count = read_length(in);
			for (std::size_t i = 0; i < count * 2; ++i) {
				skip_one_field(in);
			}
			break;
		}
		case wire_type::list: {
			nesting_guard guard(in);
			const auto count = read_length(in);
			for (std::size_t i = 0; i < count; ++i) {
				skip_one_field(in);
			}
			break;
		}
		case wire_type::simple_list: {
			const auto marker = read_header(in);
			if (marker.type != wire_type::i8) {
				throw_type_mismatch(marker.tag, "simple_list element", marker.type);
			}
			in.advance(read_length(in));
			break;
		}
		case wire_type::struct_begin: {
			nesting_guard guard(in);
			skip_to_struct_end(in);
			break;
		}
		case wire_type::struct_end:
		case wire_type::zero_tag:
			break;
		default:
			throw_invalid_wire_type(type);
		}
	}

	// Moves the cursor onto the payload of `tag`. Tags are ascending inside
	// a struct, so a higher tag or the enclosing struct_end means the field
	// is absent; in that case the header is left unread.
	inline seek_result skip_to_tag(input_cursor& in, std::uint8_t tag) {
		while (!in.empty()) {
			const auto hdr = peek_header(in);
			if (hdr.type == wire_type::struct_end || hdr.tag > tag) {
				return {};
			}
			in.advance(hdr.length);
			if (hdr.tag == tag) {
				if (!is_known(hdr.type)) {
					throw_invalid_wire_type(hdr.type);
				}
				return { true, hdr.type };
			}
			skip_field(in, hdr.type);
		}
		return {};
	}

} // namespace tars::codec
