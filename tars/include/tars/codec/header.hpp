/*
 * File: header.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-18
 * License: MIT
 */

#pragma once

#include <cstdint>

#include "tars/core/debug.hpp"
#include "tars/codec/wire_type.hpp"
#include "tars/codec/output_buffer.hpp"
#include "tars/codec/input_cursor.hpp"

namespace tars::codec {

	// Field header layout:
	//   tag <= 14: [tag:4 | type:4]
	//   tag >= 15: [0xF:4 | type:4] [tag:8]
	struct field_header {
		std::uint8_t tag = 0;
		wire_type type = wire_type::zero_tag;
		std::size_t length = 1; // bytes occupied by the header itself
	};

	inline void encode_header(output_buffer& out, std::uint8_t tag, wire_type type) {
		const auto code = static_cast<std::uint8_t>(type);
		TARS_ASSERT(is_known(code), "unknown wire type");
		if (tag <= limits::max_inline_tag) {
			out.put(static_cast<std::uint8_t>((tag << 4) | code));
		}
		else {
			out.put(static_cast<std::uint8_t>((limits::extended_tag_nibble << 4) | code));
			out.put(tag);
		}
	}

	inline field_header peek_header(const input_cursor& in) {
		const auto first = in.peek_u8();
		field_header hdr;
		hdr.type = static_cast<wire_type>(first & 0x0F);
		hdr.tag = static_cast<std::uint8_t>(first >> 4);
		if (hdr.tag == limits::extended_tag_nibble) {
			hdr.tag = in.peek_u8(1);
			hdr.length = 2;
		}
		return hdr;
	}

	inline field_header read_header(input_cursor& in) {
		const auto hdr = peek_header(in);
		in.advance(hdr.length);
		return hdr;
	}

} // namespace tars::codec
