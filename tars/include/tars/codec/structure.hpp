/*
 * File: structure.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-18
 * License: MIT
 */

#pragma once

#include <cstdint>

#include "tars/codec/concepts.hpp"
#include "tars/codec/header.hpp"
#include "tars/codec/skip.hpp"

namespace tars::codec {

	template <concepts::Encodable T>
	void encode_struct(output_buffer& out, const T& value, std::uint8_t tag) {
		encode_header(out, tag, wire_type::struct_begin);
		value.encode(out);
		encode_header(out, 0, wire_type::struct_end);
	}

	// Returns false when an optional struct is absent; `value` is left as it
	// was. Fields the reader does not know about are skipped up to the
	// struct end, so the cursor always lands right after it.
	template <concepts::Decodable T>
	bool decode_struct(input_cursor& in, T& value, std::uint8_t tag, bool required) {
		const auto res = skip_to_tag(in, tag);
		if (!res) {
			if (required) {
				throw_required_missing(tag, "struct");
			}
			return false;
		}
		if (res.type != wire_type::struct_begin) {
			throw_type_mismatch(tag, "struct", res.type);
		}
		nesting_guard guard(in);
		value.decode(in);
		skip_to_struct_end(in);
		return true;
	}

	template <concepts::Decodable T>
	bool decode_struct(input_cursor& in, T* value, std::uint8_t tag, bool required) {
		if (value == nullptr) {
			throw_invalid_target(tag, "struct");
		}
		return decode_struct(in, *value, tag, required);
	}

} // namespace tars::codec
