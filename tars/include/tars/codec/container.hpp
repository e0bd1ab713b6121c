/*
 * File: container.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-18
 * License: MIT
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <limits>
#include <ranges>
#include <utility>
#include <vector>

#include "tars/codec/accessors.hpp"
#include "tars/codec/concepts.hpp"

namespace tars::codec {

	// ----- Byte arrays: simple_list -----
	// [hdr(tag, simple_list)] [hdr(0, i8)] [i32 length at tag 0] [raw bytes]

	inline void encode_bytes(output_buffer& out, byte_view val, std::uint8_t tag) {
		TARS_ASSERT(val.size() <= static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max()),
			"byte array is too long");
		encode_header(out, tag, wire_type::simple_list);
		encode_header(out, 0, wire_type::i8);
		encode_int32(out, static_cast<std::int32_t>(val.size()), 0);
		out.append(val);
	}

	// Returns a view into the cursor's source; no bytes are copied.
	inline byte_view decode_bytes_view(input_cursor& in, std::uint8_t tag, bool required) {
		const auto res = skip_to_tag(in, tag);
		if (!res) {
			if (required) {
				throw_required_missing(tag, "bytes");
			}
			return {};
		}
		if (res.type != wire_type::simple_list) {
			throw_type_mismatch(tag, "bytes", res.type);
		}
		const auto marker = read_header(in);
		if (marker.type != wire_type::i8) {
			throw_type_mismatch(tag, "bytes element", marker.type);
		}
		return in.read_view(read_length(in));
	}

	inline byte_buffer decode_bytes(input_cursor& in, std::uint8_t tag, bool required) {
		const auto view = decode_bytes_view(in, tag, required);
		return byte_buffer(view.begin(), view.end());
	}

	// ----- Lists -----
	// [hdr(tag, list)] [i32 count at tag 0] count x [element at tag 0]

	template <concepts::ElementCodec Codec, std::ranges::sized_range Range>
	void encode_list(output_buffer& out, const Range& values, std::uint8_t tag) {
		TARS_ASSERT(std::ranges::size(values) <= static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max()),
			"list is too long");
		encode_header(out, tag, wire_type::list);
		encode_int32(out, static_cast<std::int32_t>(std::ranges::size(values)), 0);
		for (const auto& v : values) {
			Codec::encode(out, v, 0);
		}
	}

	template <concepts::ElementCodec Codec>
	std::vector<typename Codec::value_type> decode_list(input_cursor& in, std::uint8_t tag, bool required) {
		std::vector<typename Codec::value_type> result;
		const auto res = skip_to_tag(in, tag);
		if (!res) {
			if (required) {
				throw_required_missing(tag, "list");
			}
			return result;
		}
		if (res.type != wire_type::list) {
			throw_type_mismatch(tag, "list", res.type);
		}
		nesting_guard guard(in);
		const auto count = read_length(in);
		// every element costs at least one header byte
		result.reserve(std::min(count, in.remaining()));
		for (std::size_t i = 0; i < count; ++i) {
			result.push_back(Codec::decode(in, 0, true));
		}
		return result;
	}

	// ----- Maps -----
	// [hdr(tag, map)] [i32 count at tag 0] count x [key at tag 0][value at tag 1]

	template <concepts::ElementCodec KeyCodec, concepts::ElementCodec ValueCodec, typename MapT>
	void encode_map(output_buffer& out, const MapT& values, std::uint8_t tag) {
		TARS_ASSERT(values.size() <= static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max()),
			"map is too long");
		encode_header(out, tag, wire_type::map);
		encode_int32(out, static_cast<std::int32_t>(values.size()), 0);
		for (const auto& [key, value] : values) {
			KeyCodec::encode(out, key, 0);
			ValueCodec::encode(out, value, 1);
		}
	}

	// A key seen twice keeps its last value.
	template <concepts::Mapping MapT, concepts::ElementCodec KeyCodec, concepts::ElementCodec ValueCodec>
	MapT decode_map(input_cursor& in, std::uint8_t tag, bool required) {
		MapT result;
		const auto res = skip_to_tag(in, tag);
		if (!res) {
			if (required) {
				throw_required_missing(tag, "map");
			}
			return result;
		}
		if (res.type != wire_type::map) {
			throw_type_mismatch(tag, "map", res.type);
		}
		nesting_guard guard(in);
		const auto count = read_length(in);
		for (std::size_t i = 0; i < count; ++i) {
			auto key = KeyCodec::decode(in, 0, true);
			auto value = ValueCodec::decode(in, 1, true);
			result.insert_or_assign(std::move(key), std::move(value));
		}
		return result;
	}

} // namespace tars::codec
