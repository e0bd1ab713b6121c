/*
 * File: wire_type.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-18
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <format>

namespace tars::codec {

	// Low nibble of every field header.
	enum class wire_type : std::uint8_t {
		i8 = 0,
		i16 = 1,
		i32 = 2,
		i64 = 3,
		fp32 = 4,
		fp64 = 5,
		string1 = 6,
		string4 = 7,
		map = 8,
		list = 9,
		struct_begin = 10,
		struct_end = 11,
		zero_tag = 12,
		simple_list = 13,
	};

	struct limits {
		// tags up to this value share the header byte with the wire type
		static constexpr std::uint8_t max_inline_tag = 14;
		static constexpr std::uint8_t extended_tag_nibble = 0x0F;
		static constexpr std::size_t max_short_string = 255;
		// struct/list/map levels a decoder or skipper will descend into
		static constexpr std::size_t max_depth = 128;
	};

	constexpr inline bool is_known(std::uint8_t code) noexcept {
		return code <= static_cast<std::uint8_t>(wire_type::simple_list);
	}

	constexpr inline bool is_known(wire_type t) noexcept {
		return is_known(static_cast<std::uint8_t>(t));
	}

	constexpr inline bool is_integer(wire_type t) noexcept {
		return t == wire_type::i8 || t == wire_type::i16
			|| t == wire_type::i32 || t == wire_type::i64;
	}

	// Payload width of the fixed-size types, 0 for everything else.
	constexpr inline std::size_t fixed_size(wire_type t) noexcept {
		switch (t) {
		case wire_type::i8: return 1;
		case wire_type::i16: return 2;
		case wire_type::i32: return 4;
		case wire_type::i64: return 8;
		case wire_type::fp32: return 4;
		case wire_type::fp64: return 8;
		default: return 0;
		}
	}

	constexpr inline std::string_view to_string(wire_type t) noexcept {
		switch (t) {
		case wire_type::i8: return "i8";
		case wire_type::i16: return "i16";
		case wire_type::i32: return "i32";
		case wire_type::i64: return "i64";
		case wire_type::fp32: return "fp32";
		case wire_type::fp64: return "fp64";
		case wire_type::string1: return "string1";
		case wire_type::string4: return "string4";
		case wire_type::map: return "map";
		case wire_type::list: return "list";
		case wire_type::struct_begin: return "struct_begin";
		case wire_type::struct_end: return "struct_end";
		case wire_type::zero_tag: return "zero_tag";
		case wire_type::simple_list: return "simple_list";
		}
		return "unknown";
	}

	inline std::string describe(wire_type t) {
		return std::format("{}({})", to_string(t), static_cast<unsigned>(t));
	}

} // namespace tars::codec
