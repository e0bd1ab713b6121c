/*
 * File: primitive.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-18
 * License: MIT
 */

#pragma once

#include <concepts>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>

#include "tars/codec/header.hpp"

namespace tars::codec {

	namespace detail {
		template <std::integral NarrowT>
		constexpr bool fits(std::int64_t val) noexcept {
			return val >= std::numeric_limits<NarrowT>::min()
				&& val <= std::numeric_limits<NarrowT>::max();
		}
	}

	// Integers always go out in the narrowest wire type holding the value,
	// and 0 costs only the header.
	inline void encode_int64(output_buffer& out, std::int64_t val, std::uint8_t tag) {
		if (val == 0) {
			encode_header(out, tag, wire_type::zero_tag);
		}
		else if (detail::fits<std::int8_t>(val)) {
			encode_header(out, tag, wire_type::i8);
			out.put(static_cast<std::uint8_t>(static_cast<std::int8_t>(val)));
		}
		else if (detail::fits<std::int16_t>(val)) {
			encode_header(out, tag, wire_type::i16);
			out.put_be<std::int16_t>(static_cast<std::int16_t>(val));
		}
		else if (detail::fits<std::int32_t>(val)) {
			encode_header(out, tag, wire_type::i32);
			out.put_be<std::int32_t>(static_cast<std::int32_t>(val));
		}
		else {
			encode_header(out, tag, wire_type::i64);
			out.put_be<std::int64_t>(val);
		}
	}

	inline void encode_int8(output_buffer& out, std::int8_t val, std::uint8_t tag) {
		encode_int64(out, val, tag);
	}

	inline void encode_int16(output_buffer& out, std::int16_t val, std::uint8_t tag) {
		encode_int64(out, val, tag);
	}

	inline void encode_int32(output_buffer& out, std::int32_t val, std::uint8_t tag) {
		encode_int64(out, val, tag);
	}

	inline void encode_uint8(output_buffer& out, std::uint8_t val, std::uint8_t tag) {
		encode_int64(out, val, tag);
	}

	inline void encode_uint16(output_buffer& out, std::uint16_t val, std::uint8_t tag) {
		encode_int64(out, val, tag);
	}

	inline void encode_uint32(output_buffer& out, std::uint32_t val, std::uint8_t tag) {
		encode_int64(out, static_cast<std::int64_t>(val), tag);
	}

	inline void encode_bool(output_buffer& out, bool val, std::uint8_t tag) {
		encode_int64(out, val ? 1 : 0, tag);
	}

	inline void encode_float(output_buffer& out, float val, std::uint8_t tag) {
		encode_header(out, tag, wire_type::fp32);
		out.put_float<float>(val);
	}

	inline void encode_double(output_buffer& out, double val, std::uint8_t tag) {
		encode_header(out, tag, wire_type::fp64);
		out.put_float<double>(val);
	}

	inline void encode_string(output_buffer& out, std::string_view val, std::uint8_t tag) {
		if (val.size() > limits::max_short_string) {
			TARS_ASSERT(val.size() <= std::numeric_limits<std::uint32_t>::max(), "string is too long");
			encode_header(out, tag, wire_type::string4);
			out.put_be<std::uint32_t>(static_cast<std::uint32_t>(val.size()));
		}
		else {
			encode_header(out, tag, wire_type::string1);
			out.put(static_cast<std::uint8_t>(val.size()));
		}
		out.append(reinterpret_cast<const byte*>(val.data()), val.size());
	}

	// Widest wire type a field of type T accepts. Unsigned fields take one
	// step more than their signed twin: the encoder routes them through the
	// signed cascade, so uint8 200 arrives as i16 and uint32 4e9 as i64.
	template <std::integral T>
	constexpr wire_type integer_wire_type() noexcept {
		if constexpr (std::is_same_v<T, bool>) {
			return wire_type::i8;
		}
		else if constexpr (std::is_signed_v<T>) {
			if constexpr (sizeof(T) == 1) return wire_type::i8;
			else if constexpr (sizeof(T) == 2) return wire_type::i16;
			else if constexpr (sizeof(T) == 4) return wire_type::i32;
			else return wire_type::i64;
		}
		else {
			static_assert(sizeof(T) <= 4, "64-bit unsigned integers have no wire representation");
			if constexpr (sizeof(T) == 1) return wire_type::i16;
			else if constexpr (sizeof(T) == 2) return wire_type::i32;
			else return wire_type::i64;
		}
	}

	// Payload readers: the header has been consumed and the tag matched.

	template <std::integral T>
	T read_integer(input_cursor& in, wire_type found, std::uint8_t tag) {
		constexpr auto declared = integer_wire_type<T>();
		if (found == wire_type::zero_tag) {
			return T{};
		}
		if (!is_integer(found) || static_cast<std::uint8_t>(found) > static_cast<std::uint8_t>(declared)) {
			throw_type_mismatch(tag, "integer", found);
		}
		switch (found) {
		case wire_type::i8:
			return static_cast<T>(static_cast<std::int8_t>(in.read_u8()));
		case wire_type::i16:
			return static_cast<T>(in.read_be<std::int16_t>());
		case wire_type::i32:
			return static_cast<T>(in.read_be<std::int32_t>());
		default:
			return static_cast<T>(in.read_be<std::int64_t>());
		}
	}

	template <std::floating_point T>
	T read_floating(input_cursor& in, wire_type found, std::uint8_t tag) {
		switch (found) {
		case wire_type::zero_tag:
			return T{};
		case wire_type::fp32:
			return static_cast<T>(in.read_float<float>());
		case wire_type::fp64:
			if constexpr (sizeof(T) == sizeof(double)) {
				return in.read_float<double>();
			}
			break;
		default:
			break;
		}
		throw_type_mismatch(tag, sizeof(T) == sizeof(double) ? "double" : "float", found);
	}

	inline std::string_view read_string_view(input_cursor& in, wire_type found, std::uint8_t tag) {
		std::size_t len = 0;
		switch (found) {
		case wire_type::string1:
			len = in.read_u8();
			break;
		case wire_type::string4:
			len = in.read_be<std::uint32_t>();
			break;
		default:
			throw_type_mismatch(tag, "string", found);
		}
		const auto bytes = in.read_view(len);
		return std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size());
	}

} // namespace tars::codec
