/*
 * File: accessors.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-18
 * License: MIT
 */

#pragma once

#include <concepts>
#include <cstdint>
#include <string>

#include "tars/codec/primitive.hpp"
#include "tars/codec/skip.hpp"

namespace tars::codec {

	// Every accessor has the same shape: seek the tag, fail if a required
	// field is absent, return the zero value if an optional one is, and
	// parse the payload otherwise.

	template <std::integral T>
	T decode_integer(input_cursor& in, std::uint8_t tag, bool required) {
		const auto res = skip_to_tag(in, tag);
		if (!res) {
			if (required) {
				throw_required_missing(tag, "integer");
			}
			return T{};
		}
		return read_integer<T>(in, res.type, tag);
	}

	template <std::floating_point T>
	T decode_floating(input_cursor& in, std::uint8_t tag, bool required) {
		const auto res = skip_to_tag(in, tag);
		if (!res) {
			if (required) {
				throw_required_missing(tag, sizeof(T) == sizeof(double) ? "double" : "float");
			}
			return T{};
		}
		return read_floating<T>(in, res.type, tag);
	}

	// Only a positive value reads as true.
	inline bool decode_bool(input_cursor& in, std::uint8_t tag, bool required) {
		return decode_integer<std::int8_t>(in, tag, required) > 0;
	}

	inline std::int8_t decode_int8(input_cursor& in, std::uint8_t tag, bool required) {
		return decode_integer<std::int8_t>(in, tag, required);
	}

	inline std::int16_t decode_int16(input_cursor& in, std::uint8_t tag, bool required) {
		return decode_integer<std::int16_t>(in, tag, required);
	}

	inline std::int32_t decode_int32(input_cursor& in, std::uint8_t tag, bool required) {
		return decode_integer<std::int32_t>(in, tag, required);
	}

	inline std::int64_t decode_int64(input_cursor& in, std::uint8_t tag, bool required) {
		return decode_integer<std::int64_t>(in, tag, required);
	}

	inline std::uint8_t decode_uint8(input_cursor& in, std::uint8_t tag, bool required) {
		return decode_integer<std::uint8_t>(in, tag, required);
	}

	inline std::uint16_t decode_uint16(input_cursor& in, std::uint8_t tag, bool required) {
		return decode_integer<std::uint16_t>(in, tag, required);
	}

	inline std::uint32_t decode_uint32(input_cursor& in, std::uint8_t tag, bool required) {
		return decode_integer<std::uint32_t>(in, tag, required);
	}

	inline float decode_float(input_cursor& in, std::uint8_t tag, bool required) {
		return decode_floating<float>(in, tag, required);
	}

	inline double decode_double(input_cursor& in, std::uint8_t tag, bool required) {
		return decode_floating<double>(in, tag, required);
	}

	inline std::string decode_string(input_cursor& in, std::uint8_t tag, bool required) {
		const auto res = skip_to_tag(in, tag);
		if (!res) {
			if (required) {
				throw_required_missing(tag, "string");
			}
			return {};
		}
		return std::string(read_string_view(in, res.type, tag));
	}

} // namespace tars::codec
