/*
 * File: byteorder.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-18
 * License: MIT
 */

#pragma once

#include <bit>
#include <concepts>
#include <type_traits>

#include "tars/core/bytes.hpp"

// The wire format is big-endian only; there is no little-endian path.
namespace tars::core::byteorder {

	template <typename T>
	concept SignedWord = std::is_integral_v<T> && std::is_signed_v<T> &&
		((sizeof(T) == 2) || (sizeof(T) == 4) || (sizeof(T) == 8));

	template <typename T>
	concept UnsignedWord = std::is_integral_v<T> && std::is_unsigned_v<T> &&
		((sizeof(T) == 2) || (sizeof(T) == 4) || (sizeof(T) == 8));

	template <typename T>
	concept Word = SignedWord<T> || UnsignedWord<T>;

	template <typename T>
	concept FloatWord = std::floating_point<T> &&
		((sizeof(T) == 4) || (sizeof(T) == 8));

	template <std::size_t Size>
	struct unsigned_of_size;
	template <> struct unsigned_of_size<2> { using type = std::uint16_t; };
	template <> struct unsigned_of_size<4> { using type = std::uint32_t; };
	template <> struct unsigned_of_size<8> { using type = std::uint64_t; };

	template <std::size_t Size>
	using unsigned_of_size_t = typename unsigned_of_size<Size>::type;

	template <UnsignedWord WordT>
	constexpr inline WordT be_to_native_unsigned(const core::byte* mem) {
		WordT result = 0;
		for (std::size_t i = 0; i < sizeof(WordT); ++i) {
			result = static_cast<WordT>((result << 8) | static_cast<WordT>(mem[i]));
		}
		return result;
	}

	template <UnsignedWord WordT>
	constexpr inline void native_to_be_unsigned(WordT val, core::byte* mem) {
		for (std::size_t i = sizeof(WordT); i > 0; --i) {
			mem[i - 1] = static_cast<core::byte>(val & 0xFF);
			val = static_cast<WordT>(val >> 8);
		}
	}

	template <SignedWord WordT>
	constexpr inline WordT be_to_native_signed(const core::byte* mem) {
		using unsigned_type = std::make_unsigned_t<WordT>;
		const unsigned_type uns = be_to_native_unsigned<unsigned_type>(mem);
		return std::bit_cast<WordT>(uns);
	}

	template <SignedWord WordT>
	constexpr inline void native_to_be_signed(WordT val, core::byte* mem) {
		using unsigned_type = std::make_unsigned_t<WordT>;
		const unsigned_type uns = std::bit_cast<unsigned_type>(val);
		native_to_be_unsigned<unsigned_type>(uns, mem);
	}

	template <Word WordT>
	constexpr inline WordT be_to_native(const core::byte* mem) {
		if constexpr (std::is_unsigned_v<WordT>) {
			return be_to_native_unsigned<WordT>(mem);
		}
		else {
			return be_to_native_signed<WordT>(mem);
		}
	}

	template <Word WordT>
	constexpr inline void native_to_be(WordT val, core::byte* mem) {
		if constexpr (std::is_unsigned_v<WordT>) {
			native_to_be_unsigned<WordT>(val, mem);
		}
		else {
			native_to_be_signed<WordT>(val, mem);
		}
	}

	// IEEE-754 values travel as their bit pattern in network order.
	template <FloatWord FloatT>
	constexpr inline FloatT be_to_native_float(const core::byte* mem) {
		using bits_type = unsigned_of_size_t<sizeof(FloatT)>;
		return std::bit_cast<FloatT>(be_to_native_unsigned<bits_type>(mem));
	}

	template <FloatWord FloatT>
	constexpr inline void native_to_be_float(FloatT val, core::byte* mem) {
		using bits_type = unsigned_of_size_t<sizeof(FloatT)>;
		native_to_be_unsigned<bits_type>(std::bit_cast<bits_type>(val), mem);
	}

} // namespace tars::core::byteorder
