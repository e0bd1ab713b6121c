/*
 * File: field_codec.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-18
 * License: MIT
 */

#pragma once

#include <concepts>
#include <cstdint>
#include <iterator>
#include <map>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "tars/codec/accessors.hpp"
#include "tars/codec/container.hpp"
#include "tars/codec/structure.hpp"

namespace tars::codec {

	// Compile-time mapping from a C++ type to its wire codec. There is no
	// primary definition: an unsupported type does not compile.
	template <typename T>
	struct field_codec;

	template <std::integral T>
	struct integer_codec {
		using value_type = T;
		static void encode(output_buffer& out, const value_type& val, std::uint8_t tag) {
			encode_int64(out, static_cast<std::int64_t>(val), tag);
		}
		static value_type decode(input_cursor& in, std::uint8_t tag, bool required) {
			return decode_integer<value_type>(in, tag, required);
		}
	};

	template <std::floating_point T>
	struct floating_codec {
		using value_type = T;
		static void encode(output_buffer& out, const value_type& val, std::uint8_t tag) {
			if constexpr (sizeof(T) == sizeof(double)) {
				encode_double(out, val, tag);
			}
			else {
				encode_float(out, val, tag);
			}
		}
		static value_type decode(input_cursor& in, std::uint8_t tag, bool required) {
			return decode_floating<value_type>(in, tag, required);
		}
	};

	template <typename ByteVector>
	struct bytes_codec {
		using value_type = ByteVector;
		static void encode(output_buffer& out, const value_type& val, std::uint8_t tag) {
			encode_bytes(out, byte_view(reinterpret_cast<const byte*>(val.data()), val.size()), tag);
		}
		static value_type decode(input_cursor& in, std::uint8_t tag, bool required) {
			const auto view = decode_bytes_view(in, tag, required);
			const auto* first = reinterpret_cast<const typename value_type::value_type*>(view.data());
			return value_type(first, first + view.size());
		}
	};

	template <>
	struct field_codec<bool> {
		using value_type = bool;
		static void encode(output_buffer& out, const value_type& val, std::uint8_t tag) {
			encode_bool(out, val, tag);
		}
		static value_type decode(input_cursor& in, std::uint8_t tag, bool required) {
			return decode_bool(in, tag, required);
		}
	};

	template <>
	struct field_codec<std::int8_t> : public integer_codec<std::int8_t> {};
	template <>
	struct field_codec<std::int16_t> : public integer_codec<std::int16_t> {};
	template <>
	struct field_codec<std::int32_t> : public integer_codec<std::int32_t> {};
	template <>
	struct field_codec<std::int64_t> : public integer_codec<std::int64_t> {};

	template <>
	struct field_codec<std::uint8_t> : public integer_codec<std::uint8_t> {};
	template <>
	struct field_codec<std::uint16_t> : public integer_codec<std::uint16_t> {};
	template <>
	struct field_codec<std::uint32_t> : public integer_codec<std::uint32_t> {};

	template <>
	struct field_codec<float> : public floating_codec<float> {};
	template <>
	struct field_codec<double> : public floating_codec<double> {};

	template <>
	struct field_codec<std::string> {
		using value_type = std::string;
		static void encode(output_buffer& out, const value_type& val, std::uint8_t tag) {
			encode_string(out, val, tag);
		}
		static value_type decode(input_cursor& in, std::uint8_t tag, bool required) {
			return decode_string(in, tag, required);
		}
	};

	// Byte arrays use simple_list; every other vector is a general list.
	template <>
	struct field_codec<byte_buffer> : public bytes_codec<byte_buffer> {};
	template <>
	struct field_codec<std::vector<std::uint8_t>> : public bytes_codec<std::vector<std::uint8_t>> {};

	template <typename T, typename Alloc>
	struct field_codec<std::vector<T, Alloc>> {
		using value_type = std::vector<T, Alloc>;
		static void encode(output_buffer& out, const value_type& val, std::uint8_t tag) {
			encode_list<field_codec<T>>(out, val, tag);
		}
		static value_type decode(input_cursor& in, std::uint8_t tag, bool required) {
			auto items = decode_list<field_codec<T>>(in, tag, required);
			if constexpr (std::is_same_v<value_type, decltype(items)>) {
				return items;
			}
			else {
				return value_type(std::make_move_iterator(items.begin()), std::make_move_iterator(items.end()));
			}
		}
	};

	template <typename MapT>
	struct map_codec {
		using value_type = MapT;
		using key_codec = field_codec<typename MapT::key_type>;
		using mapped_codec = field_codec<typename MapT::mapped_type>;
		static void encode(output_buffer& out, const value_type& val, std::uint8_t tag) {
			encode_map<key_codec, mapped_codec>(out, val, tag);
		}
		static value_type decode(input_cursor& in, std::uint8_t tag, bool required) {
			return decode_map<value_type, key_codec, mapped_codec>(in, tag, required);
		}
	};

	template <typename K, typename V, typename Cmp, typename Alloc>
	struct field_codec<std::map<K, V, Cmp, Alloc>>
		: public map_codec<std::map<K, V, Cmp, Alloc>> {};

	template <typename K, typename V, typename Hash, typename Eq, typename Alloc>
	struct field_codec<std::unordered_map<K, V, Hash, Eq, Alloc>>
		: public map_codec<std::unordered_map<K, V, Hash, Eq, Alloc>> {};

	// An absent optional struct decodes to a default constructed value.
	template <concepts::Struct T>
		requires std::default_initializable<T>
	struct field_codec<T> {
		using value_type = T;
		static void encode(output_buffer& out, const value_type& val, std::uint8_t tag) {
			encode_struct(out, val, tag);
		}
		static value_type decode(input_cursor& in, std::uint8_t tag, bool required) {
			value_type val{};
			decode_struct(in, val, tag, required);
			return val;
		}
	};

	template <typename T>
	void encode_field(output_buffer& out, const T& val, std::uint8_t tag) {
		field_codec<T>::encode(out, val, tag);
	}

	template <typename T>
	T decode_field(input_cursor& in, std::uint8_t tag, bool required) {
		return field_codec<T>::decode(in, tag, required);
	}

	template <typename T>
	void decode_field(input_cursor& in, T& val, std::uint8_t tag, bool required) {
		val = field_codec<T>::decode(in, tag, required);
	}

	template <typename T>
	void decode_field(input_cursor& in, T* val, std::uint8_t tag, bool required) {
		if (val == nullptr) {
			throw_invalid_target(tag, "field");
		}
		decode_field(in, *val, tag, required);
	}

	template <typename T, typename Alloc>
	void encode_list(output_buffer& out, const std::vector<T, Alloc>& val, std::uint8_t tag) {
		encode_list<field_codec<T>>(out, val, tag);
	}

	template <typename MapT>
		requires concepts::Mapping<MapT>
	void encode_map(output_buffer& out, const MapT& val, std::uint8_t tag) {
		map_codec<MapT>::encode(out, val, tag);
	}

} // namespace tars::codec
