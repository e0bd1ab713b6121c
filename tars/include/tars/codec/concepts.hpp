/*
 * File: codec/concepts.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-18
 * License: MIT
 */

#pragma once

#include <concepts>
#include <cstdint>
#include <utility>

#include "tars/codec/output_buffer.hpp"
#include "tars/codec/input_cursor.hpp"

namespace tars::codec::concepts {

	// A record writes its own fields, in ascending tag order, without the
	// struct_begin/struct_end brackets.
	template <typename T>
	concept Encodable = requires(const T& value, output_buffer& out) {
		{ value.encode(out) } -> std::same_as<void>;
	};

	// A record reads its own fields. It may stop short of the struct end;
	// the struct codec consumes whatever is left.
	template <typename T>
	concept Decodable = requires(T& value, input_cursor& in) {
		{ value.decode(in) } -> std::same_as<void>;
	};

	template <typename T>
	concept Struct = Encodable<T> && Decodable<T>;

	template <typename C>
	concept ElementCodec = requires(output_buffer& out, input_cursor& in,
		const typename C::value_type& value, std::uint8_t tag, bool required)
	{
		typename C::value_type;
		{ C::encode(out, value, tag) } -> std::same_as<void>;
		{ C::decode(in, tag, required) } -> std::same_as<typename C::value_type>;
	};

	template <typename M>
	concept Mapping = requires(M& map, typename M::key_type key, typename M::mapped_type value) {
		typename M::key_type;
		typename M::mapped_type;
		map.insert_or_assign(std::move(key), std::move(value));
	};

} // namespace tars::codec::concepts
