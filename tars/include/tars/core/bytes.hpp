/*
 * File: bytes.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-18
 * License: MIT
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include <span>
#include <initializer_list>

namespace tars::core {

	using byte = std::byte;
	using byte_buffer = std::vector<byte>;
	using byte_view = std::span<const byte>;

	inline byte_view as_bytes(const std::uint8_t* data, std::size_t len) noexcept {
		return byte_view(reinterpret_cast<const byte*>(data), len);
	}

	inline byte_view as_bytes(const std::vector<std::uint8_t>& data) noexcept {
		return as_bytes(data.data(), data.size());
	}

	inline byte_buffer make_buffer(std::initializer_list<std::uint8_t> values) {
		byte_buffer result;
		result.reserve(values.size());
		for (auto v : values) {
			result.push_back(static_cast<byte>(v));
		}
		return result;
	}

} // namespace tars::core
