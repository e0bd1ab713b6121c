/*
 * File: error.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-18
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <format>

#include "tars/codec/wire_type.hpp"

namespace tars::codec {

	enum class errc : int {
		buffer_underflow = 1,
		required_field_missing = 2,
		type_mismatch = 3,
		invalid_wire_type = 4,
		invalid_target = 5,
	};

	class error_category_impl : public std::error_category {
	public:
		const char* name() const noexcept override {
			return "tars.codec";
		}

		std::string message(int ev) const override {
			switch (static_cast<errc>(ev)) {
			case errc::buffer_underflow:
				return "buffer underflow";
			case errc::required_field_missing:
				return "required field missing";
			case errc::type_mismatch:
				return "type mismatch";
			case errc::invalid_wire_type:
				return "invalid wire type";
			case errc::invalid_target:
				return "invalid decode target";
			}
			return "unknown codec error";
		}
	};

	inline const std::error_category& error_category() noexcept {
		static const error_category_impl instance;
		return instance;
	}

	inline std::error_code make_error_code(errc e) noexcept {
		return { static_cast<int>(e), error_category() };
	}

	class codec_error : public std::system_error {
	public:
		codec_error(errc code, const std::string& what)
			: std::system_error(make_error_code(code), what)
		{}

		codec_error(errc code, std::uint8_t tag, const std::string& what)
			: std::system_error(make_error_code(code), what)
			, tag_(tag)
		{}

		errc kind() const noexcept {
			return static_cast<errc>(code().value());
		}

		// Field tag the failure was detected on, when it is known.
		std::optional<std::uint8_t> tag() const noexcept {
			return tag_;
		}

	private:
		std::optional<std::uint8_t> tag_;
	};

	[[noreturn]] inline void throw_underflow(std::size_t need, std::size_t have) {
		throw codec_error(errc::buffer_underflow,
			std::format("need {} bytes, {} remaining", need, have));
	}

	// Reported as an underflow: the input cannot be decoded within the
	// nesting the decoder is willing to follow.
	[[noreturn]] inline void throw_too_deep(std::size_t limit) {
		throw codec_error(errc::buffer_underflow,
			std::format("nesting deeper than {} levels", limit));
	}

	[[noreturn]] inline void throw_required_missing(std::uint8_t tag, std::string_view what) {
		throw codec_error(errc::required_field_missing, tag,
			std::format("required '{}' field not exist, tag: {}", what, tag));
	}

	[[noreturn]] inline void throw_type_mismatch(std::uint8_t tag, std::string_view what, wire_type got) {
		throw codec_error(errc::type_mismatch, tag,
			std::format("read '{}' type mismatch, tag: {}, get type: {}", what, tag, describe(got)));
	}

	[[noreturn]] inline void throw_invalid_wire_type(wire_type got) {
		throw codec_error(errc::invalid_wire_type,
			std::format("invalid wire type: {}", static_cast<unsigned>(got)));
	}

	[[noreturn]] inline void throw_invalid_target(std::uint8_t tag, std::string_view what) {
		throw codec_error(errc::invalid_target, tag,
			std::format("decode '{}' into a null target, tag: {}", what, tag));
	}

} // namespace tars::codec

namespace std {
	template <>
	struct is_error_code_enum<tars::codec::errc> : true_type {};
} // namespace std
