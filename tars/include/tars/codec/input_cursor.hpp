/*
 * File: input_cursor.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-18
 * License: MIT
 */

#pragma once

#include "tars/core/bytes.hpp"
#include "tars/core/byteorder.hpp"
#include "tars/codec/error.hpp"

namespace tars::codec {

	namespace byteorder = core::byteorder;

	using core::byte;
	using core::byte_buffer;
	using core::byte_view;

	// Forward-only reader over caller-owned bytes. Every read is bounds
	// checked and fails with errc::buffer_underflow; nothing is consumed
	// by a failed read.
	class input_cursor {
	public:

		input_cursor() = default;
		input_cursor(byte_view data) : data_(data) {}
		input_cursor(const byte_buffer& data) : data_(data) {}
		input_cursor(byte_buffer&&) = delete;

		std::size_t position() const noexcept { return pos_; }
		std::size_t remaining() const noexcept { return data_.size() - pos_; }
		bool empty() const noexcept { return pos_ == data_.size(); }

		byte_view source() const noexcept { return data_; }
		byte_view rest() const noexcept { return data_.subspan(pos_); }

		void require(std::size_t n) const {
			if (n > remaining()) {
				throw_underflow(n, remaining());
			}
		}

		std::uint8_t peek_u8(std::size_t offset = 0) const {
			require(offset + 1);
			return std::to_integer<std::uint8_t>(data_[pos_ + offset]);
		}

		void advance(std::size_t n) {
			require(n);
			pos_ += n;
		}

		std::uint8_t read_u8() {
			const auto val = peek_u8();
			++pos_;
			return val;
		}

		template <byteorder::Word WordT>
		WordT read_be() {
			require(sizeof(WordT));
			const auto val = byteorder::be_to_native<WordT>(data_.data() + pos_);
			pos_ += sizeof(WordT);
			return val;
		}

		template <byteorder::FloatWord FloatT>
		FloatT read_float() {
			require(sizeof(FloatT));
			const auto val = byteorder::be_to_native_float<FloatT>(data_.data() + pos_);
			pos_ += sizeof(FloatT);
			return val;
		}

		byte_view read_view(std::size_t n) {
			require(n);
			const auto val = data_.subspan(pos_, n);
			pos_ += n;
			return val;
		}

		std::size_t depth() const noexcept { return depth_; }

		void enter() {
			if (depth_ >= limits::max_depth) {
				throw_too_deep(limits::max_depth);
			}
			++depth_;
		}

		void leave() noexcept {
			--depth_;
		}

	private:
		byte_view data_;
		std::size_t pos_ = 0;
		std::size_t depth_ = 0;
	};

	// Holds one level of struct/list/map nesting for its lifetime.
	class nesting_guard {
	public:
		explicit nesting_guard(input_cursor& in) : in_(in) {
			in_.enter();
		}

		~nesting_guard() {
			in_.leave();
		}

		nesting_guard(const nesting_guard&) = delete;
		nesting_guard& operator = (const nesting_guard&) = delete;

	private:
		input_cursor& in_;
	};

} // namespace tars::codec
