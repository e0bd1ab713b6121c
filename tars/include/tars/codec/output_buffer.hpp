/*
 * File: output_buffer.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-18
 * License: MIT
 */

#pragma once

#include <cstring>
#include <utility>

#include "tars/core/bytes.hpp"
#include "tars/core/byteorder.hpp"

namespace tars::codec {

	namespace byteorder = core::byteorder;

	using core::byte;
	using core::byte_buffer;
	using core::byte_view;

	// Append-only sink for one encode call. Not shared between encoders.
	class output_buffer {
	public:
		output_buffer() = default;
		explicit output_buffer(std::size_t reserve) {
			buffer_.reserve(reserve);
		}

		output_buffer(const output_buffer&) = delete;
		output_buffer& operator = (const output_buffer&) = delete;
		output_buffer(output_buffer&&) = default;
		output_buffer& operator = (output_buffer&&) = default;

		output_buffer& put(std::uint8_t val) {
			buffer_.push_back(static_cast<byte>(val));
			return *this;
		}

		template <byteorder::Word WordT>
		output_buffer& put_be(WordT val) {
			const auto old_size = grow(sizeof(WordT));
			byteorder::native_to_be<WordT>(val, buffer_.data() + old_size);
			return *this;
		}

		template <byteorder::FloatWord FloatT>
		output_buffer& put_float(FloatT val) {
			const auto old_size = grow(sizeof(FloatT));
			byteorder::native_to_be_float<FloatT>(val, buffer_.data() + old_size);
			return *this;
		}

		output_buffer& append(const byte* data, std::size_t len) {
			if (len == 0) {
				return *this;
			}
			const auto old_size = grow(len);
			std::memcpy(buffer_.data() + old_size, data, len);
			return *this;
		}

		output_buffer& append(byte_view data) {
			return append(data.data(), data.size());
		}

		std::size_t size() const noexcept {
			return buffer_.size();
		}

		bool empty() const noexcept {
			return buffer_.empty();
		}

		const byte* data() const noexcept { return buffer_.data(); }

		byte_view view() const {
			return byte_view(buffer_.data(), buffer_.size());
		}

		void clear() noexcept {
			buffer_.clear();
		}

		byte_buffer release() {
			return std::exchange(buffer_, {});
		}

	private:

		std::size_t grow(std::size_t len) {
			const auto old_size = buffer_.size();
			buffer_.resize(old_size + len);
			return old_size;
		}

		byte_buffer buffer_;
	};

} // namespace tars::codec
