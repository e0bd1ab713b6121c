/*
 * File: wire_view.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-18
 * License: MIT
 */

#pragma once

#include <format>
#include <ostream>
#include <string>
#include <utility>

#include "tars/core/debug.hpp"
#include "tars/codec/header.hpp"
#include "tars/codec/primitive.hpp"
#include "tars/codec/skip.hpp"

namespace tars::codec {

	// Schema-less walk over encoded bytes. Shapes come from the wire types
	// alone, so any well formed span can be listed or dumped; malformed
	// input raises the same codec_error the decoder would.
	class wire_view {
	public:

		wire_view() = default;
		wire_view(byte_view data) : data_(data) {}
		wire_view(const byte_buffer& data) : data_(data) {}
		wire_view(byte_buffer&&) = delete;
		wire_view(const wire_view&) = default;
		wire_view& operator = (const wire_view&) = default;

		byte_view get() const { return data_; }

		// Calls fn(header, record) for every top-level record, where record
		// spans the header and the whole payload. Stops early when fn
		// returns false.
		template <class Fn>
		void for_each_field(Fn&& fn) const {
			input_cursor in(data_);
			while (!in.empty()) {
				const auto start = in.position();
				const auto hdr = read_header(in);
				skip_field(in, hdr.type);
				const auto record = data_.subspan(start, in.position() - start);
				if (!fn(hdr, record)) {
					return;
				}
			}
		}

		std::size_t field_count() const {
			std::size_t count = 0;
			for_each_field([&count](const field_header&, byte_view) {
				++count;
				return true;
			});
			return count;
		}

		std::ostream& debug_print(std::ostream& os, int indent = 0) const {
			return debug_print(os, data_, indent);
		}

		static std::ostream& debug_print(std::ostream& os, byte_view data, int indent = 0) {
			input_cursor in(data);
			while (!in.empty()) {
				const auto hdr = read_header(in);
				dump_field(os, in, hdr, indent);
			}
			return os;
		}

	PRIVATE_TESTABLE:

		static void dump_field(std::ostream& os, input_cursor& in, const field_header& hdr, int indent) {
			const auto pad = std::string(indent, ' ');
			const auto prefix = std::format("{}<{}> {}", pad, hdr.tag, to_string(hdr.type));

			switch (hdr.type) {
			case wire_type::zero_tag:
				os << prefix << ": 0\n";
				break;
			case wire_type::i8:
			case wire_type::i16:
			case wire_type::i32:
			case wire_type::i64:
				os << prefix << ": " << read_integer<std::int64_t>(in, hdr.type, hdr.tag) << "\n";
				break;
			case wire_type::fp32:
			case wire_type::fp64:
				os << prefix << ": " << std::format("{}", read_floating<double>(in, hdr.type, hdr.tag)) << "\n";
				break;
			case wire_type::string1:
			case wire_type::string4:
				os << prefix << ": \"" << read_string_view(in, hdr.type, hdr.tag) << "\"\n";
				break;
			case wire_type::simple_list: {
				const auto marker = read_header(in);
				if (marker.type != wire_type::i8) {
					throw_type_mismatch(hdr.tag, "bytes element", marker.type);
				}
				const auto bytes = in.read_view(read_length(in));
				os << prefix << ": " << std::format("[len:{}]", bytes.size()) << "\n";
				break;
			}
			case wire_type::list: {
				nesting_guard guard(in);
				const auto count = read_length(in);
				os << prefix << std::format("[{}]:", count) << "\n";
				for (std::size_t i = 0; i < count; ++i) {
					const auto item = read_header(in);
					dump_field(os, in, item, indent + 2);
				}
				break;
			}
			case wire_type::map: {
				nesting_guard guard(in);
				const auto count = read_length(in);
				os << prefix << std::format("[{}]:", count) << "\n";
				for (std::size_t i = 0; i < count * 2; ++i) {
					const auto item = read_header(in);
					dump_field(os, in, item, indent + 2);
				}
				break;
			}
			case wire_type::struct_begin: {
				nesting_guard guard(in);
				os << prefix << ":\n";
				while (true) {
					const auto item = read_header(in);
					if (item.type == wire_type::struct_end) {
						break;
					}
					dump_field(os, in, item, indent + 2);
				}
				break;
			}
			case wire_type::struct_end:
				os << prefix << "\n";
				break;
			default:
				throw_invalid_wire_type(hdr.type);
			}
		}

	private:
		byte_view data_;
	};

} // namespace tars::codec
