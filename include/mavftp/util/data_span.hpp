#pragma once

#include "../core/types.hpp"
#include "bitfield.hpp"
#include <datapod/datapod.hpp>

namespace mavftp {
    namespace util {

        // ─── Read-only view over a received byte buffer ──────────────────────────────
        // Unlike raw indexing, the typed getters never read past size(); callers
        // must check has() before trusting a multi-byte field.
        class DataSpan {
            const u8 *data_ = nullptr;
            usize size_ = 0;

          public:
            constexpr DataSpan() = default;
            constexpr DataSpan(const u8 *data, usize size) : data_(data), size_(size) {}
            DataSpan(const dp::Vector<u8> &vec) : data_(vec.data()), size_(vec.size()) {}

            template <usize N> constexpr DataSpan(const dp::Array<u8, N> &arr) : data_(arr.data()), size_(N) {}

            constexpr const u8 *data() const noexcept { return data_; }
            constexpr usize size() const noexcept { return size_; }
            constexpr bool empty() const noexcept { return size_ == 0; }

            // True if [offset, offset + count) lies inside the span
            constexpr bool has(usize offset, usize count) const noexcept {
                return offset <= size_ && count <= size_ - offset;
            }

            constexpr u8 operator[](usize idx) const noexcept { return idx < size_ ? data_[idx] : 0; }

            constexpr DataSpan subspan(usize offset, usize count) const noexcept {
                if (offset >= size_)
                    return {};
                usize actual = (count > size_ - offset) ? (size_ - offset) : count;
                return DataSpan(data_ + offset, actual);
            }

            u8 get_u8(usize offset) const noexcept { return (*this)[offset]; }
            u16 get_u16_le(usize offset) const noexcept { return has(offset, 2) ? le::load_u16(data_ + offset) : 0; }
            u32 get_u32_le(usize offset) const noexcept { return has(offset, 4) ? le::load_u32(data_ + offset) : 0; }

            dp::Vector<u8> to_vector() const {
                dp::Vector<u8> out;
                out.reserve(size_);
                for (usize i = 0; i < size_; ++i)
                    out.push_back(data_[i]);
                return out;
            }

            constexpr const u8 *begin() const noexcept { return data_; }
            constexpr const u8 *end() const noexcept { return data_ + size_; }
        };

    } // namespace util
    using namespace util;
} // namespace mavftp
