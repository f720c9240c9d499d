#pragma once

#include "../core/types.hpp"

namespace mavftp {
    namespace util {

        // ─── Little-endian packing over raw byte storage ─────────────────────────────
        namespace le {

            inline u16 load_u16(const u8 *data) noexcept {
                return static_cast<u16>(data[0]) | (static_cast<u16>(data[1]) << 8);
            }

            inline u32 load_u24(const u8 *data) noexcept {
                return static_cast<u32>(data[0]) | (static_cast<u32>(data[1]) << 8) |
                       (static_cast<u32>(data[2]) << 16);
            }

            inline u32 load_u32(const u8 *data) noexcept {
                return static_cast<u32>(data[0]) | (static_cast<u32>(data[1]) << 8) |
                       (static_cast<u32>(data[2]) << 16) | (static_cast<u32>(data[3]) << 24);
            }

            inline void store_u16(u8 *data, u16 value) noexcept {
                data[0] = static_cast<u8>(value & 0xFF);
                data[1] = static_cast<u8>((value >> 8) & 0xFF);
            }

            inline void store_u24(u8 *data, u32 value) noexcept {
                data[0] = static_cast<u8>(value & 0xFF);
                data[1] = static_cast<u8>((value >> 8) & 0xFF);
                data[2] = static_cast<u8>((value >> 16) & 0xFF);
            }

            inline void store_u32(u8 *data, u32 value) noexcept {
                data[0] = static_cast<u8>(value & 0xFF);
                data[1] = static_cast<u8>((value >> 8) & 0xFF);
                data[2] = static_cast<u8>((value >> 16) & 0xFF);
                data[3] = static_cast<u8>((value >> 24) & 0xFF);
            }

        } // namespace le

    } // namespace util
    using namespace util;
} // namespace mavftp
