#pragma once

#include "types.hpp"

namespace mavftp {

    // ─── Frame layout (MAVLink FTP payload) ──────────────────────────────────────
    inline constexpr usize FRAME_SIZE = 251;
    inline constexpr usize HEADER_SIZE = 12;
    inline constexpr usize MAX_DATA_SIZE = FRAME_SIZE - HEADER_SIZE; // 239

    inline constexpr usize OFFSET_SEQUENCE = 0;
    inline constexpr usize OFFSET_SESSION = 2;
    inline constexpr usize OFFSET_OPCODE = 3;
    inline constexpr usize OFFSET_SIZE = 4;
    inline constexpr usize OFFSET_REQ_OPCODE = 5;
    inline constexpr usize OFFSET_BURST_COMPLETE = 6;
    inline constexpr usize OFFSET_PADDING = 7;
    inline constexpr usize OFFSET_FILE_OFFSET = 8;
    inline constexpr usize OFFSET_DATA = 12;

    // ─── Field limits ────────────────────────────────────────────────────────────
    inline constexpr u64 MAX_SEQUENCE = 0xFFFF;
    inline constexpr u64 MAX_SESSION = 0xFF;
    inline constexpr u64 MAX_SIZE_FIELD = 0xFF;
    inline constexpr u64 MAX_FILE_OFFSET = 0xFFFFFFFF;

    // ─── Timing constants (ms) ───────────────────────────────────────────────────
    inline constexpr u32 DEFAULT_RESPONSE_TIMEOUT_MS = 5000;
    inline constexpr u32 DEFAULT_TERMINATE_TIMEOUT_MS = 1000;
    inline constexpr u32 PORT_POLL_INTERVAL_MS = 1;

    // ─── Open response ───────────────────────────────────────────────────────────
    inline constexpr usize OPEN_ACK_DATA_SIZE = 4; // u32 LE file size

} // namespace mavftp
