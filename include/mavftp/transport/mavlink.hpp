#pragma once

#include "../core/constants.hpp"
#include "../core/types.hpp"
#include "../protocol/frame.hpp"
#include "../util/bitfield.hpp"
#include <cstddef>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace mavftp {
    namespace transport {

        // ─── MAVLink framing constants ───────────────────────────────────────────────
        inline constexpr u32 MAVLINK_MSG_ID_FILE_TRANSFER_PROTOCOL = 110;
        inline constexpr u8 MAVLINK_CRC_EXTRA_FILE_TRANSFER_PROTOCOL = 84;
        inline constexpr u8 MAVLINK_STX_V1 = 0xFE;
        inline constexpr u8 MAVLINK_STX_V2 = 0xFD;
        inline constexpr usize MAVLINK_V1_HEADER_SIZE = 6;  // stx len seq sys comp msgid
        inline constexpr usize MAVLINK_V2_HEADER_SIZE = 10; // stx len iflags cflags seq sys comp msgid[3]
        inline constexpr usize MAVLINK_CHECKSUM_SIZE = 2;
        inline constexpr usize MAVLINK_SIGNATURE_SIZE = 13;
        inline constexpr u8 MAVLINK_IFLAG_SIGNED = 0x01;

        // target_network, target_system, target_component, then the FTP frame
        inline constexpr usize FTP_ENVELOPE_SIZE = 3 + FRAME_SIZE;

        enum class MavlinkVersion : u8 { V1 = 1, V2 = 2 };

        // ─── CRC-16/MCRF4XX (the "X.25" checksum MAVLink uses) ────────────────────────
        namespace crc16 {
            inline constexpr u16 SEED = 0xFFFF;

            inline constexpr u16 accumulate(u8 byte, u16 crc) noexcept {
                u8 tmp = static_cast<u8>(byte ^ static_cast<u8>(crc & 0xFF));
                tmp = static_cast<u8>(tmp ^ static_cast<u8>(tmp << 4));
                return static_cast<u16>((crc >> 8) ^ (static_cast<u16>(tmp) << 8) ^ (static_cast<u16>(tmp) << 3) ^
                                        (static_cast<u16>(tmp) >> 4));
            }

            inline u16 compute(const u8 *data, usize len, u16 crc = SEED) noexcept {
                for (usize i = 0; i < len; ++i)
                    crc = accumulate(data[i], crc);
                return crc;
            }
        } // namespace crc16

        // ─── FILE_TRANSFER_PROTOCOL message ──────────────────────────────────────────
        struct FtpEnvelope {
            u8 target_network = 0;
            u8 target_system = 0;
            u8 target_component = 0;
            FrameBuffer frame = {};

            // Packet header
            u8 packet_sequence = 0;
            SystemId system_id = 0;
            ComponentId component_id = 0;
            MavlinkVersion version = MavlinkVersion::V2;
        };

        inline dp::Vector<u8> encode_envelope(const FtpEnvelope &env) {
            dp::Array<u8, FTP_ENVELOPE_SIZE> payload = {};
            payload[0] = env.target_network;
            payload[1] = env.target_system;
            payload[2] = env.target_component;
            for (usize i = 0; i < FRAME_SIZE; ++i)
                payload[3 + i] = env.frame[i];

            dp::Vector<u8> out;
            usize len = FTP_ENVELOPE_SIZE;
            if (env.version == MavlinkVersion::V2) {
                // v2 drops trailing zero bytes, keeping at least one
                while (len > 1 && payload[len - 1] == 0)
                    --len;
                out.reserve(MAVLINK_V2_HEADER_SIZE + len + MAVLINK_CHECKSUM_SIZE);
                out.push_back(MAVLINK_STX_V2);
                out.push_back(static_cast<u8>(len));
                out.push_back(0); // incompat flags
                out.push_back(0); // compat flags
                out.push_back(env.packet_sequence);
                out.push_back(env.system_id);
                out.push_back(env.component_id);
                out.push_back(static_cast<u8>(MAVLINK_MSG_ID_FILE_TRANSFER_PROTOCOL & 0xFF));
                out.push_back(static_cast<u8>((MAVLINK_MSG_ID_FILE_TRANSFER_PROTOCOL >> 8) & 0xFF));
                out.push_back(static_cast<u8>((MAVLINK_MSG_ID_FILE_TRANSFER_PROTOCOL >> 16) & 0xFF));
            } else {
                out.reserve(MAVLINK_V1_HEADER_SIZE + len + MAVLINK_CHECKSUM_SIZE);
                out.push_back(MAVLINK_STX_V1);
                out.push_back(static_cast<u8>(len));
                out.push_back(env.packet_sequence);
                out.push_back(env.system_id);
                out.push_back(env.component_id);
                out.push_back(static_cast<u8>(MAVLINK_MSG_ID_FILE_TRANSFER_PROTOCOL));
            }
            for (usize i = 0; i < len; ++i)
                out.push_back(payload[i]);

            u16 crc = crc16::compute(out.data() + 1, out.size() - 1);
            crc = crc16::accumulate(MAVLINK_CRC_EXTRA_FILE_TRANSFER_PROTOCOL, crc);
            out.push_back(static_cast<u8>(crc & 0xFF));
            out.push_back(static_cast<u8>((crc >> 8) & 0xFF));
            return out;
        }

        // ─── Streaming MAVLink reader ────────────────────────────────────────────────
        // Accepts bytes in arbitrary chunks and yields FILE_TRANSFER_PROTOCOL
        // messages. FTP packets are verified by checksum; a failure costs one byte
        // and the scan resumes after the start marker. Other message ids cannot be
        // checksummed here, so their length is only trusted when another start
        // marker follows the claimed end. While a candidate is still incomplete a
        // verified FTP packet further on in the buffer takes precedence.
        class MavlinkReader {
            enum class Candidate { Incomplete, Ftp, Foreign, Corrupt };

            dp::Vector<u8> buf_;
            u32 crc_errors_ = 0;
            u32 skipped_messages_ = 0;
            u32 discarded_bytes_ = 0;

          public:
            void push(const u8 *data, usize len) {
                for (usize i = 0; i < len; ++i)
                    buf_.push_back(data[i]);
            }

            void push(const dp::Vector<u8> &data) { push(data.data(), data.size()); }

            dp::Optional<FtpEnvelope> next() {
                while (!buf_.empty()) {
                    usize start = 0;
                    while (start < buf_.size() && !is_stx(buf_[start]))
                        ++start;
                    if (start > 0) {
                        discard(start);
                        continue;
                    }

                    usize total = 0;
                    switch (inspect(0, total)) {
                    case Candidate::Ftp: {
                        FtpEnvelope env = unpack();
                        consume(total);
                        return env;
                    }
                    case Candidate::Corrupt:
                        ++crc_errors_;
                        echo::category("mavftp.transport.mavlink").trace("dropping FTP packet: bad checksum");
                        consume(1);
                        continue;
                    case Candidate::Foreign:
                        if (buf_.size() > total && is_stx(buf_[total])) {
                            ++skipped_messages_;
                            consume(total);
                            continue;
                        }
                        if (buf_.size() > total) {
                            // Nothing starts where this one claims to end: a stray marker
                            discard(1);
                            continue;
                        }
                        break;
                    case Candidate::Incomplete:
                        break;
                    }

                    // Head of the buffer cannot be resolved yet
                    usize later = find_verified_ftp(1);
                    if (later == 0)
                        return dp::nullopt;
                    echo::category("mavftp.transport.mavlink")
                        .trace("resynchronising past ", later, " unresolved bytes");
                    discard(later);
                }
                return dp::nullopt;
            }

            usize buffered() const noexcept { return buf_.size(); }
            u32 crc_errors() const noexcept { return crc_errors_; }
            u32 skipped_messages() const noexcept { return skipped_messages_; }
            u32 discarded_bytes() const noexcept { return discarded_bytes_; }

            void reset() { buf_.clear(); }

          private:
            static bool is_stx(u8 b) noexcept { return b == MAVLINK_STX_V1 || b == MAVLINK_STX_V2; }

            // Classifies the packet starting at pos; total receives its claimed length.
            Candidate inspect(usize pos, usize &total) const {
                bool v2 = buf_[pos] == MAVLINK_STX_V2;
                usize header = v2 ? MAVLINK_V2_HEADER_SIZE : MAVLINK_V1_HEADER_SIZE;
                if (buf_.size() - pos < header)
                    return Candidate::Incomplete;

                const u8 *p = buf_.data() + pos;
                usize len = p[1];
                bool is_signed = v2 && (p[2] & MAVLINK_IFLAG_SIGNED) != 0;
                total = header + len + MAVLINK_CHECKSUM_SIZE + (is_signed ? MAVLINK_SIGNATURE_SIZE : 0);
                if (buf_.size() - pos < total)
                    return Candidate::Incomplete;

                u32 msg_id = v2 ? le::load_u24(p + 7) : p[5];
                if (msg_id != MAVLINK_MSG_ID_FILE_TRANSFER_PROTOCOL)
                    return Candidate::Foreign;

                u16 crc = crc16::compute(p + 1, header + len - 1);
                crc = crc16::accumulate(MAVLINK_CRC_EXTRA_FILE_TRANSFER_PROTOCOL, crc);
                bool len_ok = v2 ? (len >= 1 && len <= FTP_ENVELOPE_SIZE) : (len == FTP_ENVELOPE_SIZE);
                if (crc != le::load_u16(p + header + len) || !len_ok)
                    return Candidate::Corrupt;
                return Candidate::Ftp;
            }

            // Offset of the first checksum-verified FTP packet at or after from, or 0
            usize find_verified_ftp(usize from) const {
                for (usize pos = from; pos < buf_.size(); ++pos) {
                    usize total = 0;
                    if (is_stx(buf_[pos]) && inspect(pos, total) == Candidate::Ftp)
                        return pos;
                }
                return 0;
            }

            // Unpacks the verified FTP packet at the head of the buffer
            FtpEnvelope unpack() const {
                bool v2 = buf_[0] == MAVLINK_STX_V2;
                usize header = v2 ? MAVLINK_V2_HEADER_SIZE : MAVLINK_V1_HEADER_SIZE;
                usize len = buf_[1];

                FtpEnvelope env;
                env.version = v2 ? MavlinkVersion::V2 : MavlinkVersion::V1;
                env.packet_sequence = v2 ? buf_[4] : buf_[2];
                env.system_id = v2 ? buf_[5] : buf_[3];
                env.component_id = v2 ? buf_[6] : buf_[4];

                // Truncated v2 payloads are zero-extended
                dp::Array<u8, FTP_ENVELOPE_SIZE> payload = {};
                for (usize i = 0; i < len; ++i)
                    payload[i] = buf_[header + i];
                env.target_network = payload[0];
                env.target_system = payload[1];
                env.target_component = payload[2];
                for (usize i = 0; i < FRAME_SIZE; ++i)
                    env.frame[i] = payload[3 + i];
                return env;
            }

            void discard(usize n) {
                discarded_bytes_ += static_cast<u32>(n);
                consume(n);
            }

            void consume(usize n) { buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(n)); }
        };

    } // namespace transport
    using namespace transport;
} // namespace mavftp
