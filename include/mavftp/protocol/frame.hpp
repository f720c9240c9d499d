#pragma once

#include "../core/codes.hpp"
#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../util/bitfield.hpp"
#include "../util/data_span.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <string>

namespace mavftp {
    namespace protocol {

        using FrameBuffer = dp::Array<u8, FRAME_SIZE>;

        // Exhaustive mapping from a wire byte to an opcode; anything outside the
        // enumeration is rejected rather than coerced.
        inline Result<Opcode> parse_opcode(u8 raw) {
            switch (static_cast<Opcode>(raw)) {
            case Opcode::None:
            case Opcode::TerminateSession:
            case Opcode::ResetSession:
            case Opcode::ListDirectory:
            case Opcode::OpenFileReadOnly:
            case Opcode::ReadFile:
            case Opcode::CreateFile:
            case Opcode::WriteFile:
            case Opcode::RemoveFile:
            case Opcode::CreateDirectory:
            case Opcode::RemoveDirectory:
            case Opcode::OpenFileWriteOnly:
            case Opcode::TruncateFile:
            case Opcode::Rename:
            case Opcode::CalcFileCrc32:
            case Opcode::BurstReadFile:
            case Opcode::Ack:
            case Opcode::Nak:
                return Result<Opcode>::ok(static_cast<Opcode>(raw));
            }
            return Result<Opcode>::err(Error::unknown_opcode(raw));
        }

        // ─── FTP frame ───────────────────────────────────────────────────────────────
        // Wire layout (251 bytes, little-endian):
        //   [0..1]  sequence      [2] session     [3] opcode     [4] size
        //   [5]     req_opcode    [6] burst_complete             [7] padding
        //   [8..11] offset        [12..250] data
        //
        // For data-carrying frames `size` equals data.size() and
        // decode(encode(f)) == f. A ReadFile request is the one exception to that
        // round trip: `size` is the requested chunk length and data is empty, so
        // decoding it yields `size` bytes of zero padding as data.
        class Frame {
            u16 sequence_ = 0;
            u8 session_ = 0;
            Opcode opcode_ = Opcode::None;
            u8 size_ = 0;
            Opcode req_opcode_ = Opcode::None;
            u32 offset_ = 0;
            dp::Vector<u8> data_;

          public:
            Frame() = default;

            // Range-checked construction. Widened parameter types let callers hand in
            // out-of-range values so they are rejected here instead of truncated.
            static Result<Frame> make(u64 sequence, u64 session, Opcode opcode, u64 size, Opcode req_opcode,
                                      u64 offset, dp::Vector<u8> data) {
                if (sequence > MAX_SEQUENCE) {
                    return Result<Frame>::err(
                        Error::invalid_field("sequence out of range: " + dp::String(std::to_string(sequence))));
                }
                if (session > MAX_SESSION) {
                    return Result<Frame>::err(
                        Error::invalid_field("session out of range: " + dp::String(std::to_string(session))));
                }
                if (size > MAX_SIZE_FIELD) {
                    return Result<Frame>::err(
                        Error::invalid_field("size out of range: " + dp::String(std::to_string(size))));
                }
                if (offset > MAX_FILE_OFFSET) {
                    return Result<Frame>::err(
                        Error::invalid_field("offset out of range: " + dp::String(std::to_string(offset))));
                }
                if (data.size() > MAX_DATA_SIZE) {
                    return Result<Frame>::err(Error::invalid_field(
                        "payload exceeds " + dp::String(std::to_string(MAX_DATA_SIZE)) + " bytes: " +
                        dp::String(std::to_string(data.size()))));
                }

                Frame f;
                f.sequence_ = static_cast<u16>(sequence);
                f.session_ = static_cast<u8>(session);
                f.opcode_ = opcode;
                f.size_ = static_cast<u8>(size);
                f.req_opcode_ = req_opcode;
                f.offset_ = static_cast<u32>(offset);
                f.data_ = std::move(data);
                return Result<Frame>::ok(std::move(f));
            }

            // Convenience for frames whose size field is the payload length
            static Result<Frame> with_data(u64 sequence, u64 session, Opcode opcode, Opcode req_opcode, u64 offset,
                                           dp::Vector<u8> data) {
                u64 size = data.size();
                return make(sequence, session, opcode, size, req_opcode, offset, std::move(data));
            }

            u16 sequence() const noexcept { return sequence_; }
            u8 session() const noexcept { return session_; }
            Opcode opcode() const noexcept { return opcode_; }
            u8 size() const noexcept { return size_; }
            Opcode req_opcode() const noexcept { return req_opcode_; }
            u32 offset() const noexcept { return offset_; }
            const dp::Vector<u8> &data() const noexcept { return data_; }

            bool is_ack() const noexcept { return opcode_ == Opcode::Ack; }
            bool is_nak() const noexcept { return opcode_ == Opcode::Nak; }

            // ─── Encode ──────────────────────────────────────────────────────────────
            FrameBuffer encode() const noexcept {
                FrameBuffer buf = {};
                u8 *p = buf.data();
                le::store_u16(p + OFFSET_SEQUENCE, sequence_);
                p[OFFSET_SESSION] = session_;
                p[OFFSET_OPCODE] = static_cast<u8>(opcode_);
                p[OFFSET_SIZE] = size_;
                p[OFFSET_REQ_OPCODE] = static_cast<u8>(req_opcode_);
                p[OFFSET_BURST_COMPLETE] = 0;
                p[OFFSET_PADDING] = 0;
                le::store_u32(p + OFFSET_FILE_OFFSET, offset_);
                for (usize i = 0; i < data_.size(); ++i) {
                    p[OFFSET_DATA + i] = data_[i];
                }
                return buf;
            }

            // ─── Decode ──────────────────────────────────────────────────────────────
            static Result<Frame> decode(DataSpan buf) {
                if (!buf.has(0, HEADER_SIZE)) {
                    return Result<Frame>::err(Error::malformed_frame(
                        "frame too short: " + dp::String(std::to_string(buf.size())) + " bytes"));
                }
                u8 size = buf.get_u8(OFFSET_SIZE);
                if (size > MAX_DATA_SIZE) {
                    return Result<Frame>::err(Error::malformed_frame(
                        "declared size " + dp::String(std::to_string(size)) + " exceeds " +
                        dp::String(std::to_string(MAX_DATA_SIZE)) + " data bytes"));
                }
                if (!buf.has(OFFSET_DATA, size)) {
                    return Result<Frame>::err(Error::malformed_frame(
                        "declared size " + dp::String(std::to_string(size)) + " exceeds buffer of " +
                        dp::String(std::to_string(buf.size())) + " bytes"));
                }

                auto opcode = parse_opcode(buf.get_u8(OFFSET_OPCODE));
                if (opcode.is_err()) {
                    echo::category("mavftp.codec").debug("rejecting frame: ", opcode.error().message);
                    return Result<Frame>::err(opcode.error());
                }
                auto req_opcode = parse_opcode(buf.get_u8(OFFSET_REQ_OPCODE));
                if (req_opcode.is_err()) {
                    echo::category("mavftp.codec").debug("rejecting frame: ", req_opcode.error().message);
                    return Result<Frame>::err(req_opcode.error());
                }

                Frame f;
                f.sequence_ = buf.get_u16_le(OFFSET_SEQUENCE);
                f.session_ = buf.get_u8(OFFSET_SESSION);
                f.opcode_ = opcode.value();
                f.size_ = size;
                f.req_opcode_ = req_opcode.value();
                f.offset_ = buf.get_u32_le(OFFSET_FILE_OFFSET);
                f.data_ = buf.subspan(OFFSET_DATA, size).to_vector();
                return Result<Frame>::ok(std::move(f));
            }

            bool operator==(const Frame &other) const noexcept {
                if (sequence_ != other.sequence_ || session_ != other.session_ || opcode_ != other.opcode_ ||
                    size_ != other.size_ || req_opcode_ != other.req_opcode_ || offset_ != other.offset_ ||
                    data_.size() != other.data_.size()) {
                    return false;
                }
                for (usize i = 0; i < data_.size(); ++i) {
                    if (data_[i] != other.data_[i])
                        return false;
                }
                return true;
            }
            bool operator!=(const Frame &other) const noexcept { return !(*this == other); }
        };

    } // namespace protocol
    using namespace protocol;
} // namespace mavftp
