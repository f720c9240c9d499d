#pragma once

#include "codes.hpp"
#include "types.hpp"
#include <datapod/datapod.hpp>
#include <string>
#include <utility>

namespace mavftp {

    // ─── Error codes ─────────────────────────────────────────────────────────────
    enum class ErrorCode : u32 {
        Ok = 0,
        Timeout,
        MalformedFrame,
        InvalidField,
        UnknownOpcode,
        UnknownErrorCode,
        SequenceMismatch,
        RemoteError,
        InvalidState,
        TransportError,
    };

    inline constexpr const char *to_string(ErrorCode code) noexcept {
        switch (code) {
        case ErrorCode::Ok:
            return "Ok";
        case ErrorCode::Timeout:
            return "Timeout";
        case ErrorCode::MalformedFrame:
            return "MalformedFrame";
        case ErrorCode::InvalidField:
            return "InvalidField";
        case ErrorCode::UnknownOpcode:
            return "UnknownOpcode";
        case ErrorCode::UnknownErrorCode:
            return "UnknownErrorCode";
        case ErrorCode::SequenceMismatch:
            return "SequenceMismatch";
        case ErrorCode::RemoteError:
            return "RemoteError";
        case ErrorCode::InvalidState:
            return "InvalidState";
        case ErrorCode::TransportError:
            return "TransportError";
        }
        return "?";
    }

    // ─── Error type ──────────────────────────────────────────────────────────────
    // For RemoteError, `remote` holds the classified NAK code and `os_errno` the
    // errno the remote attached to a FailErrno NAK.
    struct Error : dp::Error {
        ErrorCode code = ErrorCode::Ok;
        dp::Optional<NakError> remote;
        dp::Optional<u8> os_errno;

        Error() = default;
        Error(ErrorCode c, dp::String msg = "") : dp::Error{static_cast<dp::u32>(c), std::move(msg)}, code(c) {}

        static Error timeout(dp::String msg = "") noexcept { return Error(ErrorCode::Timeout, std::move(msg)); }
        static Error malformed_frame(dp::String msg = "") noexcept {
            return Error(ErrorCode::MalformedFrame, std::move(msg));
        }
        static Error invalid_field(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidField, std::move(msg));
        }
        static Error unknown_opcode(u8 raw) noexcept {
            return Error(ErrorCode::UnknownOpcode, "unknown opcode: " + dp::String(std::to_string(raw)));
        }
        static Error unknown_error_code(u8 raw) noexcept {
            return Error(ErrorCode::UnknownErrorCode, "unknown NAK error code: " + dp::String(std::to_string(raw)));
        }
        static Error sequence_mismatch(u16 expected, u16 got) noexcept {
            return Error(ErrorCode::SequenceMismatch, "sequence mismatch: expected " +
                                                          dp::String(std::to_string(expected)) + ", got " +
                                                          dp::String(std::to_string(got)));
        }
        static Error remote_error(NakError nak, dp::Optional<u8> err_no = dp::nullopt) noexcept {
            dp::String msg = "remote NAK: " + dp::String(to_string(nak));
            if (err_no) {
                msg += " (errno " + dp::String(std::to_string(*err_no)) + ")";
            }
            Error e(ErrorCode::RemoteError, std::move(msg));
            e.remote = nak;
            e.os_errno = err_no;
            return e;
        }
        static Error invalid_state(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidState, std::move(msg));
        }
        static Error transport_error(dp::String msg = "") noexcept {
            return Error(ErrorCode::TransportError, std::move(msg));
        }
    };

    // ─── Result alias ────────────────────────────────────────────────────────────
    template <typename T> using Result = dp::Result<T, Error>;

} // namespace mavftp
