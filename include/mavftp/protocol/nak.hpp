#pragma once

#include "../core/codes.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "frame.hpp"
#include <datapod/datapod.hpp>

namespace mavftp {
    namespace protocol {

        // ─── Classified NAK ──────────────────────────────────────────────────────────
        struct NakInfo {
            NakError code = NakError::None;
            dp::Optional<u8> os_errno; // only set for FailErrno

            bool is_eof() const noexcept { return code == NakError::Eof; }

            Error to_error() const noexcept { return Error::remote_error(code, os_errno); }
        };

        inline Result<NakError> parse_nak_error(u8 raw) {
            switch (static_cast<NakError>(raw)) {
            case NakError::None:
            case NakError::Fail:
            case NakError::FailErrno:
            case NakError::InvalidDataSize:
            case NakError::InvalidSession:
            case NakError::NoSessionsAvailable:
            case NakError::Eof:
            case NakError::UnknownCommand:
            case NakError::FileExists:
            case NakError::FileProtected:
            case NakError::FileNotFound:
                return Result<NakError>::ok(static_cast<NakError>(raw));
            }
            return Result<NakError>::err(Error::unknown_error_code(raw));
        }

        // Classifies the valid payload of a NAK frame (data[0] is the code, data[1]
        // the errno for FailErrno).
        inline Result<NakInfo> classify_nak(const dp::Vector<u8> &data) {
            if (data.empty()) {
                return Result<NakInfo>::err(Error::malformed_frame("NAK without error code"));
            }
            auto code = parse_nak_error(data[0]);
            if (code.is_err()) {
                return Result<NakInfo>::err(code.error());
            }

            NakInfo info;
            info.code = code.value();
            if (info.code == NakError::FailErrno) {
                if (data.size() < 2) {
                    return Result<NakInfo>::err(Error::malformed_frame("FailErrno NAK without errno byte"));
                }
                info.os_errno = data[1];
            }
            return Result<NakInfo>::ok(info);
        }

        inline Result<NakInfo> classify_nak(const Frame &frame) {
            if (!frame.is_nak()) {
                return Result<NakInfo>::err(Error::invalid_state("frame is not a NAK"));
            }
            return classify_nak(frame.data());
        }

    } // namespace protocol
    using namespace protocol;
} // namespace mavftp
