#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "frame.hpp"
#include "session.hpp"
#include <datapod/datapod.hpp>

namespace mavftp {
    namespace protocol {

        // ─── Request builders for the read path ──────────────────────────────────────

        inline Result<Frame> make_open_read_only(const Session &session, const dp::String &path) {
            if (path.empty()) {
                return Result<Frame>::err(Error::invalid_field("empty path"));
            }
            dp::Vector<u8> data;
            data.reserve(path.size());
            for (char c : path) {
                data.push_back(static_cast<u8>(c));
            }
            return Frame::with_data(session.next(), 0, Opcode::OpenFileReadOnly, Opcode::None, 0, std::move(data));
        }

        inline Result<Frame> make_read_file(const Session &session, u32 offset, u8 chunk_size) {
            return Frame::make(session.next(), session.id(), Opcode::ReadFile, chunk_size, Opcode::None, offset, {});
        }

        inline Result<Frame> make_terminate(const Session &session) {
            return Frame::make(session.next(), session.id(), Opcode::TerminateSession, 0, Opcode::None, 0, {});
        }

        inline Result<Frame> make_reset(const Session &session) {
            return Frame::make(session.next(), session.id(), Opcode::ResetSession, 0, Opcode::None, 0, {});
        }

        // ─── Response builders (remote side) ─────────────────────────────────────────

        inline Result<Frame> make_ack(const Frame &request, u8 session, u32 offset, dp::Vector<u8> data = {}) {
            return Frame::with_data(Session::expected_reply(request.sequence()), session, Opcode::Ack,
                                    request.opcode(), offset, std::move(data));
        }

        inline Result<Frame> make_nak(const Frame &request, u8 session, NakError code,
                                      dp::Optional<u8> os_errno = dp::nullopt) {
            dp::Vector<u8> data;
            data.push_back(static_cast<u8>(code));
            if (code == NakError::FailErrno) {
                data.push_back(os_errno ? *os_errno : 0);
            }
            return Frame::with_data(Session::expected_reply(request.sequence()), session, Opcode::Nak,
                                    request.opcode(), request.offset(), std::move(data));
        }

    } // namespace protocol
    using namespace protocol;
} // namespace mavftp
