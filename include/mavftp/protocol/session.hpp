#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include "frame.hpp"
#include <echo/echo.hpp>

namespace mavftp {
    namespace protocol {

        // ─── FTP session ─────────────────────────────────────────────────────────────
        // Owns the remote-assigned session id and the sequence counter for one
        // operation. The counter only moves when a response is accepted, and then
        // follows the remote's numbering: next = response.sequence + 1.
        class Session {
            SessionId id_ = 0;
            SequenceNumber next_sequence_ = 0;
            bool established_ = false;

          public:
            Session() = default;
            explicit Session(SequenceNumber first_sequence) : next_sequence_(first_sequence) {}

            SequenceNumber next() const noexcept { return next_sequence_; }
            SessionId id() const noexcept { return id_; }
            bool established() const noexcept { return established_; }

            void establish(SessionId id) noexcept {
                id_ = id;
                established_ = true;
                echo::category("mavftp.session").debug("session established: id=", static_cast<u32>(id));
            }

            void close() noexcept { established_ = false; }

            // Moves the counter past a request whose reply never arrived (or was
            // rejected), so the remote cannot take the next frame for a retransmission.
            void abandon(const Frame &request) noexcept {
                if (next_sequence_ == request.sequence())
                    next_sequence_ = static_cast<SequenceNumber>(request.sequence() + 2);
            }

            static SequenceNumber expected_reply(SequenceNumber request) noexcept {
                return static_cast<SequenceNumber>(request + 1);
            }

            // Validates the response against the request it answers and, on success,
            // advances the counter past it.
            Result<void> accept(const Frame &request, const Frame &response) {
                SequenceNumber expected = expected_reply(request.sequence());
                if (response.sequence() != expected) {
                    echo::category("mavftp.session")
                        .warn("stale or duplicate reply: expected seq ", expected, " got ", response.sequence());
                    return Result<void>::err(Error::sequence_mismatch(expected, response.sequence()));
                }
                next_sequence_ = static_cast<SequenceNumber>(response.sequence() + 1);
                echo::category("mavftp.session").trace("accepted seq ", response.sequence(), ", next ", next_sequence_);
                return {};
            }
        };

    } // namespace protocol
    using namespace protocol;
} // namespace mavftp
