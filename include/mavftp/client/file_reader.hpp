#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../protocol/frame.hpp"
#include "../protocol/nak.hpp"
#include "../protocol/request.hpp"
#include "../protocol/session.hpp"
#include "../transport/port.hpp"
#include "../util/bitfield.hpp"
#include "../util/event.hpp"
#include "../util/state_machine.hpp"
#include "config.hpp"
#include "read_operation.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <exception>

namespace mavftp {
    namespace client {

        // ─── Chunked file reader ─────────────────────────────────────────────────────
        // Drives one read of one remote file:
        //
        //   Idle -> OpenPending -> Open -> Reading -> Terminating -> Closed
        //                  \__________________\____________> Failed
        //
        // Exactly one request is outstanding at any time. A NAK carrying Eof (or
        // reaching the size announced by the open ACK) ends the loop successfully;
        // every other NAK, a timeout, or an out-of-sequence reply is fatal. A fatal
        // error after the open succeeded still sends TerminateSession before the
        // reader enters Failed. Bytes received before a failure remain available
        // through data().
        //
        // One FileReader serves one operation; Closed and Failed are absorbing.
        class FileReader {
            Port &port_;
            ReaderConfig config_;
            StateMachine<ReadState> fsm_{ReadState::Idle, {ReadState::Closed, ReadState::Failed}};
            Session session_;
            dp::String path_;
            dp::Optional<Frame> pending_open_;
            dp::Optional<Frame> last_request_;
            dp::Optional<FileReadOperation> op_;
            dp::Optional<Error> failure_;
            dp::Optional<Error> warning_;

          public:
            explicit FileReader(Port &port, ReaderConfig config = {}) : port_(port), config_(config) {
                fsm_.on_transition.subscribe([this](ReadState from, ReadState to) {
                    echo::category("mavftp.client.reader").debug(to_string(from), " -> ", to_string(to));
                    on_transition.emit(from, to);
                });
            }

            FileReader(const FileReader &) = delete;
            FileReader &operator=(const FileReader &) = delete;

            // Events
            Event<ReadState, ReadState> on_transition; // (from, to)
            Event<u32, u32> on_chunk;                  // (offset, length)
            Event<const Error &> on_warning;

            ReadState state() const noexcept { return fsm_.state(); }
            bool finished() const noexcept { return fsm_.is_terminal(); }
            const ReaderConfig &config() const noexcept { return config_; }
            const dp::String &path() const noexcept { return path_; }
            const dp::Optional<FileReadOperation> &operation() const noexcept { return op_; }
            const Session &session() const noexcept { return op_ ? op_->session : session_; }
            const dp::Optional<Error> &failure() const noexcept { return failure_; }
            const dp::Optional<Error> &warning() const noexcept { return warning_; }

            dp::Vector<u8> data() const { return op_ ? op_->data : dp::Vector<u8>{}; }

            // ─── Idle -> OpenPending ─────────────────────────────────────────────────
            Result<void> open(const dp::String &path) {
                if (!fsm_.is(ReadState::Idle)) {
                    return Result<void>::err(Error::invalid_state("reader already used"));
                }
                auto valid = config_.validate();
                if (valid.is_err()) {
                    return valid;
                }
                auto request = make_open_read_only(session_, path);
                if (request.is_err()) {
                    return Result<void>::err(request.error());
                }

                path_ = path;
                echo::category("mavftp.client.reader").info("opening ", path_);
                pending_open_ = request.value();
                transition(ReadState::OpenPending);

                auto sent = send_frame(*pending_open_);
                if (sent.is_err()) {
                    record_failure(sent.error());
                    return sent;
                }
                return {};
            }

            // ─── Advance by one transition ───────────────────────────────────────────
            // Returns the new state, or the cause if this step moved the reader into
            // Failed. Stepping an idle or finished reader is an InvalidState error.
            Result<ReadState> step() {
                switch (fsm_.state()) {
                case ReadState::Idle:
                    return Result<ReadState>::err(Error::invalid_state("open() has not been called"));
                case ReadState::OpenPending:
                    return await_open();
                case ReadState::Open:
                    transition(ReadState::Reading);
                    return Result<ReadState>::ok(ReadState::Reading);
                case ReadState::Reading:
                    return read_next_chunk();
                case ReadState::Terminating:
                    terminate();
                    return Result<ReadState>::ok(ReadState::Closed);
                case ReadState::Closed:
                case ReadState::Failed:
                    return Result<ReadState>::err(Error::invalid_state("read operation already finished"));
                }
                return Result<ReadState>::err(Error::invalid_state("unreachable read state"));
            }

            // ─── open() + step() until Closed or Failed ──────────────────────────────
            ReadOutcome run(const dp::String &path) {
                ReadOutcome outcome;
                auto opened = open(path);
                if (opened.is_err() && fsm_.is(ReadState::Idle)) {
                    echo::category("mavftp.client.reader").error("cannot open ", path, ": ", opened.error().message);
                    outcome.state = ReadState::Idle;
                    outcome.failure = opened.error();
                    return outcome;
                }
                while (!fsm_.is_terminal()) {
                    if (step().is_err())
                        break;
                }
                return outcome_snapshot();
            }

            ReadOutcome outcome_snapshot() const {
                ReadOutcome outcome;
                outcome.state = fsm_.state();
                outcome.failure = failure_;
                outcome.warning = warning_;
                if (op_) {
                    outcome.data = op_->data;
                    outcome.file_size = op_->file_size;
                }
                return outcome;
            }

          private:
            void transition(ReadState next) {
                auto moved = fsm_.transition(next);
                if (moved.is_err()) {
                    echo::category("mavftp.client.reader")
                        .error("illegal transition ", to_string(fsm_.state()), " -> ", to_string(next));
                }
            }

            template <typename T> Result<T> fail(Error e) {
                record_failure(e);
                return Result<T>::err(std::move(e));
            }

            // Once the remote has handed out a session it is released even on a fatal
            // error; the cause and any bytes already read are kept.
            void record_failure(const Error &e) {
                echo::category("mavftp.client.reader")
                    .error("read of ", path_, " failed in ", to_string(fsm_.state()), ": ", e.message);
                failure_ = e;
                if (op_ && op_->session.established()) {
                    if (last_request_)
                        op_->session.abandon(*last_request_);
                    release_session(*op_);
                }
                transition(ReadState::Failed);
            }

            void warn(Error e) {
                echo::category("mavftp.client.reader").warn(e.message);
                warning_ = e;
                on_warning.emit(e);
            }

            // Any failure of the link itself is reported as a timeout.
            Result<void> send_frame(const Frame &frame) {
                echo::category("mavftp.client.reader")
                    .trace("tx ", to_string(frame.opcode()), " seq=", frame.sequence(), " offset=", frame.offset());
                last_request_ = frame;
                try {
                    auto sent = port_.send(frame.encode());
                    if (sent.is_err()) {
                        return Result<void>::err(Error::timeout("send failed: " + sent.error().message));
                    }
                } catch (const std::exception &ex) {
                    return Result<void>::err(Error::timeout(dp::String("send failed: ") + ex.what()));
                }
                return {};
            }

            Result<Frame> await_reply(const Frame &request, Session &session, u32 timeout_ms) {
                dp::Optional<FrameBuffer> raw;
                try {
                    auto received = port_.receive(timeout_ms);
                    if (received.is_err()) {
                        return Result<Frame>::err(Error::timeout("receive failed: " + received.error().message));
                    }
                    raw = received.value();
                } catch (const std::exception &ex) {
                    return Result<Frame>::err(Error::timeout(dp::String("receive failed: ") + ex.what()));
                }
                if (!raw) {
                    return Result<Frame>::err(Error::timeout("no response to " + dp::String(to_string(request.opcode())) +
                                                             " within " + dp::String(std::to_string(timeout_ms)) +
                                                             " ms"));
                }

                auto reply = Frame::decode(DataSpan(*raw));
                if (reply.is_err()) {
                    return reply;
                }
                const Frame &frame = reply.value();
                if (!frame.is_ack() && !frame.is_nak()) {
                    return Result<Frame>::err(Error::malformed_frame("unexpected response opcode " +
                                                                     dp::String(to_string(frame.opcode()))));
                }
                auto accepted = session.accept(request, frame);
                if (accepted.is_err()) {
                    return Result<Frame>::err(accepted.error());
                }
                echo::category("mavftp.client.reader")
                    .trace("rx ", to_string(frame.opcode()), " seq=", frame.sequence(), " size=",
                           static_cast<u32>(frame.size()));
                return reply;
            }

            Result<Frame> transact(const Frame &request, Session &session, u32 timeout_ms) {
                auto sent = send_frame(request);
                if (sent.is_err()) {
                    return Result<Frame>::err(sent.error());
                }
                return await_reply(request, session, timeout_ms);
            }

            // ─── OpenPending -> Open | Failed ────────────────────────────────────────
            Result<ReadState> await_open() {
                auto reply = await_reply(*pending_open_, session_, config_.timeout_ms);
                pending_open_.reset();
                if (reply.is_err()) {
                    return fail<ReadState>(reply.error());
                }
                const Frame &frame = reply.value();

                if (frame.is_nak()) {
                    auto nak = classify_nak(frame);
                    if (nak.is_err()) {
                        return fail<ReadState>(nak.error());
                    }
                    return fail<ReadState>(nak.value().to_error());
                }

                if (frame.data().size() < OPEN_ACK_DATA_SIZE) {
                    return fail<ReadState>(Error::malformed_frame(
                        "open ACK carries " + dp::String(std::to_string(frame.data().size())) + " bytes, need 4"));
                }

                FileReadOperation op;
                op.session = session_;
                op.session.establish(frame.session());
                op.file_size = le::load_u32(frame.data().data());
                op.current_offset = 0;
                op_ = std::move(op);

                echo::category("mavftp.client.reader")
                    .info("opened ", path_, ": ", op_->file_size, " bytes, session ",
                          static_cast<u32>(op_->session.id()));
                transition(ReadState::Open);
                return Result<ReadState>::ok(ReadState::Open);
            }

            // ─── Reading -> Reading | Terminating | Failed ───────────────────────────
            Result<ReadState> read_next_chunk() {
                FileReadOperation &op = *op_;
                if (config_.stop_at_file_size && op.size_reached()) {
                    echo::category("mavftp.client.reader").debug("announced size reached at offset ", op.current_offset);
                    transition(ReadState::Terminating);
                    return Result<ReadState>::ok(ReadState::Terminating);
                }

                auto request = make_read_file(op.session, op.current_offset, static_cast<u8>(config_.chunk_size));
                if (request.is_err()) {
                    return fail<ReadState>(request.error());
                }
                auto reply = transact(request.value(), op.session, config_.timeout_ms);
                if (reply.is_err()) {
                    return fail<ReadState>(reply.error());
                }
                const Frame &frame = reply.value();

                if (frame.session() != op.session.id()) {
                    echo::category("mavftp.client.reader")
                        .warn("reply for session ", static_cast<u32>(frame.session()), ", expected ",
                              static_cast<u32>(op.session.id()));
                }

                if (frame.is_nak()) {
                    auto nak = classify_nak(frame);
                    if (nak.is_err()) {
                        return fail<ReadState>(nak.error());
                    }
                    if (!nak.value().is_eof()) {
                        return fail<ReadState>(nak.value().to_error());
                    }
                    echo::category("mavftp.client.reader").debug("EOF at offset ", op.current_offset);
                    transition(ReadState::Terminating);
                    return Result<ReadState>::ok(ReadState::Terminating);
                }

                if (frame.data().empty()) {
                    // An empty ACK cannot advance the offset; treat it as end of data.
                    echo::category("mavftp.client.reader").debug("empty chunk at offset ", op.current_offset);
                    transition(ReadState::Terminating);
                    return Result<ReadState>::ok(ReadState::Terminating);
                }

                u32 chunk_offset = op.current_offset;
                op.append(frame.data());
                on_chunk.emit(chunk_offset, static_cast<u32>(frame.data().size()));
                return Result<ReadState>::ok(ReadState::Reading);
            }

            // ─── Terminating -> Closed ───────────────────────────────────────────────
            void terminate() {
                FileReadOperation &op = *op_;
                release_session(op);
                echo::category("mavftp.client.reader").info("read ", path_, ": ", op.data.size(), " bytes");
                transition(ReadState::Closed);
            }

            // Best effort: problems are reported as warnings and never change the
            // outcome of the read.
            void release_session(FileReadOperation &op) {
                auto request = make_terminate(op.session);
                if (request.is_ok()) {
                    auto reply = transact(request.value(), op.session, config_.terminate_timeout_ms);
                    if (reply.is_err()) {
                        warn(Error(reply.error().code, "terminate not acknowledged: " + reply.error().message));
                    } else if (reply.value().is_nak()) {
                        auto nak = classify_nak(reply.value());
                        warn(nak.is_ok() ? nak.value().to_error() : nak.error());
                    }
                } else {
                    warn(request.error());
                }
                op.session.close();
            }
        };

    } // namespace client
    using namespace client;
} // namespace mavftp
