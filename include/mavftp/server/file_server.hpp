#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../protocol/frame.hpp"
#include "../protocol/request.hpp"
#include "../transport/port.hpp"
#include "../util/bitfield.hpp"
#include "../util/data_span.hpp"
#include "../util/event.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace mavftp {
    namespace server {

        // ─── Simulated remote configuration ──────────────────────────────────────────
        struct FileServerConfig {
            u32 max_chunk = MAX_DATA_SIZE;
            SessionId first_session = 1;

            FileServerConfig &chunk_limit(u32 bytes) {
                max_chunk = bytes;
                return *this;
            }
            FileServerConfig &session_base(SessionId id) {
                first_session = id;
                return *this;
            }
        };

        // ─── In-memory FTP responder ─────────────────────────────────────────────────
        // Serves the read path of the protocol from a file table: one session at a
        // time, ReadFile answered from the requested offset, Eof at the end. Any
        // other command is refused with UnknownCommand.
        class FileServer {
            FileServerConfig config_;
            dp::Map<dp::String, dp::Vector<u8>> files_;

            struct OpenSession {
                SessionId id = 0;
                dp::String path;
            };
            dp::Optional<OpenSession> session_;
            SessionId next_session_;
            u32 requests_ = 0;

          public:
            explicit FileServer(FileServerConfig config = {})
                : config_(config), next_session_(config.first_session) {}

            Result<void> add_file(const dp::String &path, dp::Vector<u8> data) {
                if (path.empty() || path.size() > MAX_DATA_SIZE) {
                    return Result<void>::err(Error::invalid_field("unusable path length"));
                }
                files_[path] = std::move(data);
                return {};
            }

            Result<void> add_file(const dp::String &path, const dp::String &text) {
                dp::Vector<u8> data;
                for (char c : text)
                    data.push_back(static_cast<u8>(c));
                return add_file(path, std::move(data));
            }

            bool has_session() const noexcept { return session_.has_value(); }
            u32 requests_handled() const noexcept { return requests_; }

            // Events
            Event<dp::String> on_open;
            Event<SessionId> on_terminate;

            // Produces the reply for one request. Requests that cannot be answered
            // (the reply itself failed to build) yield an error.
            Result<Frame> handle(const Frame &request) {
                ++requests_;
                echo::category("mavftp.server")
                    .trace("rx ", to_string(request.opcode()), " seq=", request.sequence(), " offset=",
                           request.offset());

                switch (request.opcode()) {
                case Opcode::OpenFileReadOnly:
                    return handle_open(request);
                case Opcode::ReadFile:
                    return handle_read(request);
                case Opcode::TerminateSession:
                case Opcode::ResetSession:
                    return handle_close(request);
                case Opcode::None:
                case Opcode::ListDirectory:
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
                    break;
                }
                echo::category("mavftp.server").debug("unsupported command ", to_string(request.opcode()));
                return make_nak(request, request.session(), NakError::UnknownCommand);
            }

          private:
            Result<Frame> handle_open(const Frame &request) {
                if (session_) {
                    return make_nak(request, 0, NakError::NoSessionsAvailable);
                }
                dp::String path;
                for (u8 b : request.data())
                    path += static_cast<char>(b);

                auto it = files_.find(path);
                if (it == files_.end()) {
                    echo::category("mavftp.server").debug("file not found: ", path);
                    return make_nak(request, 0, NakError::FileNotFound);
                }

                OpenSession s;
                s.id = next_session_++;
                s.path = path;
                session_ = s;
                on_open.emit(path);

                dp::Vector<u8> size(OPEN_ACK_DATA_SIZE, 0);
                le::store_u32(size.data(), static_cast<u32>(it->second.size()));
                echo::category("mavftp.server")
                    .debug("opened ", path, " as session ", static_cast<u32>(s.id), ", ", it->second.size(), " bytes");
                return make_ack(request, s.id, 0, std::move(size));
            }

            Result<Frame> handle_read(const Frame &request) {
                if (!session_ || session_->id != request.session()) {
                    return make_nak(request, request.session(), NakError::InvalidSession);
                }
                const auto &content = files_[session_->path];
                if (request.offset() >= content.size()) {
                    return make_nak(request, session_->id, NakError::Eof);
                }

                usize remaining = content.size() - request.offset();
                usize count = request.size();
                if (count > config_.max_chunk)
                    count = config_.max_chunk;
                if (count > remaining)
                    count = remaining;

                dp::Vector<u8> chunk;
                chunk.reserve(count);
                for (usize i = 0; i < count; ++i)
                    chunk.push_back(content[request.offset() + i]);
                return make_ack(request, session_->id, request.offset(), std::move(chunk));
            }

            Result<Frame> handle_close(const Frame &request) {
                if (!session_ || session_->id != request.session()) {
                    return make_nak(request, request.session(), NakError::InvalidSession);
                }
                SessionId id = session_->id;
                session_.reset();
                on_terminate.emit(id);
                return make_ack(request, id, 0);
            }
        };

        // ─── Port backed by an in-process FileServer ─────────────────────────────────
        // Every send() is answered synchronously and the reply queued for the next
        // receive(). Faults can be scheduled to exercise the reader's error paths.
        class LoopbackPort : public Port {
            FileServer &server_;
            dp::Vector<FrameBuffer> replies_;
            dp::Vector<Frame> sent_;
            u32 drop_replies_ = 0;
            bool corrupt_sequence_ = false;

          public:
            explicit LoopbackPort(FileServer &server) : server_(server) {}

            // Drops the replies to the next n requests
            void drop_next_replies(u32 n) noexcept { drop_replies_ = n; }
            // Stamps a stale sequence number on the next reply
            void corrupt_next_sequence() noexcept { corrupt_sequence_ = true; }

            const dp::Vector<Frame> &sent() const noexcept { return sent_; }

            Result<void> send(const FrameBuffer &frame) override {
                auto request = Frame::decode(DataSpan(frame));
                if (request.is_err()) {
                    return Result<void>::err(request.error());
                }
                sent_.push_back(request.value());

                auto reply = server_.handle(request.value());
                if (reply.is_err()) {
                    return Result<void>::err(reply.error());
                }
                if (drop_replies_ > 0) {
                    --drop_replies_;
                    echo::category("mavftp.server").debug("dropping reply to seq ", request.value().sequence());
                    return {};
                }

                FrameBuffer raw = reply.value().encode();
                if (corrupt_sequence_) {
                    corrupt_sequence_ = false;
                    le::store_u16(raw.data() + OFFSET_SEQUENCE, request.value().sequence());
                }
                replies_.push_back(raw);
                return {};
            }

            Result<dp::Optional<FrameBuffer>> receive(u32) override {
                if (replies_.empty()) {
                    return Result<dp::Optional<FrameBuffer>>::ok(dp::nullopt);
                }
                FrameBuffer raw = replies_.front();
                replies_.erase(replies_.begin());
                return Result<dp::Optional<FrameBuffer>>::ok(raw);
            }
        };

    } // namespace server
    using namespace server;
} // namespace mavftp
