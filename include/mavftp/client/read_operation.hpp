#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../protocol/session.hpp"
#include <datapod/datapod.hpp>

namespace mavftp {
    namespace client {

        // ─── Read state machine ──────────────────────────────────────────────────────
        enum class ReadState : u8 { Idle, OpenPending, Open, Reading, Terminating, Closed, Failed };

        inline constexpr const char *to_string(ReadState s) noexcept {
            switch (s) {
            case ReadState::Idle:
                return "Idle";
            case ReadState::OpenPending:
                return "OpenPending";
            case ReadState::Open:
                return "Open";
            case ReadState::Reading:
                return "Reading";
            case ReadState::Terminating:
                return "Terminating";
            case ReadState::Closed:
                return "Closed";
            case ReadState::Failed:
                return "Failed";
            }
            return "?";
        }

        // ─── One remote file being pulled ────────────────────────────────────────────
        struct FileReadOperation {
            Session session;
            u32 file_size = 0;
            u32 current_offset = 0;
            dp::Vector<u8> data;

            bool size_reached() const noexcept { return current_offset >= file_size; }

            f32 progress() const noexcept {
                if (file_size == 0)
                    return 1.0f;
                return static_cast<f32>(current_offset) / static_cast<f32>(file_size);
            }

            void append(const dp::Vector<u8> &chunk) {
                for (u8 b : chunk)
                    data.push_back(b);
                current_offset += static_cast<u32>(chunk.size());
            }
        };

        // ─── Final result of FileReader::run ─────────────────────────────────────────
        struct ReadOutcome {
            ReadState state = ReadState::Idle;
            dp::Vector<u8> data;          // full file on success, prefix on failure
            dp::Optional<u32> file_size;  // set once the open was acknowledged
            dp::Optional<Error> failure;  // cause when state == Failed
            dp::Optional<Error> warning;  // terminate not acknowledged

            bool ok() const noexcept { return state == ReadState::Closed; }
        };

    } // namespace client
    using namespace client;
} // namespace mavftp
