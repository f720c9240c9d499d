#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../protocol/frame.hpp"
#include <datapod/datapod.hpp>

namespace mavftp {
    namespace transport {

        // ─── Frame transport boundary ────────────────────────────────────────────────
        // send() ships one encoded frame. receive() blocks for at most timeout_ms and
        // yields the next FTP frame addressed to us, or dp::nullopt if none arrived.
        // An error from either call means the link itself failed.
        class Port {
          public:
            virtual ~Port() = default;

            virtual Result<void> send(const FrameBuffer &frame) = 0;
            virtual Result<dp::Optional<FrameBuffer>> receive(u32 timeout_ms) = 0;
        };

    } // namespace transport
    using namespace transport;
} // namespace mavftp
