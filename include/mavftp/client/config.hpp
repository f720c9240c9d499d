#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include <string>

namespace mavftp {
    namespace client {

        // ─── File reader configuration ───────────────────────────────────────────────
        struct ReaderConfig {
            u32 timeout_ms = DEFAULT_RESPONSE_TIMEOUT_MS;
            u32 terminate_timeout_ms = DEFAULT_TERMINATE_TIMEOUT_MS;
            u32 chunk_size = MAX_DATA_SIZE;
            // Stop once the size from the open ACK is reached instead of waiting for
            // the remote's Eof NAK. An earlier Eof always ends the read.
            bool stop_at_file_size = true;

            ReaderConfig &timeout(u32 ms) {
                timeout_ms = ms;
                return *this;
            }
            ReaderConfig &terminate_timeout(u32 ms) {
                terminate_timeout_ms = ms;
                return *this;
            }
            ReaderConfig &chunk(u32 bytes) {
                chunk_size = bytes;
                return *this;
            }
            ReaderConfig &stop_at_size(bool enabled) {
                stop_at_file_size = enabled;
                return *this;
            }

            Result<void> validate() const {
                if (chunk_size == 0 || chunk_size > MAX_DATA_SIZE) {
                    return Result<void>::err(Error::invalid_field(
                        "chunk size must be 1.." + dp::String(std::to_string(MAX_DATA_SIZE)) + ", got " +
                        dp::String(std::to_string(chunk_size))));
                }
                if (timeout_ms == 0) {
                    return Result<void>::err(Error::invalid_field("response timeout must be non-zero"));
                }
                return {};
            }
        };

    } // namespace client
    using namespace client;
} // namespace mavftp
