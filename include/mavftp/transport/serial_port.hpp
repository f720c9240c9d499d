#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "mavlink.hpp"
#include "port.hpp"
#include <chrono>
#include <cstring>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <thread>
#include <wirebit/serial/serial_endpoint.hpp>

namespace mavftp {
    namespace transport {

        // MAV_COMP_ID_MISSIONPLANNER, the component id ground stations use
        inline constexpr ComponentId GCS_COMPONENT_ID = 190;
        inline constexpr SystemId GCS_SYSTEM_ID = 255;

        // ─── MAVLink link configuration ──────────────────────────────────────────────
        struct LinkConfig {
            SystemId system_id = GCS_SYSTEM_ID;
            ComponentId component_id = GCS_COMPONENT_ID;
            SystemId target_system = 1;
            ComponentId target_component = 1;
            u8 target_network = 0;
            MavlinkVersion version = MavlinkVersion::V2;

            LinkConfig &source(SystemId sys, ComponentId comp) {
                system_id = sys;
                component_id = comp;
                return *this;
            }
            LinkConfig &target(SystemId sys, ComponentId comp) {
                target_system = sys;
                target_component = comp;
                return *this;
            }
            LinkConfig &network(u8 net) {
                target_network = net;
                return *this;
            }
            LinkConfig &wire_version(MavlinkVersion v) {
                version = v;
                return *this;
            }
        };

        // ─── Deadline-bounded envelope polling ───────────────────────────────────────
        // Feeds bytes from pull() into reader until wanted() accepts an envelope or
        // timeout_ms elapses. pull() returns an empty vector when nothing is waiting.
        // The deadline is checked on every pass, so a link that never goes quiet
        // still times out.
        template <typename Pull, typename Wanted>
        dp::Optional<FtpEnvelope> poll_envelope(MavlinkReader &reader, u32 timeout_ms, Pull &&pull, Wanted &&wanted) {
            auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
            while (true) {
                while (auto env = reader.next()) {
                    if (wanted(*env))
                        return env;
                }
                if (std::chrono::steady_clock::now() >= deadline)
                    return dp::nullopt;

                dp::Vector<u8> bytes = pull();
                if (bytes.empty()) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(PORT_POLL_INTERVAL_MS));
                } else {
                    reader.push(bytes);
                }
            }
        }

        // ─── Port over a wirebit serial endpoint ─────────────────────────────────────
        // Wraps each frame in FILE_TRANSFER_PROTOCOL and unwraps replies addressed
        // to our system (target_system 0 and target_component 0 act as wildcards).
        //
        // Usage:
        //   auto link = std::make_shared<wirebit::PtyLink>(...);
        //   wirebit::SerialEndpoint serial(link, {.baud = 57600}, 1);
        //   MavlinkSerialPort port(serial, LinkConfig{}.target(1, 1));
        //   FileReader reader(port);
        class MavlinkSerialPort : public Port {
            wirebit::SerialEndpoint &serial_;
            LinkConfig config_;
            MavlinkReader reader_;
            u8 tx_sequence_ = 0;

          public:
            MavlinkSerialPort(wirebit::SerialEndpoint &serial, LinkConfig config = {})
                : serial_(serial), config_(config) {}

            const LinkConfig &config() const noexcept { return config_; }
            const MavlinkReader &reader() const noexcept { return reader_; }

            Result<void> send(const FrameBuffer &frame) override {
                FtpEnvelope env;
                env.target_network = config_.target_network;
                env.target_system = config_.target_system;
                env.target_component = config_.target_component;
                env.frame = frame;
                env.packet_sequence = tx_sequence_++;
                env.system_id = config_.system_id;
                env.component_id = config_.component_id;
                env.version = config_.version;

                auto packet = encode_envelope(env);
                wirebit::Bytes bytes(packet.size());
                std::memcpy(bytes.data(), packet.data(), packet.size());
                auto result = serial_.send(bytes);
                if (!result.is_ok()) {
                    echo::category("mavftp.transport.serial").error("serial send failed");
                    return Result<void>::err(Error::transport_error("serial send failed"));
                }
                echo::category("mavftp.transport.serial").trace("tx ", packet.size(), " bytes");
                return {};
            }

            Result<dp::Optional<FrameBuffer>> receive(u32 timeout_ms) override {
                auto env = poll_envelope(
                    reader_, timeout_ms,
                    [this]() {
                        // An empty endpoint reports an error; that only means "no data yet".
                        dp::Vector<u8> bytes;
                        auto rx = serial_.recv();
                        if (rx.is_ok()) {
                            for (usize i = 0; i < rx.value().size(); ++i)
                                bytes.push_back(rx.value()[i]);
                        }
                        return bytes;
                    },
                    [this](const FtpEnvelope &e) {
                        if (addressed_to_us(e))
                            return true;
                        echo::category("mavftp.transport.serial")
                            .trace("ignoring FTP message for system ", static_cast<u32>(e.target_system));
                        return false;
                    });
                if (!env) {
                    return Result<dp::Optional<FrameBuffer>>::ok(dp::nullopt);
                }
                return Result<dp::Optional<FrameBuffer>>::ok(env->frame);
            }

          private:
            bool addressed_to_us(const FtpEnvelope &env) const noexcept {
                bool sys_ok = env.target_system == 0 || env.target_system == config_.system_id;
                bool comp_ok = env.target_component == 0 || env.target_component == config_.component_id;
                return sys_ok && comp_ok;
            }
        };

    } // namespace transport
    using namespace transport;
} // namespace mavftp
