#include <mavftp.hpp>
#include <echo/echo.hpp>
#include <wirebit/serial/serial_endpoint.hpp>
#include <wirebit/shm/shm_link.hpp>
#include <atomic>
#include <chrono>
#include <cstring>
#include <thread>

using namespace mavftp;

static std::atomic<bool> running{true};

// Vehicle side: unwraps FILE_TRANSFER_PROTOCOL messages, answers them from a
// FileServer and wraps the replies back to the requesting system.
static void vehicle_loop(wirebit::SerialEndpoint &serial, FileServer &server) {
    MavlinkReader reader;
    u8 tx_seq = 0;
    while (running) {
        auto rx = serial.recv();
        if (!rx.is_ok() || rx.value().empty()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            continue;
        }
        reader.push(rx.value().data(), rx.value().size());

        while (auto env = reader.next()) {
            auto request = Frame::decode(DataSpan(env->frame));
            if (request.is_err()) {
                echo::warn("vehicle: ", request.error().message);
                continue;
            }
            auto reply = server.handle(request.value());
            if (reply.is_err()) {
                echo::warn("vehicle: ", reply.error().message);
                continue;
            }

            FtpEnvelope out;
            out.target_network = env->target_network;
            out.target_system = env->system_id;
            out.target_component = env->component_id;
            out.frame = reply.value().encode();
            out.packet_sequence = tx_seq++;
            out.system_id = 1;
            out.component_id = 1;
            out.version = env->version;

            auto packet = encode_envelope(out);
            wirebit::Bytes bytes(packet.size());
            std::memcpy(bytes.data(), packet.data(), packet.size());
            if (!serial.send(bytes).is_ok())
                echo::error("vehicle: serial send failed");
        }
    }
}

// Reads a file over a simulated MAVLink serial link.
//
//   serial_read [path]
int main(int argc, char **argv) {
    echo::info("=== MAVLink FTP over Serial (wirebit) ===");

    auto link_result = wirebit::ShmLink::create("mavftp_serial", 8192);
    if (!link_result.is_ok()) {
        echo::error("Failed to create ShmLink for serial simulation");
        return 1;
    }
    auto link = std::make_shared<wirebit::ShmLink>(std::move(link_result.value()));

    auto vehicle_link_result = wirebit::ShmLink::attach("mavftp_serial");
    if (!vehicle_link_result.is_ok()) {
        echo::error("Failed to attach vehicle ShmLink");
        return 1;
    }
    auto vehicle_link = std::make_shared<wirebit::ShmLink>(std::move(vehicle_link_result.value()));

    wirebit::SerialConfig serial_config{.baud = 921600, .data_bits = 8, .stop_bits = 1, .parity = 'N'};
    wirebit::SerialEndpoint gcs_serial(link, serial_config, 1);
    wirebit::SerialEndpoint vehicle_serial(vehicle_link, serial_config, 2);

    FileServer server;
    auto added = server.add_file("/@ROMFS/locations.txt", dp::String("home,47.397742,8.545594,488.0\n"
                                                                     "field,47.398100,8.546200,490.5\n"));
    if (added.is_err()) {
        echo::error("cannot add file: ", added.error().message);
        return 1;
    }
    std::thread vehicle(vehicle_loop, std::ref(vehicle_serial), std::ref(server));

    MavlinkSerialPort port(gcs_serial, LinkConfig{}.target(1, 1));
    FileReader reader(port, ReaderConfig{}.timeout(2000));
    reader.on_chunk.subscribe([](u32 offset, u32 len) { echo::info("chunk @", offset, " (", len, " bytes)"); });

    dp::String path = argc > 1 ? dp::String(argv[1]) : dp::String("/@ROMFS/locations.txt");
    auto outcome = reader.run(path);

    running = false;
    vehicle.join();

    echo::info("link: ", port.reader().crc_errors(), " checksum errors, ", port.reader().skipped_messages(),
               " foreign messages");
    if (!outcome.ok()) {
        echo::error("read failed: ", outcome.failure ? outcome.failure->message : dp::String("unknown"));
        return 1;
    }

    dp::String text;
    for (u8 b : outcome.data)
        text += static_cast<char>(b);
    echo::info("read ", outcome.data.size(), " bytes:\n", text);
    return 0;
}
