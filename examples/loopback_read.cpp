#include <mavftp.hpp>
#include <echo/echo.hpp>
#include <cstdlib>

using namespace mavftp;

// Reads a file from an in-process FTP server and prints it.
//
//   loopback_read [path] [chunk]
int main(int argc, char **argv) {
    echo::info("=== MAVLink FTP Loopback Read ===");

    FileServer server(FileServerConfig{}.session_base(3));
    auto added = server.add_file("/@ROMFS/locations.txt", dp::String("# name,lat,lon,alt\n"
                                                                     "home,47.397742,8.545594,488.0\n"
                                                                     "field,47.398100,8.546200,490.5\n"));
    if (added.is_err()) {
        echo::error("cannot add file: ", added.error().message);
        return 1;
    }
    dp::Vector<u8> log(1000);
    for (usize i = 0; i < log.size(); ++i)
        log[i] = static_cast<u8>(i & 0xFF);
    if (server.add_file("/fs/microsd/log/00000001.bin", log).is_err()) {
        echo::error("cannot add log file");
        return 1;
    }

    server.on_open.subscribe([](dp::String path) { echo::debug("server: open ", path); });
    server.on_terminate.subscribe([](SessionId id) { echo::debug("server: terminate ", static_cast<u32>(id)); });

    LoopbackPort port(server);

    ReaderConfig config;
    if (argc > 2)
        config.chunk(static_cast<u32>(std::atoi(argv[2])));
    dp::String path = argc > 1 ? dp::String(argv[1]) : dp::String("/@ROMFS/locations.txt");

    FileReader reader(port, config);
    reader.on_transition.subscribe([](ReadState from, ReadState to) {
        echo::info("state: ", to_string(from), " -> ", to_string(to));
    });
    reader.on_chunk.subscribe([&](u32 offset, u32 len) {
        echo::info("chunk @", offset, " (", len, " bytes, ", static_cast<u32>(reader.operation()->progress() * 100),
                   "%)");
    });

    auto outcome = reader.run(path);
    if (!outcome.ok()) {
        echo::error("read failed: ", outcome.failure ? outcome.failure->message : dp::String("unknown"));
        echo::info("received ", outcome.data.size(), " bytes before the failure");
        return 1;
    }
    if (outcome.warning)
        echo::warn(outcome.warning->message);

    echo::info("read ", outcome.data.size(), " of ", *outcome.file_size, " bytes");
    dp::String text;
    for (u8 b : outcome.data)
        text += (b >= 0x20 && b < 0x7F) || b == '\n' ? static_cast<char>(b) : '.';
    echo::info("\n", text);
    return 0;
}
