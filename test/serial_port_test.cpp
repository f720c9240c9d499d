#include <doctest/doctest.h>
#include <mavftp/transport/serial_port.hpp>
#include <chrono>

using namespace mavftp;

static dp::Vector<u8> heartbeat_bytes() {
    dp::Vector<u8> hb = {MAVLINK_STX_V2, 9, 0, 0, 1, 1, 1, 0, 0, 0};
    for (int i = 0; i < 9 + 2; ++i)
        hb.push_back(0);
    return hb;
}

static dp::Vector<u8> ftp_packet(u8 target_system, u16 ftp_sequence) {
    FtpEnvelope env;
    env.target_system = target_system;
    env.target_component = GCS_COMPONENT_ID;
    env.system_id = 1;
    env.component_id = 1;
    env.frame = Frame::with_data(ftp_sequence, 3, Opcode::Ack, Opcode::ReadFile, 0, {1, 2, 3}).value().encode();
    return encode_envelope(env);
}

static bool for_gcs(const FtpEnvelope &env) { return env.target_system == GCS_SYSTEM_ID; }

TEST_CASE("poll_envelope") {
    MavlinkReader reader;

    SUBCASE("returns the first envelope addressed to us") {
        dp::Vector<dp::Vector<u8>> chunks = {heartbeat_bytes(), ftp_packet(42, 5), ftp_packet(GCS_SYSTEM_ID, 9)};
        usize next = 0;
        auto env = poll_envelope(
            reader, 1000, [&]() { return next < chunks.size() ? chunks[next++] : dp::Vector<u8>{}; }, for_gcs);
        REQUIRE(env.has_value());
        auto frame = Frame::decode(DataSpan(env->frame));
        REQUIRE(frame.is_ok());
        CHECK(frame.value().sequence() == 9);
    }

    SUBCASE("quiet link times out") {
        u32 pulls = 0;
        auto env = poll_envelope(
            reader, 5,
            [&]() {
                ++pulls;
                return dp::Vector<u8>{};
            },
            for_gcs);
        CHECK_FALSE(env.has_value());
        CHECK(pulls >= 1);
    }

    SUBCASE("link that never goes quiet still times out") {
        u32 pulls = 0;
        auto started = std::chrono::steady_clock::now();
        auto env = poll_envelope(
            reader, 20,
            [&]() {
                ++pulls;
                return heartbeat_bytes();
            },
            for_gcs);
        auto elapsed = std::chrono::steady_clock::now() - started;

        CHECK_FALSE(env.has_value());
        CHECK(pulls > 1);
        CHECK(elapsed < std::chrono::seconds(5));
        CHECK(reader.skipped_messages() >= 1);
    }

    SUBCASE("envelopes for other systems do not extend the wait") {
        auto env = poll_envelope(reader, 20, [&]() { return ftp_packet(42, 1); }, for_gcs);
        CHECK_FALSE(env.has_value());
    }
}
