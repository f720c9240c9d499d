#include <doctest/doctest.h>
#include <mavftp/protocol/frame.hpp>

using namespace mavftp;

static dp::Vector<u8> bytes_of(const char *s) {
    dp::Vector<u8> out;
    for (; *s; ++s)
        out.push_back(static_cast<u8>(*s));
    return out;
}

TEST_CASE("Frame construction") {
    SUBCASE("accepts limits") {
        auto f = Frame::make(0xFFFF, 0xFF, Opcode::ReadFile, 0xFF, Opcode::None, 0xFFFFFFFFull, {});
        REQUIRE(f.is_ok());
        CHECK(f.value().sequence() == 0xFFFF);
        CHECK(f.value().session() == 0xFF);
        CHECK(f.value().size() == 0xFF);
        CHECK(f.value().offset() == 0xFFFFFFFFu);
    }

    SUBCASE("payload of 239 bytes is fine") {
        auto f = Frame::with_data(1, 0, Opcode::Ack, Opcode::ReadFile, 0, dp::Vector<u8>(MAX_DATA_SIZE, 0xAB));
        REQUIRE(f.is_ok());
        CHECK(f.value().size() == 239);
    }

    SUBCASE("payload of 240 bytes is rejected") {
        auto f = Frame::make(0, 0, Opcode::Ack, 0, Opcode::None, 0, dp::Vector<u8>(240, 0));
        REQUIRE(f.is_err());
        CHECK(f.error().code == ErrorCode::InvalidField);
    }

    SUBCASE("out of range header fields are rejected") {
        CHECK(Frame::make(0x10000, 0, Opcode::None, 0, Opcode::None, 0, {}).error().code == ErrorCode::InvalidField);
        CHECK(Frame::make(0, 0x100, Opcode::None, 0, Opcode::None, 0, {}).error().code == ErrorCode::InvalidField);
        CHECK(Frame::make(0, 0, Opcode::None, 0x100, Opcode::None, 0, {}).error().code == ErrorCode::InvalidField);
        CHECK(Frame::make(0, 0, Opcode::None, 0, Opcode::None, 0x100000000ull, {}).error().code ==
              ErrorCode::InvalidField);
    }
}

TEST_CASE("Frame encode layout") {
    auto f = Frame::with_data(0x1234, 3, Opcode::OpenFileReadOnly, Opcode::None, 0xA1B2C3D4, bytes_of("/a.txt"));
    REQUIRE(f.is_ok());
    auto buf = f.value().encode();

    CHECK(buf.size() == 251);
    CHECK(buf[0] == 0x34);
    CHECK(buf[1] == 0x12);
    CHECK(buf[2] == 3);
    CHECK(buf[3] == 4);
    CHECK(buf[4] == 6);
    CHECK(buf[5] == 0);
    CHECK(buf[6] == 0);
    CHECK(buf[7] == 0);
    CHECK(buf[8] == 0xD4);
    CHECK(buf[9] == 0xC3);
    CHECK(buf[10] == 0xB2);
    CHECK(buf[11] == 0xA1);
    CHECK(buf[12] == '/');
    CHECK(buf[17] == 't');

    // Everything past the payload is zero
    bool zero_tail = true;
    for (usize i = 18; i < buf.size(); ++i)
        zero_tail = zero_tail && buf[i] == 0;
    CHECK(zero_tail);
}

TEST_CASE("Frame decode") {
    SUBCASE("round trip of data-carrying frames") {
        auto open = Frame::with_data(0, 0, Opcode::OpenFileReadOnly, Opcode::None, 0, bytes_of("/@ROMFS/locations.txt"));
        auto ack = Frame::with_data(1, 3, Opcode::Ack, Opcode::OpenFileReadOnly, 0, {100, 0, 0, 0});
        auto nak = Frame::with_data(65535, 9, Opcode::Nak, Opcode::ReadFile, 4096, {2, 13});
        auto terminate = Frame::make(7, 3, Opcode::TerminateSession, 0, Opcode::None, 0, {});
        auto full = Frame::with_data(42, 1, Opcode::Ack, Opcode::ReadFile, 239, dp::Vector<u8>(MAX_DATA_SIZE, 0x5A));

        for (auto *f : {&open, &ack, &nak, &terminate, &full}) {
            REQUIRE(f->is_ok());
            auto decoded = Frame::decode(DataSpan(f->value().encode()));
            REQUIRE(decoded.is_ok());
            CHECK(decoded.value() == f->value());
        }
    }

    SUBCASE("read request keeps its requested size") {
        auto f = Frame::make(4, 3, Opcode::ReadFile, MAX_DATA_SIZE, Opcode::None, 100, {});
        REQUIRE(f.is_ok());
        auto decoded = Frame::decode(DataSpan(f.value().encode()));
        REQUIRE(decoded.is_ok());
        CHECK(decoded.value().opcode() == Opcode::ReadFile);
        CHECK(decoded.value().size() == MAX_DATA_SIZE);
        CHECK(decoded.value().offset() == 100);
        // The only frame kind that does not round trip: the zero padding comes
        // back as data
        CHECK(decoded.value().data().size() == MAX_DATA_SIZE);
        CHECK(decoded.value() != f.value());
    }

    SUBCASE("10-byte buffer is malformed") {
        u8 raw[10] = {};
        auto decoded = Frame::decode(DataSpan(raw, sizeof(raw)));
        REQUIRE(decoded.is_err());
        CHECK(decoded.error().code == ErrorCode::MalformedFrame);
    }

    SUBCASE("declared size past the buffer is malformed") {
        u8 raw[20] = {};
        raw[3] = static_cast<u8>(Opcode::Ack);
        raw[4] = 9; // needs 21 bytes
        auto decoded = Frame::decode(DataSpan(raw, sizeof(raw)));
        REQUIRE(decoded.is_err());
        CHECK(decoded.error().code == ErrorCode::MalformedFrame);
    }

    SUBCASE("size above 239 cannot fit in a full frame") {
        FrameBuffer raw = {};
        raw[3] = static_cast<u8>(Opcode::Ack);
        raw[4] = 240;
        CHECK(Frame::decode(DataSpan(raw)).error().code == ErrorCode::MalformedFrame);
    }

    SUBCASE("size above 239 is rejected even when the buffer is longer") {
        dp::Vector<u8> raw(300, 0xAB);
        raw[0] = 1;
        raw[1] = 0;
        raw[3] = static_cast<u8>(Opcode::Ack);
        raw[4] = 255;
        raw[5] = static_cast<u8>(Opcode::ReadFile);
        auto decoded = Frame::decode(DataSpan(raw));
        REQUIRE(decoded.is_err());
        CHECK(decoded.error().code == ErrorCode::MalformedFrame);

        raw[4] = MAX_DATA_SIZE;
        auto largest = Frame::decode(DataSpan(raw));
        REQUIRE(largest.is_ok());
        CHECK(largest.value().data().size() == MAX_DATA_SIZE);
        CHECK(Frame::decode(DataSpan(largest.value().encode())).value() == largest.value());
    }

    SUBCASE("unknown opcode is rejected") {
        FrameBuffer raw = {};
        raw[3] = 200;
        auto decoded = Frame::decode(DataSpan(raw));
        REQUIRE(decoded.is_err());
        CHECK(decoded.error().code == ErrorCode::UnknownOpcode);
    }

    SUBCASE("unknown req_opcode is rejected") {
        FrameBuffer raw = {};
        raw[3] = static_cast<u8>(Opcode::Ack);
        raw[5] = 16;
        CHECK(Frame::decode(DataSpan(raw)).error().code == ErrorCode::UnknownOpcode);
    }

    SUBCASE("bytes past size are not trusted") {
        FrameBuffer raw = {};
        raw[3] = static_cast<u8>(Opcode::Ack);
        raw[4] = 2;
        raw[12] = 0x11;
        raw[13] = 0x22;
        raw[14] = 0x33;
        auto decoded = Frame::decode(DataSpan(raw));
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.value().data().size() == 2);
        CHECK(decoded.value().data()[1] == 0x22);
    }
}

TEST_CASE("parse_opcode covers the enumeration") {
    for (u32 raw = 0; raw <= 15; ++raw)
        CHECK(parse_opcode(static_cast<u8>(raw)).is_ok());
    CHECK(parse_opcode(128).value() == Opcode::Ack);
    CHECK(parse_opcode(129).value() == Opcode::Nak);
    CHECK(parse_opcode(16).is_err());
    CHECK(parse_opcode(127).is_err());
    CHECK(parse_opcode(130).is_err());
    CHECK(parse_opcode(255).is_err());
}
