#pragma once

#include "types.hpp"

namespace mavftp {

    // ─── FTP opcodes (command side 0-15, response side 128/129) ─────────────────
    enum class Opcode : u8 {
        None = 0,
        TerminateSession = 1,
        ResetSession = 2,
        ListDirectory = 3,
        OpenFileReadOnly = 4,
        ReadFile = 5,
        CreateFile = 6,
        WriteFile = 7,
        RemoveFile = 8,
        CreateDirectory = 9,
        RemoveDirectory = 10,
        OpenFileWriteOnly = 11,
        TruncateFile = 12,
        Rename = 13,
        CalcFileCrc32 = 14,
        BurstReadFile = 15,
        Ack = 128,
        Nak = 129
    };

    // ─── NAK error codes (payload byte 0) ────────────────────────────────────────
    enum class NakError : u8 {
        None = 0,
        Fail = 1,
        FailErrno = 2, // payload byte 1 carries the remote errno
        InvalidDataSize = 3,
        InvalidSession = 4,
        NoSessionsAvailable = 5,
        Eof = 6,
        UnknownCommand = 7,
        FileExists = 8,
        FileProtected = 9,
        FileNotFound = 10
    };

    inline constexpr const char *to_string(Opcode op) noexcept {
        switch (op) {
        case Opcode::None:
            return "None";
        case Opcode::TerminateSession:
            return "TerminateSession";
        case Opcode::ResetSession:
            return "ResetSession";
        case Opcode::ListDirectory:
            return "ListDirectory";
        case Opcode::OpenFileReadOnly:
            return "OpenFileReadOnly";
        case Opcode::ReadFile:
            return "ReadFile";
        case Opcode::CreateFile:
            return "CreateFile";
        case Opcode::WriteFile:
            return "WriteFile";
        case Opcode::RemoveFile:
            return "RemoveFile";
        case Opcode::CreateDirectory:
            return "CreateDirectory";
        case Opcode::RemoveDirectory:
            return "RemoveDirectory";
        case Opcode::OpenFileWriteOnly:
            return "OpenFileWriteOnly";
        case Opcode::TruncateFile:
            return "TruncateFile";
        case Opcode::Rename:
            return "Rename";
        case Opcode::CalcFileCrc32:
            return "CalcFileCrc32";
        case Opcode::BurstReadFile:
            return "BurstReadFile";
        case Opcode::Ack:
            return "Ack";
        case Opcode::Nak:
            return "Nak";
        }
        return "?";
    }

    inline constexpr const char *to_string(NakError err) noexcept {
        switch (err) {
        case NakError::None:
            return "None";
        case NakError::Fail:
            return "Fail";
        case NakError::FailErrno:
            return "FailErrno";
        case NakError::InvalidDataSize:
            return "InvalidDataSize";
        case NakError::InvalidSession:
            return "InvalidSession";
        case NakError::NoSessionsAvailable:
            return "NoSessionsAvailable";
        case NakError::Eof:
            return "Eof";
        case NakError::UnknownCommand:
            return "UnknownCommand";
        case NakError::FileExists:
            return "FileExists";
        case NakError::FileProtected:
            return "FileProtected";
        case NakError::FileNotFound:
            return "FileNotFound";
        }
        return "?";
    }

} // namespace mavftp
