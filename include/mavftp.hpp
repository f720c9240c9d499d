#pragma once

// ─── Core ────────────────────────────────────────────────────────────────────
#include "mavftp/core/codes.hpp"
#include "mavftp/core/constants.hpp"
#include "mavftp/core/error.hpp"
#include "mavftp/core/types.hpp"

// ─── Utilities ───────────────────────────────────────────────────────────────
#include "mavftp/util/bitfield.hpp"
#include "mavftp/util/data_span.hpp"
#include "mavftp/util/event.hpp"
#include "mavftp/util/state_machine.hpp"

// ─── Protocol ────────────────────────────────────────────────────────────────
#include "mavftp/protocol/frame.hpp"
#include "mavftp/protocol/nak.hpp"
#include "mavftp/protocol/request.hpp"
#include "mavftp/protocol/session.hpp"

// ─── Transport ───────────────────────────────────────────────────────────────
#include "mavftp/transport/mavlink.hpp"
#include "mavftp/transport/port.hpp"
#include "mavftp/transport/serial_port.hpp"

// ─── Client ──────────────────────────────────────────────────────────────────
#include "mavftp/client/config.hpp"
#include "mavftp/client/file_reader.hpp"
#include "mavftp/client/read_operation.hpp"

// ─── Simulated remote ────────────────────────────────────────────────────────
#include "mavftp/server/file_server.hpp"
