#pragma once

#include <optional>
#include <string>

#include "internal/model/change_event.hpp"

namespace rowcast::decoder {

// Decodes one raw stream payload, wal2json or canonical. nullopt when the
// message carries no row change. Throws util::DecodeError.
std::optional<model::ChangeEvent> DecodePayload(const std::string& payload, util::Lsn position = 0);

} // namespace rowcast::decoder
