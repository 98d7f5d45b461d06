#include "payload_decoder.hpp"

#include "internal/decoder/change_decoder.hpp"
#include "internal/decoder/wal2json_translator.hpp"
#include "internal/util/json.hpp"

namespace rowcast::decoder {

std::optional<model::ChangeEvent> DecodePayload(const std::string& payload, util::Lsn position) {
  auto message = util::ParseJsonObject(payload);

  std::optional<model::ChangeEvent> event;
  if (Wal2JsonTranslator::IsWal2Json(message)) {
    auto canonical = Wal2JsonTranslator::Translate(message);
    if (!canonical) {
      return std::nullopt;
    }
    event = ChangeDecoder::Decode(*canonical);
  } else {
    event = ChangeDecoder::Decode(message);
  }
  event->position = position;
  return event;
}

} // namespace rowcast::decoder
