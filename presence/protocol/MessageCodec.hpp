#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "presence/protocol/Message.hpp"

namespace presence::protocol
{
// Wire form: {"type": "<tag>", "payload": {...}}. Unrecognised fields are ignored.
[[nodiscard]] std::string EncodeMessage(const Message& message);

// Malformed input, unknown tags and missing mandatory fields yield std::nullopt.
[[nodiscard]] std::optional<Message> DecodeMessage(std::string_view text, std::string* outError = nullptr);
} // namespace presence::protocol
