#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace evolve::util {

/*
  UUID helpers

  Program ids are RFC4122 version 4 UUIDs kept in their canonical
  36 character lowercase text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string         ToString(const UUID& id);
std::optional<UUID> ParseUUID(std::string_view str);

// Convenience for callers that only need a fresh id string.
std::string NewId();

bool IsWellFormedId(std::string_view str);

} // namespace evolve::util
