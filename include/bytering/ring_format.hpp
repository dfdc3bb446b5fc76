#pragma once

#include "bytering/ring_buffer.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace bytering {

/// Renders bytes as uppercase hex pairs, each followed by a space ("01 0A FF ").
[[nodiscard]] std::string to_hex(std::span<const std::uint8_t> bytes);

/// Hex rendering of the unread bytes only, oldest first.
[[nodiscard]] std::string to_hex_unread(const ByteRingBuffer& ring);

/// Human-readable dump of cursor state followed by the whole physical region:
///
///   Size:4, WritePtr:2, ReadPtr:0, isFull:false
///   01 02 00 00 
[[nodiscard]] std::string describe(const ByteRingBuffer& ring);

}  // namespace bytering
