#include "bytering/ring_format.hpp"

#include <vector>

namespace bytering {

std::string to_hex(std::span<const std::uint8_t> bytes) {
    static constexpr char kDigits[] = "0123456789ABCDEF";

    std::string result;
    result.reserve(bytes.size() * 3);
    for (const std::uint8_t b : bytes) {
        result.push_back(kDigits[b >> 4]);
        result.push_back(kDigits[b & 0x0F]);
        result.push_back(' ');
    }
    return result;
}

std::string to_hex_unread(const ByteRingBuffer& ring) {
    std::vector<std::uint8_t> unread(ring.read_available());
    ring.peek(unread);
    return to_hex(unread);
}

std::string describe(const ByteRingBuffer& ring) {
    std::string result = "Size:" + std::to_string(ring.capacity()) +
                         ", WritePtr:" + std::to_string(ring.write_pos()) +
                         ", ReadPtr:" + std::to_string(ring.read_pos()) +
                         ", isFull:" + (ring.full_flag() ? "true" : "false") + "\n";
    result += to_hex(ring.storage());
    return result;
}

}  // namespace bytering
