#include "bytering/ring_buffer.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

namespace bytering {

ByteRingBuffer::ByteRingBuffer(std::size_t capacity)
    : capacity_{capacity}, storage_{std::make_unique<std::uint8_t[]>(capacity)} {}

ByteRingBuffer::ByteRingBuffer(ByteRingBuffer&& other) noexcept
    : capacity_{std::exchange(other.capacity_, 0)},
      storage_{std::move(other.storage_)},
      read_pos_{std::exchange(other.read_pos_, 0)},
      write_pos_{std::exchange(other.write_pos_, 0)},
      full_{std::exchange(other.full_, false)} {}

ByteRingBuffer& ByteRingBuffer::operator=(ByteRingBuffer&& other) noexcept {
    if (this != &other) {
        capacity_ = std::exchange(other.capacity_, 0);
        storage_ = std::move(other.storage_);
        read_pos_ = std::exchange(other.read_pos_, 0);
        write_pos_ = std::exchange(other.write_pos_, 0);
        full_ = std::exchange(other.full_, false);
    }
    return *this;
}

std::size_t ByteRingBuffer::read_available() const noexcept {
    if (write_pos_ > read_pos_) {
        return write_pos_ - read_pos_;
    }
    if (write_pos_ == read_pos_) {
        return full_ ? capacity_ : 0;
    }
    // Write cursor has wrapped behind the read cursor
    return capacity_ - read_pos_ + write_pos_;
}

std::size_t ByteRingBuffer::write_available() const noexcept {
    if (read_pos_ == write_pos_) {
        return full_ ? 0 : capacity_;
    }
    if (read_pos_ > write_pos_) {
        return read_pos_ - write_pos_;
    }
    return capacity_ - write_pos_ + read_pos_;
}

std::size_t ByteRingBuffer::write(std::span<const std::uint8_t> data) noexcept {
    const auto avail = write_available();
    if (avail == 0) {
        return 0;
    }

    const auto n = std::min(data.size(), avail);
    if (n == 0) {
        return 0;
    }

    const auto to_end = capacity_ - write_pos_;
    if (n < to_end) {
        std::memcpy(storage_.get() + write_pos_, data.data(), n);
        write_pos_ += n;
    } else {
        // Split: fill to the end of storage, then wrap to the start
        std::memcpy(storage_.get() + write_pos_, data.data(), to_end);
        std::memcpy(storage_.get(), data.data() + to_end, n - to_end);
        write_pos_ = n - to_end;
    }

    if (write_pos_ == read_pos_) {
        full_ = true;
    }
    return n;
}

std::vector<std::uint8_t> ByteRingBuffer::read(std::size_t max_bytes) {
    std::vector<std::uint8_t> out(std::min(max_bytes, read_available()));
    read(std::span<std::uint8_t>{out});
    return out;
}

std::size_t ByteRingBuffer::read(std::span<std::uint8_t> out) noexcept {
    const auto n = std::min(out.size(), read_available());
    copy_out(read_pos_, out.first(n));
    advance_read(n);
    return n;
}

std::size_t ByteRingBuffer::peek(std::span<std::uint8_t> out) const noexcept {
    const auto n = std::min(out.size(), read_available());
    copy_out(read_pos_, out.first(n));
    return n;
}

std::size_t ByteRingBuffer::discard(std::size_t count) noexcept {
    const auto n = std::min(count, read_available());
    advance_read(n);
    return n;
}

void ByteRingBuffer::flush() noexcept {
    read_pos_ = 0;
    write_pos_ = 0;
    full_ = false;
}

void ByteRingBuffer::copy_out(std::size_t pos, std::span<std::uint8_t> out) const noexcept {
    const auto n = out.size();
    if (n == 0) {
        return;
    }

    const auto to_end = capacity_ - pos;
    if (n <= to_end) {
        std::memcpy(out.data(), storage_.get() + pos, n);
    } else {
        std::memcpy(out.data(), storage_.get() + pos, to_end);
        std::memcpy(out.data() + to_end, storage_.get(), n - to_end);
    }
}

void ByteRingBuffer::advance_read(std::size_t n) noexcept {
    // A zero-length read must not drop a full buffer to empty
    if (n == 0) {
        return;
    }

    const auto to_end = capacity_ - read_pos_;
    read_pos_ = n < to_end ? read_pos_ + n : n - to_end;
    full_ = false;
}

}  // namespace bytering
