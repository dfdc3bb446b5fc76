#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace bytering {

/// Fixed-capacity circular byte buffer with FIFO semantics.
///
/// Bytes written in order are read back in the same order. Every operation is
/// total: writes and reads are clamped to the space actually available and
/// report how many bytes they moved. Nothing throws, blocks or grows.
///
/// Equal read and write positions mean either "empty" or "full"; an explicit
/// flag tells the two apart.
///
/// Thread safety: NOT thread-safe. Guard the whole instance externally when it
/// is shared between threads (see RingMonitor).
class ByteRingBuffer {
public:
    /// Allocates a zero-filled region of `capacity` bytes.
    /// A capacity of 0 yields a buffer that never holds data.
    explicit ByteRingBuffer(std::size_t capacity);

    ByteRingBuffer(const ByteRingBuffer&) = delete;
    ByteRingBuffer& operator=(const ByteRingBuffer&) = delete;

    ByteRingBuffer(ByteRingBuffer&& other) noexcept;
    ByteRingBuffer& operator=(ByteRingBuffer&& other) noexcept;

    ~ByteRingBuffer() = default;

    /// Returns the fixed capacity in bytes.
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

    /// Number of bytes available for reading.
    [[nodiscard]] std::size_t read_available() const noexcept;

    /// Number of free slots available for writing.
    [[nodiscard]] std::size_t write_available() const noexcept;

    [[nodiscard]] bool empty() const noexcept { return read_available() == 0; }
    [[nodiscard]] bool full() const noexcept { return write_available() == 0; }

    /// Writes as much of `data` as fits. Returns the number of bytes written;
    /// the remainder is dropped and must be retried by the caller.
    std::size_t write(std::span<const std::uint8_t> data) noexcept;

    /// Reads up to `max_bytes` of the oldest bytes.
    /// Returns an empty vector when nothing is buffered. Allocates the result,
    /// so unlike the span overload it may throw std::bad_alloc.
    std::vector<std::uint8_t> read(std::size_t max_bytes);

    /// Reads up to `out.size()` bytes into `out`. Returns number of bytes read.
    std::size_t read(std::span<std::uint8_t> out) noexcept;

    /// Copies up to `out.size()` of the oldest bytes without consuming them.
    std::size_t peek(std::span<std::uint8_t> out) const noexcept;

    /// Consumes up to `count` bytes without copying. Returns number discarded.
    std::size_t discard(std::size_t count) noexcept;

    /// Resets both cursors. Storage contents are left in place.
    void flush() noexcept;

    // -------------------------------------------------------------------------
    // Diagnostics
    // -------------------------------------------------------------------------

    [[nodiscard]] std::size_t read_pos() const noexcept { return read_pos_; }
    [[nodiscard]] std::size_t write_pos() const noexcept { return write_pos_; }

    /// Raw full flag. Differs from full() only for a zero-capacity buffer.
    [[nodiscard]] bool full_flag() const noexcept { return full_; }

    /// The whole physical region, stale bytes included.
    [[nodiscard]] std::span<const std::uint8_t> storage() const noexcept {
        return {storage_.get(), capacity_};
    }

private:
    /// Copies `out.size()` bytes starting at `pos`, splitting at the end of storage.
    void copy_out(std::size_t pos, std::span<std::uint8_t> out) const noexcept;

    /// Moves the read cursor forward by `n` bytes (n <= read_available()).
    void advance_read(std::size_t n) noexcept;

    std::size_t capacity_;
    std::unique_ptr<std::uint8_t[]> storage_;

    std::size_t read_pos_ = 0;
    std::size_t write_pos_ = 0;
    bool full_ = false;
};

}  // namespace bytering
