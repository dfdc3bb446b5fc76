#pragma once

#include "bytering/ring_buffer.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace bytering {

/// Configuration for the ring monitor.
struct MonitorConfig {
    std::size_t ring_capacity = 65536;          // Bytes held between producer and consumer
    std::size_t drain_bytes_per_frame = 4096;   // Consumer drain quantum
    std::size_t history_frames = 120;           // Fill-level history length
};

/// Point-in-time view of the ring, produced once per frame.
struct MonitorSnapshot {
    std::size_t fill_bytes = 0;
    std::size_t capacity = 0;
    std::size_t drain_bytes_per_frame = 0;
    std::uint64_t bytes_written = 0;
    std::uint64_t bytes_read = 0;
    std::uint64_t dropped_bytes = 0;           // Refused by a full or contended ring
    std::uint64_t overruns = 0;                // produce() calls that dropped anything
    float peak_level = 0.0f;                   // Peak |sample| drained this frame
    std::vector<float> fill_history;           // Oldest first, each in [0, 1]
    std::string head_hex;                      // First unread bytes after draining
    std::chrono::steady_clock::time_point timestamp;
};

/// Couples a stream producer and a frame-driven consumer through one
/// ByteRingBuffer.
///
/// The producer side (typically an audio callback) never blocks: if the lock
/// is contended the bytes are counted as dropped. The consumer drains a fixed
/// quantum per frame and interprets drained bytes as native float samples for
/// level metering.
///
/// Usage:
///   RingMonitor monitor{config};
///   // producer thread
///   monitor.produce(bytes);
///   // consumer, once per frame
///   auto snapshot = monitor.consume();
class RingMonitor {
public:
    /// A drain rate above the ring capacity is clamped to the capacity.
    /// @throws std::invalid_argument if drain_bytes_per_frame or history_frames is 0.
    explicit RingMonitor(const MonitorConfig& config = {});

    RingMonitor(const RingMonitor&) = delete;
    RingMonitor& operator=(const RingMonitor&) = delete;

    /// Producer entry point. Returns the number of bytes accepted.
    std::size_t produce(std::span<const std::uint8_t> data);

    /// Drains up to one quantum and returns the current state.
    [[nodiscard]] MonitorSnapshot consume();

    /// Empties the ring and forgets any partially assembled sample.
    void flush();

    /// Changes the per-frame drain quantum, clamped to [1, max(1, ring capacity)].
    void set_drain_rate(std::size_t bytes_per_frame);

    [[nodiscard]] std::size_t drain_rate() const;

    [[nodiscard]] const MonitorConfig& config() const noexcept { return config_; }

private:
    static constexpr std::size_t kHeadPreviewBytes = 16;

    std::size_t clamp_drain_rate(std::size_t bytes_per_frame) const noexcept;
    float scan_samples(std::span<const std::uint8_t> bytes);

    MonitorConfig config_;

    mutable std::mutex mutex_;
    ByteRingBuffer ring_;
    std::uint64_t bytes_written_ = 0;
    std::uint64_t dropped_bytes_ = 0;
    std::uint64_t overruns_ = 0;

    // Updated without the lock when produce() loses the race for it
    std::atomic<std::uint64_t> contended_bytes_{0};
    std::atomic<std::uint64_t> contended_overruns_{0};

    // Consumer-side state
    std::uint64_t bytes_read_ = 0;
    std::vector<std::uint8_t> drain_buffer_;
    std::array<std::uint8_t, sizeof(float)> partial_sample_{};
    std::size_t partial_size_ = 0;
    std::deque<float> fill_history_;
};

}  // namespace bytering
