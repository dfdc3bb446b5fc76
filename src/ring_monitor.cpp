#include "bytering/ring_monitor.hpp"

#include "bytering/ring_format.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <stdexcept>

namespace bytering {

RingMonitor::RingMonitor(const MonitorConfig& config)
    : config_{config}, ring_{config.ring_capacity} {
    if (config_.drain_bytes_per_frame == 0) {
        throw std::invalid_argument("Drain rate must be at least one byte per frame");
    }
    if (config_.history_frames == 0) {
        throw std::invalid_argument("History must hold at least one frame");
    }

    config_.drain_bytes_per_frame = clamp_drain_rate(config_.drain_bytes_per_frame);
    drain_buffer_.resize(config_.drain_bytes_per_frame);
}

std::size_t RingMonitor::produce(std::span<const std::uint8_t> data) {
    std::unique_lock lock{mutex_, std::try_to_lock};
    if (!lock.owns_lock()) {
        // Consumer holds the ring - never block the producer
        if (!data.empty()) {
            contended_bytes_.fetch_add(data.size(), std::memory_order_relaxed);
            contended_overruns_.fetch_add(1, std::memory_order_relaxed);
        }
        return 0;
    }

    const auto written = ring_.write(data);
    bytes_written_ += written;
    if (written < data.size()) {
        dropped_bytes_ += data.size() - written;
        ++overruns_;
    }
    return written;
}

MonitorSnapshot RingMonitor::consume() {
    std::lock_guard lock{mutex_};

    const auto drained = ring_.read(std::span<std::uint8_t>{drain_buffer_});
    bytes_read_ += drained;

    MonitorSnapshot result;
    result.timestamp = std::chrono::steady_clock::now();
    result.peak_level = scan_samples({drain_buffer_.data(), drained});

    result.fill_bytes = ring_.read_available();
    result.capacity = ring_.capacity();
    result.drain_bytes_per_frame = config_.drain_bytes_per_frame;
    result.bytes_written = bytes_written_;
    result.bytes_read = bytes_read_;
    result.dropped_bytes = dropped_bytes_ + contended_bytes_.load(std::memory_order_relaxed);
    result.overruns = overruns_ + contended_overruns_.load(std::memory_order_relaxed);

    // Rolling fill-level history
    const float fill_ratio =
        result.capacity == 0
            ? 0.0f
            : static_cast<float>(result.fill_bytes) / static_cast<float>(result.capacity);
    fill_history_.push_back(fill_ratio);
    while (fill_history_.size() > config_.history_frames) {
        fill_history_.pop_front();
    }
    result.fill_history.assign(fill_history_.begin(), fill_history_.end());

    std::array<std::uint8_t, kHeadPreviewBytes> head{};
    const auto head_size = ring_.peek(head);
    result.head_hex = to_hex({head.data(), head_size});

    return result;
}

void RingMonitor::flush() {
    std::lock_guard lock{mutex_};
    ring_.flush();
    partial_size_ = 0;
}

void RingMonitor::set_drain_rate(std::size_t bytes_per_frame) {
    std::lock_guard lock{mutex_};
    const auto rate = clamp_drain_rate(bytes_per_frame);
    drain_buffer_.resize(rate);
    config_.drain_bytes_per_frame = rate;
}

std::size_t RingMonitor::drain_rate() const {
    std::lock_guard lock{mutex_};
    return config_.drain_bytes_per_frame;
}

std::size_t RingMonitor::clamp_drain_rate(std::size_t bytes_per_frame) const noexcept {
    // Draining more than the ring can hold never moves more bytes
    return std::clamp<std::size_t>(bytes_per_frame, 1, std::max<std::size_t>(ring_.capacity(), 1));
}

float RingMonitor::scan_samples(std::span<const std::uint8_t> bytes) {
    float peak = 0.0f;
    std::size_t offset = 0;

    // Complete a sample left over from the previous frame
    if (partial_size_ > 0) {
        const auto take = std::min(sizeof(float) - partial_size_, bytes.size());
        std::memcpy(partial_sample_.data() + partial_size_, bytes.data(), take);
        partial_size_ += take;
        offset = take;

        if (partial_size_ < sizeof(float)) {
            return peak;
        }

        float sample = 0.0f;
        std::memcpy(&sample, partial_sample_.data(), sizeof(float));
        if (std::isfinite(sample)) {
            peak = std::max(peak, std::abs(sample));
        }
        partial_size_ = 0;
    }

    for (; offset + sizeof(float) <= bytes.size(); offset += sizeof(float)) {
        float sample = 0.0f;
        std::memcpy(&sample, bytes.data() + offset, sizeof(float));
        if (std::isfinite(sample)) {
            peak = std::max(peak, std::abs(sample));
        }
    }

    // Carry a trailing fragment into the next frame
    const auto tail = bytes.size() - offset;
    std::memcpy(partial_sample_.data(), bytes.data() + offset, tail);
    partial_size_ = tail;

    return peak;
}

}  // namespace bytering
