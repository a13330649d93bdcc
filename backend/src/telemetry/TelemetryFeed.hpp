#pragma once

#include "telemetry/LocalMeter.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace fl::telemetry
{

// Reads newline-delimited JSON readings on a background thread:
//   {"flow_rate":2.5,"volume_delta":150,"available":true,"timestamp":...}
// An empty source path (or "-") reads standard input.
class TelemetryFeed
{
  public:
    static constexpr std::size_t kDefaultCapacity = 1024;

    explicit TelemetryFeed(std::filesystem::path source,
                           std::size_t capacity = kDefaultCapacity);
    TelemetryFeed(TelemetryFeed const &) = delete;
    TelemetryFeed &operator=(TelemetryFeed const &) = delete;
    ~TelemetryFeed();

    // Returns false when the source cannot be opened.
    bool start();
    void stop();

    std::vector<Reading> drain();
    // Blocks until a reading is queued, input ends or the timeout passes.
    void wait_for_readings(std::chrono::milliseconds timeout);

    // True once the source hit end of input and every reading was drained.
    bool finished() const;
    std::size_t malformed_lines() const noexcept
    {
        return malformed_.load(std::memory_order_relaxed);
    }

    // Empty lines and `#` comments yield nullopt without counting as
    // malformed; see malformed_lines().
    static std::optional<Reading> parse_line(std::string_view line,
                                             bool *malformed = nullptr);

  private:
    void reader_loop();
    void handle_line(std::string_view line);
    void push(Reading reading);

    std::filesystem::path source_;
    std::size_t capacity_;
    int fd_ = -1;
    bool owns_fd_ = false;

    std::thread reader_thread_;
    std::atomic<bool> exit_requested_{false};
    std::atomic<std::size_t> malformed_{0};

    mutable std::mutex queue_mutex_;
    std::condition_variable data_cv_;
    std::condition_variable space_cv_;
    std::deque<Reading> queue_;
    bool input_closed_ = false;
};

} // namespace fl::telemetry
