#include "telemetry/TelemetryFeed.hpp"

#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <cerrno>
#include <cmath>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace fl::telemetry
{

namespace
{

constexpr int kPollIntervalMs = 200;
constexpr std::size_t kReadChunkBytes = 4096;
constexpr std::size_t kMaxLineBytes = 64 * 1024;

std::string_view trim(std::string_view text)
{
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos)
    {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

} // namespace

TelemetryFeed::TelemetryFeed(std::filesystem::path source, std::size_t capacity)
    : source_(std::move(source)), capacity_(capacity == 0 ? 1 : capacity)
{
}

TelemetryFeed::~TelemetryFeed()
{
    stop();
}

bool TelemetryFeed::start()
{
    if (reader_thread_.joinable())
    {
        return true;
    }
    if (source_.empty() || source_ == "-")
    {
        fd_ = STDIN_FILENO;
        owns_fd_ = false;
    }
    else
    {
        fd_ = ::open(source_.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd_ < 0)
        {
            FL_LOG_ERROR("cannot open telemetry source {}: {}",
                         source_.string(), std::strerror(errno));
            return false;
        }
        owns_fd_ = true;
    }
    exit_requested_.store(false, std::memory_order_release);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        input_closed_ = false;
    }
    reader_thread_ = std::thread([this] { reader_loop(); });
    FL_LOG_INFO("reading telemetry from {}",
                owns_fd_ ? source_.string() : std::string("stdin"));
    return true;
}

void TelemetryFeed::stop()
{
    exit_requested_.store(true, std::memory_order_release);
    space_cv_.notify_all();
    data_cv_.notify_all();
    if (reader_thread_.joinable())
    {
        reader_thread_.join();
    }
    if (owns_fd_ && fd_ >= 0)
    {
        ::close(fd_);
    }
    fd_ = -1;
    owns_fd_ = false;
}

std::vector<Reading> TelemetryFeed::drain()
{
    std::vector<Reading> readings;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        readings.assign(std::make_move_iterator(queue_.begin()),
                        std::make_move_iterator(queue_.end()));
        queue_.clear();
    }
    space_cv_.notify_all();
    return readings;
}

void TelemetryFeed::wait_for_readings(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    data_cv_.wait_for(lock, timeout,
                      [this]
                      {
                          return !queue_.empty() || input_closed_ ||
                                 exit_requested_.load(std::memory_order_acquire);
                      });
}

bool TelemetryFeed::finished() const
{
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return input_closed_ && queue_.empty();
}

std::optional<Reading> TelemetryFeed::parse_line(std::string_view line,
                                                 bool *malformed)
{
    if (malformed != nullptr)
    {
        *malformed = false;
    }
    auto text = trim(line);
    if (text.empty() || text.front() == '#')
    {
        return std::nullopt;
    }
    auto fail = [malformed]() -> std::optional<Reading>
    {
        if (malformed != nullptr)
        {
            *malformed = true;
        }
        return std::nullopt;
    };

    auto document = json::Document::parse(text);
    auto *root = document.root();
    if (root == nullptr || !yyjson_is_obj(root))
    {
        return fail();
    }
    Reading reading;
    reading.available = json::get_bool(root, "available").value_or(true);
    auto flow = json::get_number(root, "flow_rate");
    if (reading.available && (!flow || !std::isfinite(*flow)))
    {
        return fail();
    }
    reading.flow_rate = flow.value_or(0.0);
    if (auto *delta = yyjson_obj_get(root, "volume_delta"); delta != nullptr)
    {
        if (!yyjson_is_num(delta))
        {
            return fail();
        }
        reading.volume_delta = yyjson_get_num(delta);
        if (!std::isfinite(reading.volume_delta) || reading.volume_delta < 0.0)
        {
            return fail();
        }
    }
    if (auto *ts = yyjson_obj_get(root, "timestamp"); ts != nullptr)
    {
        if (yyjson_is_num(ts) && std::isfinite(yyjson_get_num(ts)))
        {
            reading.timestamp = yyjson_get_num(ts);
        }
        else if (yyjson_is_str(ts))
        {
            reading.timestamp = engine::calendar::parse_iso8601(
                std::string_view(yyjson_get_str(ts), yyjson_get_len(ts)));
            if (!reading.timestamp)
            {
                return fail();
            }
        }
        else if (!yyjson_is_null(ts))
        {
            return fail();
        }
    }
    return reading;
}

void TelemetryFeed::handle_line(std::string_view line)
{
    bool malformed = false;
    auto reading = parse_line(line, &malformed);
    if (reading)
    {
        push(std::move(*reading));
        return;
    }
    if (malformed)
    {
        auto count = malformed_.fetch_add(1, std::memory_order_relaxed) + 1;
        FL_LOG_WARN("skipping malformed telemetry line #{}: {}", count,
                    trim(line).substr(0, 120));
    }
}

void TelemetryFeed::push(Reading reading)
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    space_cv_.wait(lock,
                   [this]
                   {
                       return queue_.size() < capacity_ ||
                              exit_requested_.load(std::memory_order_acquire);
                   });
    if (exit_requested_.load(std::memory_order_acquire))
    {
        return;
    }
    queue_.push_back(std::move(reading));
    lock.unlock();
    data_cv_.notify_one();
}

void TelemetryFeed::reader_loop()
{
    std::string pending;
    char chunk[kReadChunkBytes];
    while (!exit_requested_.load(std::memory_order_acquire))
    {
        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, kPollIntervalMs);
        if (ready < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            FL_LOG_ERROR("telemetry poll failed: {}", std::strerror(errno));
            break;
        }
        if (ready == 0)
        {
            continue;
        }
        auto count = ::read(fd_, chunk, sizeof(chunk));
        if (count < 0)
        {
            if (errno == EINTR || errno == EAGAIN)
            {
                continue;
            }
            FL_LOG_ERROR("telemetry read failed: {}", std::strerror(errno));
            break;
        }
        if (count == 0)
        {
            break;
        }
        pending.append(chunk, static_cast<std::size_t>(count));
        std::size_t start = 0;
        for (auto newline = pending.find('\n', start);
             newline != std::string::npos;
             newline = pending.find('\n', start))
        {
            handle_line(std::string_view(pending).substr(start, newline - start));
            start = newline + 1;
        }
        pending.erase(0, start);
        if (pending.size() > kMaxLineBytes)
        {
            malformed_.fetch_add(1, std::memory_order_relaxed);
            FL_LOG_WARN("dropping telemetry line longer than {} bytes",
                        kMaxLineBytes);
            pending.clear();
        }
    }
    if (!pending.empty() && !exit_requested_.load(std::memory_order_acquire))
    {
        handle_line(pending);
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        input_closed_ = true;
    }
    data_cv_.notify_all();
    FL_LOG_INFO("telemetry input closed");
}

} // namespace fl::telemetry
