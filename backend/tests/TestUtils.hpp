#pragma once

#include "engine/Calendar.hpp"
#include "telemetry/MeterTransport.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace fl::test
{

inline std::filesystem::path make_temp_root(std::string_view tag)
{
    auto root = std::filesystem::temp_directory_path() / "flowledger-test" /
                std::string(tag);
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    std::filesystem::create_directories(root, ec);
    return root;
}

// Local wall-clock instant; throws when the text does not parse.
inline engine::Timestamp local(std::string_view text)
{
    return engine::calendar::parse_iso8601(text).value();
}

// Scripted transport: the test sets what the next tick observes.
class FakeMeter final : public telemetry::MeterTransport
{
  public:
    double flow = 0.0;
    double delta = 0.0;
    bool available = true;
    std::map<std::string, double> accumulators;
    std::map<std::string, engine::Timestamp> targets;
    std::vector<std::string> resets;

    // Adds `ml` to the pending delta and to every accumulator.
    void pour(double ml)
    {
        delta += ml;
        for (auto &entry : accumulators)
        {
            entry.second += ml;
        }
    }

    double flow_rate() const override
    {
        return flow;
    }
    double volume_delta() override
    {
        return std::exchange(delta, 0.0);
    }
    bool availability() const override
    {
        return available;
    }
    double accumulated_volume(std::string const &name) const override
    {
        auto it = accumulators.find(name);
        return it == accumulators.end() ? 0.0 : it->second;
    }
    void add_accumulator(std::string const &name,
                         engine::Timestamp target) override
    {
        accumulators[name] = 0.0;
        targets[name] = target;
    }
    void reset_accumulator(std::string const &name,
                           engine::Timestamp next) override
    {
        accumulators[name] = 0.0;
        targets[name] = next;
        resets.push_back(name);
    }
};

} // namespace fl::test
