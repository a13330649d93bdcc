#pragma once

#include "engine/AccountingEngine.hpp"
#include "engine/Calendar.hpp"
#include "engine/LeakDetector.hpp"

#include <string>

namespace fl::report
{

// One JSON object with every derived value of the snapshot. Absent
// statistics are written as null.
std::string serialize_status(engine::AccountingSnapshot const &snapshot,
                             bool pretty = false);

// {"event":"water_leak_detected","min_flow":...,"threshold":...,"at":...}
std::string serialize_leak_event(engine::LeakEvent const &event,
                                 engine::Timestamp at);

} // namespace fl::report
