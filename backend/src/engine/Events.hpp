#pragma once

#include "engine/Calendar.hpp"
#include "engine/LeakDetector.hpp"

#include <cstddef>

namespace fl::engine
{

// One per leak-detector transition, after the engine drained it.
struct LeakStateChangedEvent
{
    LeakEvent event;
    Timestamp at = 0.0;
};

// Derived values changed; consumers re-read the engine snapshot. Published
// with available=false when the meter reported no data.
struct AccountingUpdatedEvent
{
    Timestamp at = 0.0;
    bool available = false;
};

struct StateSavedEvent
{
    Timestamp at = 0.0;
    bool success = false;
};

struct SettingsChangedEvent
{
};

} // namespace fl::engine
