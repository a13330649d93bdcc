#include "engine/ConfigurationService.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/PersistenceManager.hpp"
#include "utils/Log.hpp"

#include <mutex>
#include <utility>

namespace fl::engine
{

ConfigurationService::ConfigurationService(PersistenceManager *persistence,
                                           EventBus *bus, CoreSettings initial)
    : persistence_(persistence), bus_(bus), settings_(std::move(initial))
{
}

CoreSettings ConfigurationService::get() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return settings_;
}

SettingsManager::ApplyResult
ConfigurationService::update(SettingsUpdate const &update)
{
    SettingsManager::ApplyResult result;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        result = SettingsManager::apply_update(settings_, update);
        if (result.persist)
        {
            settings_ = result.settings;
        }
    }

    if (result.persist)
    {
        mark_dirty();
        notify_listeners();
    }
    return result;
}

void ConfigurationService::mark_dirty()
{
    dirty_.store(true, std::memory_order_release);
}

void ConfigurationService::persist_if_dirty()
{
    if (!dirty_.load(std::memory_order_acquire))
        return;
    persist_now();
}

void ConfigurationService::persist_now()
{
    if (!persistence_)
        return;

    CoreSettings copy = get();
    if (persistence_->persist_settings(copy))
    {
        dirty_.store(false, std::memory_order_release);
    }
    else
    {
        FL_LOG_WARN("failed to persist settings");
    }
}

void ConfigurationService::notify_listeners()
{
    if (bus_ != nullptr)
    {
        bus_->publish(SettingsChangedEvent{});
    }
}

} // namespace fl::engine
