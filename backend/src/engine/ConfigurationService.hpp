#pragma once

#include "engine/Core.hpp"
#include "engine/SettingsManager.hpp"

#include <atomic>
#include <shared_mutex>

namespace fl::engine
{

class PersistenceManager;
class EventBus;

class ConfigurationService
{
  public:
    ConfigurationService(PersistenceManager *persistence, EventBus *bus,
                         CoreSettings initial);

    CoreSettings get() const;

    // Applies the valid parts of `update`; publishes SettingsChangedEvent
    // when anything changed.
    SettingsManager::ApplyResult update(SettingsUpdate const &update);

    void persist_if_dirty();
    void persist_now();
    bool is_dirty() const noexcept
    {
        return dirty_.load(std::memory_order_acquire);
    }

  private:
    void mark_dirty();
    void notify_listeners();

    PersistenceManager *persistence_;
    EventBus *bus_;

    mutable std::shared_mutex mutex_;
    CoreSettings settings_;

    std::atomic_bool dirty_{false};
};

} // namespace fl::engine
