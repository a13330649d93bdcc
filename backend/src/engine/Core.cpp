#include "engine/Core.hpp"

#include "engine/ConfigurationService.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/PersistenceManager.hpp"
#include "engine/SchedulerService.hpp"
#include "engine/SettingsManager.hpp"
#include "telemetry/TelemetryFeed.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

namespace fl::engine
{

namespace
{

constexpr auto kSettingsFlushInterval = std::chrono::milliseconds(500);

std::filesystem::path resolve_state_path(CoreSettings const &settings)
{
    if (!settings.state_path.empty())
    {
        return settings.state_path;
    }
    return fl::utils::data_root() / "flowledger.db";
}

} // namespace

enum class EngineState
{
    Running,
    ShuttingDown,
    Stopped
};

struct Core::Impl
{
    std::unique_ptr<EventBus> event_bus;
    std::unique_ptr<PersistenceManager> persistence;
    std::unique_ptr<ConfigurationService> config_service;
    std::unique_ptr<telemetry::LocalMeter> meter;
    std::unique_ptr<AccountingEngine> engine;
    std::unique_ptr<SchedulerService> scheduler_service;
    std::unique_ptr<telemetry::TelemetryFeed> feed;

    // Serializes meter.apply + engine.on_tick pairs.
    std::mutex tick_mutex;

    std::mutex ingest_mutex;
    std::condition_variable ingest_cv;
    std::deque<telemetry::Reading> ingest_queue;

    std::atomic<EngineState> state{EngineState::Running};
    std::atomic_bool shutdown_requested{false};
    std::atomic_bool run_completed{false};
    std::atomic<int> pending_save_interval{0};
    SchedulerService::TaskId save_task = 0;
    CoreSettings settings_;

    Impl(CoreSettings settings, SettingsUpdate const &overrides)
        : settings_(std::move(settings))
    {
        auto const now = calendar::now_seconds();
        auto state_path = resolve_state_path(settings_);

        event_bus = std::make_unique<EventBus>();
        persistence = std::make_unique<PersistenceManager>(state_path);
        if (!persistence->is_valid())
        {
            FL_LOG_WARN("state database {} unavailable; running without "
                        "persistence",
                        state_path.string());
        }

        config_service = std::make_unique<ConfigurationService>(
            persistence.get(), event_bus.get(),
            persistence->load_settings(settings_));
        if (!overrides.empty())
        {
            config_service->update(overrides);
        }
        auto effective = config_service->get();

        meter = std::make_unique<telemetry::LocalMeter>();
        engine = std::make_unique<AccountingEngine>(
            meter.get(), now, SettingsManager::accounting_settings(effective));

        if (auto stored = persistence->load_state(now); stored)
        {
            engine->restore(*stored);
        }
        if (auto rolled = engine->handle_stale_boundaries(now); rolled > 0)
        {
            FL_LOG_INFO("caught up {} period boundaries crossed while stopped",
                        rolled);
        }
        engine->register_accumulators(now);

        scheduler_service = std::make_unique<SchedulerService>();
        save_task = scheduler_service->schedule(
            "state-save", std::chrono::seconds(effective.save_interval_seconds),
            [this]() { save_state(); });
        scheduler_service->schedule("settings-flush", kSettingsFlushInterval,
                                    [this]()
                                    {
                                        if (config_service)
                                            config_service->persist_if_dirty();
                                    });

        event_bus->subscribe<SettingsChangedEvent>(
            [this](auto const &)
            {
                auto current = config_service->get();
                engine->apply_settings(
                    SettingsManager::accounting_settings(current));
                pending_save_interval.store(current.save_interval_seconds,
                                            std::memory_order_release);
            });

        if (settings_.read_input)
        {
            feed = std::make_unique<telemetry::TelemetryFeed>(
                settings_.input_path);
        }

        FL_LOG_INFO("accounting engine ready (tariff {}, leak threshold {} "
                    "L/min, units {})",
                    effective.water_tariff, effective.leak_threshold,
                    SettingsManager::unit_system_name(effective.unit_system));
    }

    ~Impl()
    {
        if (feed)
        {
            feed->stop();
        }
        if (!run_completed.load())
        {
            process_pending();
            save_state();
            if (config_service)
                config_service->persist_if_dirty();
        }
    }

    void apply_reading(telemetry::Reading const &reading)
    {
        auto const now =
            reading.timestamp ? *reading.timestamp : calendar::now_seconds();
        std::optional<LeakEvent> leak;
        bool changed = false;
        {
            std::lock_guard<std::mutex> lock(tick_mutex);
            meter->apply(reading);
            changed = engine->on_tick(now);
            leak = engine->drain_pending_leak_event();
        }
        event_bus->publish(AccountingUpdatedEvent{now, changed});
        if (leak)
        {
            event_bus->publish(LeakStateChangedEvent{*leak, now});
        }
    }

    std::size_t process_pending()
    {
        std::deque<telemetry::Reading> batch;
        {
            std::lock_guard<std::mutex> lock(ingest_mutex);
            batch.swap(ingest_queue);
        }
        std::size_t applied = 0;
        if (feed)
        {
            for (auto const &reading : feed->drain())
            {
                apply_reading(reading);
                ++applied;
            }
        }
        for (auto const &reading : batch)
        {
            apply_reading(reading);
            ++applied;
        }
        return applied;
    }

    bool save_state()
    {
        auto const now = calendar::now_seconds();
        PersistedState captured;
        {
            std::lock_guard<std::mutex> lock(tick_mutex);
            captured = engine->capture();
        }
        bool const ok = persistence->save_state(captured, now);
        if (ok)
        {
            FL_LOG_DEBUG("accounting state saved");
        }
        else
        {
            FL_LOG_WARN("failed to save accounting state");
        }
        event_bus->publish(StateSavedEvent{now, ok});
        return ok;
    }

    void apply_pending_interval()
    {
        auto seconds = pending_save_interval.exchange(0);
        if (seconds <= 0 || seconds == settings_.save_interval_seconds)
        {
            return;
        }
        settings_.save_interval_seconds = seconds;
        scheduler_service->reschedule(save_task, std::chrono::seconds(seconds));
        FL_LOG_INFO("state save interval set to {}s", seconds);
    }

    void wait_for_work(std::chrono::milliseconds timeout)
    {
        if (feed)
        {
            feed->wait_for_readings(timeout);
            return;
        }
        std::unique_lock<std::mutex> lock(ingest_mutex);
        ingest_cv.wait_for(lock, timeout,
                           [this]
                           {
                               return !ingest_queue.empty() ||
                                      shutdown_requested.load();
                           });
    }

    void run()
    {
        if (feed && !feed->start())
        {
            FL_LOG_ERROR("cannot read telemetry from {}",
                         settings_.input_path.string());
            shutdown_requested.store(true);
        }

        while (!shutdown_requested.load())
        {
            process_pending();

            if (feed && feed->finished())
            {
                FL_LOG_INFO("telemetry input ended ({} malformed lines)",
                            feed->malformed_lines());
                if (settings_.stop_at_end_of_input)
                {
                    break;
                }
                feed->stop();
                feed.reset();
            }

            apply_pending_interval();
            auto now = std::chrono::steady_clock::now();
            scheduler_service->tick(now);

            auto sched_wait = scheduler_service->time_until_next_task(now);
            auto wait_limit = std::min<long long>(
                static_cast<long long>(settings_.idle_sleep_ms),
                static_cast<long long>(sched_wait.count()));
            wait_for_work(
                std::chrono::milliseconds(std::max<long long>(1, wait_limit)));
        }

        state.store(EngineState::ShuttingDown);
        if (feed)
        {
            feed->stop();
        }
        process_pending();
        save_state();
        config_service->persist_now();
        run_completed.store(true);
        state.store(EngineState::Stopped);
        FL_LOG_INFO("accounting engine stopped");
    }
};

Core::~Core() = default;

Core::Core(CoreSettings s, SettingsUpdate overrides)
    : impl_(std::make_unique<Impl>(std::move(s), overrides))
{
}

std::unique_ptr<Core> Core::create(CoreSettings s, SettingsUpdate overrides)
{
    return std::make_unique<Core>(std::move(s), std::move(overrides));
}

void Core::run()
{
    if (impl_)
        impl_->run();
}

void Core::stop() noexcept
{
    if (!impl_)
        return;
    impl_->shutdown_requested = true;
    impl_->ingest_cv.notify_all();
}

bool Core::is_running() const noexcept
{
    return impl_ && impl_->state.load() != EngineState::Stopped;
}

void Core::ingest(telemetry::Reading reading)
{
    {
        std::lock_guard<std::mutex> lock(impl_->ingest_mutex);
        impl_->ingest_queue.push_back(std::move(reading));
    }
    impl_->ingest_cv.notify_one();
}

std::size_t Core::process_pending()
{
    return impl_->process_pending();
}

AccountingSnapshot Core::snapshot() const
{
    return impl_->engine->snapshot(calendar::now_seconds());
}

CoreSettings Core::settings() const
{
    return impl_->config_service->get();
}

void Core::update_settings(SettingsUpdate update)
{
    impl_->config_service->update(update);
}

bool Core::save_now()
{
    return impl_->save_state();
}

EventBus &Core::events() noexcept
{
    return *impl_->event_bus;
}

std::optional<AccountingSnapshot>
Core::offline_snapshot(CoreSettings settings, SettingsUpdate const &overrides,
                       Timestamp now)
{
    auto state_path = resolve_state_path(settings);
    std::error_code ec;
    if (!std::filesystem::exists(state_path, ec))
    {
        FL_LOG_WARN("no state database at {}", state_path.string());
        return std::nullopt;
    }

    PersistenceManager persistence(state_path);
    if (!persistence.is_valid())
    {
        return std::nullopt;
    }
    auto effective = SettingsManager::apply_update(
                         persistence.load_settings(std::move(settings)),
                         overrides)
                         .settings;

    AccountingEngine engine(nullptr, now,
                            SettingsManager::accounting_settings(effective));
    auto stored = persistence.load_state(now);
    if (!stored)
    {
        return std::nullopt;
    }
    engine.restore(*stored);
    engine.handle_stale_boundaries(now);
    return engine.snapshot(now);
}

} // namespace fl::engine
