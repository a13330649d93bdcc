#pragma once

#include <algorithm>
#include <any>
#include <cstddef>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fl::engine
{

class EventBus
{
  public:
    using SubscriptionId = std::size_t;
    template <typename T> using Handler = std::function<void(T const &)>;

    template <typename T> SubscriptionId subscribe(Handler<T> handler)
    {
        std::unique_lock lock(handlers_mutex_);
        auto id = next_id_++;
        auto &handlers = handlers_[std::type_index(typeid(T))];
        handlers.push_back(
            {id, [handler = std::move(handler)](std::any const &event)
             { handler(std::any_cast<T const &>(event)); }});
        return id;
    }

    bool unsubscribe(SubscriptionId id)
    {
        std::unique_lock lock(handlers_mutex_);
        for (auto &entry : handlers_)
        {
            auto &list = entry.second;
            auto it = std::find_if(list.begin(), list.end(),
                                   [id](Subscription const &sub)
                                   { return sub.id == id; });
            if (it != list.end())
            {
                list.erase(it);
                return true;
            }
        }
        return false;
    }

    // Handlers run on the publishing thread, outside the registry lock, so a
    // handler may subscribe or publish in turn.
    template <typename T> std::size_t publish(T const &event) const
    {
        std::vector<Subscription> handlers_copy;
        {
            std::shared_lock lock(handlers_mutex_);
            auto it = handlers_.find(std::type_index(typeid(T)));
            if (it != handlers_.end())
            {
                handlers_copy = it->second;
            }
        }
        if (handlers_copy.empty())
        {
            return 0;
        }
        std::any const boxed = event;
        for (auto const &sub : handlers_copy)
        {
            sub.handler(boxed);
        }
        return handlers_copy.size();
    }

  private:
    struct Subscription
    {
        SubscriptionId id;
        std::function<void(std::any const &)> handler;
    };

    std::unordered_map<std::type_index, std::vector<Subscription>> handlers_;
    SubscriptionId next_id_ = 1;
    mutable std::shared_mutex handlers_mutex_;
};

} // namespace fl::engine
