#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

namespace trisolar::core
{
struct Event
{
    std::string name;
    std::vector<std::string> args;
    std::int64_t atMs = 0;
    std::string recipient; ///< empty = everyone
};

/// Queued publish/subscribe. Handlers run only from DispatchQueued(), so a
/// publisher never re-enters its own subscribers mid-tick.
class EventBus
{
public:
    using Handler = std::function<void(const Event&)>;

    void Subscribe(const std::string& eventName, Handler handler);
    /// Receives every event regardless of name, after the named handlers.
    void SubscribeAll(Handler handler);
    void Publish(Event event);
    void DispatchQueued();

    [[nodiscard]] std::size_t PendingCount() const { return m_queue.size(); }

private:
    std::unordered_map<std::string, std::vector<Handler>> m_handlers;
    std::vector<Handler> m_catchAllHandlers;
    std::queue<Event> m_queue;
};
} // namespace trisolar::core
