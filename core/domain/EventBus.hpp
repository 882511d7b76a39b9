#pragma once

#include "../ports/IEventBus.hpp"
#include <mutex>
#include <queue>
#include <unordered_map>
#include <vector>

namespace worktrack::domain {

/**
 * @brief Queued fan-out of tracking changes
 *
 * publish() may be called from any thread; handlers run on the thread that
 * calls processEvents().
 */
class EventBus : public ports::IEventBus {
public:
    EventBus() = default;
    ~EventBus() override = default;

    void publish(const ports::TrackingChange& change) override;
    void subscribe(ports::ChangeKind kind, Handler handler) override;
    void unsubscribe(ports::ChangeKind kind) override;
    void processEvents() override;

    std::size_t pendingCount() const;

private:
    std::unordered_map<ports::ChangeKind, std::vector<Handler>> handlers_;
    std::queue<ports::TrackingChange> changeQueue_;
    mutable std::mutex queueMutex_;
    std::mutex handlersMutex_;
    bool processing_ = false;
};

} // namespace worktrack::domain
