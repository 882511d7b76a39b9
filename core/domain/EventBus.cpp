#include "EventBus.hpp"
#include <iostream>

namespace worktrack::domain {

void EventBus::publish(const ports::TrackingChange& change) {
    std::lock_guard<std::mutex> lock(queueMutex_);
    changeQueue_.push(change);
}

void EventBus::subscribe(ports::ChangeKind kind, Handler handler) {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    handlers_[kind].push_back(std::move(handler));
}

void EventBus::unsubscribe(ports::ChangeKind kind) {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    handlers_.erase(kind);
}

std::size_t EventBus::pendingCount() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return changeQueue_.size();
}

void EventBus::processEvents() {
    if (processing_) return; // Prevent recursive processing
    
    processing_ = true;
    
    while (true) {
        ports::TrackingChange change;
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (changeQueue_.empty()) break;
            
            change = std::move(changeQueue_.front());
            changeQueue_.pop();
        }
        
        std::vector<Handler> handlers;
        {
            std::lock_guard<std::mutex> lock(handlersMutex_);
            auto it = handlers_.find(change.kind);
            if (it != handlers_.end()) {
                handlers = it->second;
            }
        }
        
        for (const auto& handler : handlers) {
            try {
                handler(change);
            } catch (const std::exception& e) {
                std::cerr << "[EventBus] Handler failed for session " << change.sessionId
                          << ": " << e.what() << std::endl;
            }
        }
    }
    
    processing_ = false;
}

} // namespace worktrack::domain
