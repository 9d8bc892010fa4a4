#include "event_subscriber.h"

namespace aera {
EventSubscriberHandler::EventSubscriberHandler(EventHandlerIdentifier id, EventAggregator *hub)
    : identifier_{std::move(id)}, event_hub_{hub} {

    if (hub == nullptr) {
        throw std::invalid_argument("The event aggregator hub argument must not be null.");
    }
}

EventSubscriberHandler::~EventSubscriberHandler() { unsubscribe(); }

void EventSubscriberHandler::unsubscribe() {
    if (event_hub_) {
        event_hub_->unsubscribe(*this);
        event_hub_ = nullptr;
    }
}

const EventHandlerIdentifier &EventSubscriberHandler::id() const noexcept { return identifier_; }
} // namespace aera
