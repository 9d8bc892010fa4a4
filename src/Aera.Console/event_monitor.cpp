#include "event_monitor.h"

#include "Aera/error_message.h"
#include "Aera/info_message.h"
#include "Aera/stage_message.h"

#include <fmt/color.h>
#include <fmt/core.h>

namespace aera::host {
EventMonitor::EventMonitor(aera::EventAggregator &event_bus, bool verbose) : verbose_{verbose} {
    for (auto event_type :
         {aera::EventType::info, aera::EventType::stage, aera::EventType::error}) {
        handlers_.emplace_back(event_bus.subscribe(
            event_type, [this](std::shared_ptr<aera::EventMessage> message) {
                event_handler(message);
            }));
    }
}

EventMonitor::~EventMonitor() noexcept { stop(); }

void EventMonitor::stop() noexcept {
    for (auto &handler : handlers_) {
        handler->unsubscribe();
    }

    handlers_.clear();
}

void EventMonitor::visit(const aera::InfoEventMessage &message) {
    fmt::print(fg(fmt::color::light_blue), "{}\n", message.to_string());
}

void EventMonitor::visit(const aera::StageEventMessage &message) {
    fmt::print(fg(fmt::color::cornflower_blue), "{}\n", message.to_string());
    if (!verbose_) {
        return;
    }

    for (const auto &[name, value] : message.metrics) {
        fmt::print(fg(fmt::color::gray), "    {:<16} {}\n", name, core::to_string(value));
    }
}

void EventMonitor::visit(const aera::ErrorEventMessage &message) {
    fmt::print(fg(fmt::color::red), "{}\n", message.to_string());
}

void EventMonitor::event_handler(const std::shared_ptr<aera::EventMessage> &message) {
    message->accept(*this);
}
} // namespace aera::host
