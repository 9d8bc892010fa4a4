#pragma once

#include "Aera/event_aggregator.h"

#include <memory>
#include <vector>

namespace aera::host {
/// @brief Defined the event monitor class used for processing AERA event messages
///
/// All messages are written to the terminal as they are published; the pipeline runs on a
/// single thread, so messages are rendered synchronously in publication order.
class EventMonitor final : public aera::EventMessageVisitor {
  public:
    EventMonitor() = delete;

    /// @brief Initialises a new instance of the EventMonitor class.
    /// @param event_bus The message bus instance to monitor
    /// @param verbose Whether to print the stage metrics
    EventMonitor(aera::EventAggregator &event_bus, bool verbose);

    /// @brief Destroys a EventMonitor instance
    ~EventMonitor() noexcept override;

    /// @brief Stops the monitor, no new messages are processed after stop
    void stop() noexcept;

    void visit(const aera::InfoEventMessage &message) override;
    void visit(const aera::StageEventMessage &message) override;
    void visit(const aera::ErrorEventMessage &message) override;

  private:
    bool verbose_;
    std::vector<std::unique_ptr<aera::EventSubscriber>> handlers_;

    void event_handler(const std::shared_ptr<aera::EventMessage> &message);
};
} // namespace aera::host
