#pragma once
namespace aera {

struct InfoEventMessage;
struct StageEventMessage;
struct ErrorEventMessage;

/// @brief Event message types visitor interface (double dispatcher)
class EventMessageVisitor {
  public:
    /// @brief Initialises a new instance of the visitor class
    EventMessageVisitor() = default;

    EventMessageVisitor(const EventMessageVisitor &) = delete;
    EventMessageVisitor &operator=(const EventMessageVisitor &) = delete;

    EventMessageVisitor(EventMessageVisitor &&) = delete;
    EventMessageVisitor &operator=(EventMessageVisitor &&) = delete;

    /// @brief Destroy an instance of the visitor class
    virtual ~EventMessageVisitor() = default;

    /// @brief Visits a aera::InfoEventMessage message type
    /// @param message The message instance to visit
    virtual void visit(const InfoEventMessage &message) = 0;

    /// @brief Visits a aera::StageEventMessage message type
    /// @param message The message instance to visit
    virtual void visit(const StageEventMessage &message) = 0;

    /// @brief Visits a aera::ErrorEventMessage message type
    /// @param message The message instance to visit
    virtual void visit(const ErrorEventMessage &message) = 0;
};
} // namespace aera
