#pragma once
#include "event_message.h"

namespace aera {

/// @brief Enumerates the pipeline executive actions
enum class PipelineAction {
    /// @brief Pipeline run has started
    start,

    /// @brief Population has been loaded
    load,

    /// @brief Pipeline run has finished
    finish
};

/// @brief Implements the pipeline information event message data type
struct InfoEventMessage final : public EventMessage {

    InfoEventMessage() = delete;

    /// @brief Initialises a new instance of the InfoEventMessage structure.
    /// @param sender The sender identifier
    /// @param run The pipeline run identifier
    /// @param action Source action identification
    /// @param msg The notification message
    InfoEventMessage(std::string sender, std::string run, PipelineAction action,
                     std::string msg) noexcept;

    /// @brief Gets the source action value
    const PipelineAction action{};

    /// @brief Gets the notification message
    const std::string message;

    int id() const noexcept override;

    std::string to_string() const override;

    void accept(EventMessageVisitor &visitor) const override;
};

namespace detail {
/// @brief Converts enumeration to string
std::string pipeline_action_str(PipelineAction action);
} // namespace detail
} // namespace aera
