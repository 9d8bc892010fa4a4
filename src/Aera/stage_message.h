#pragma once
#include "event_message.h"

#include "Aera.Core/poco.h"

#include <cstddef>
#include <cstdint>

namespace aera {

/// @brief Implements the pipeline stage completion event message data type
struct StageEventMessage final : public EventMessage {

    StageEventMessage() = delete;

    /// @brief Initialises a new instance of the StageEventMessage structure.
    /// @param sender The sender identifier
    /// @param run The pipeline run identifier
    /// @param record The stage audit record
    StageEventMessage(std::string sender, std::string run, core::AuditRecord record) noexcept;

    /// @brief Gets the stage name
    const std::string stage;

    /// @brief Gets the stage completion status
    const core::StageStatus status{};

    /// @brief Gets the number of records processed by the stage
    const std::size_t processed{};

    /// @brief Gets the time since the run start, in milliseconds
    const std::int64_t elapsed_ms{};

    /// @brief Gets the stage metrics
    const core::AuditMetrics metrics;

    int id() const noexcept override;

    std::string to_string() const override;

    void accept(EventMessageVisitor &visitor) const override;
};
} // namespace aera
