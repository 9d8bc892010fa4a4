#include "stage_message.h"
#include <fmt/format.h>

#include <utility>

namespace aera {

StageEventMessage::StageEventMessage(std::string sender, std::string run,
                                     core::AuditRecord record) noexcept
    : EventMessage{std::move(sender), std::move(run)}, stage{std::move(record.stage)},
      status{record.status}, processed{record.processed_records},
      elapsed_ms{record.duration_ms}, metrics{std::move(record.metrics)} {}

int StageEventMessage::id() const noexcept { return static_cast<int>(EventType::stage); }

std::string StageEventMessage::to_string() const {
    return fmt::format("Source: {}, stage: {:<16} {}, processed: {}, elapsed: {}ms", source, stage,
                       core::to_string(status), processed, elapsed_ms);
}

void StageEventMessage::accept(EventMessageVisitor &visitor) const { visitor.visit(*this); }
} // namespace aera
