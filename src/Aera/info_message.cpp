#include "info_message.h"
#include <fmt/format.h>

#include <utility>

namespace aera {

InfoEventMessage::InfoEventMessage(std::string sender, std::string run, PipelineAction action,
                                   std::string msg) noexcept
    : EventMessage{std::move(sender), std::move(run)}, action{action}, message{std::move(msg)} {}

int InfoEventMessage::id() const noexcept { return static_cast<int>(EventType::info); }

std::string InfoEventMessage::to_string() const {
    if (message.empty()) {
        return fmt::format("Source: {}, run: {}, {}", source, run_id,
                           detail::pipeline_action_str(action));
    }

    return fmt::format("Source: {}, run: {}, {} - {}", source, run_id,
                       detail::pipeline_action_str(action), message);
}

void InfoEventMessage::accept(EventMessageVisitor &visitor) const { visitor.visit(*this); }

namespace detail {
std::string pipeline_action_str(PipelineAction action) {
    switch (action) {
    case PipelineAction::start:
        return "start";
    case PipelineAction::load:
        return "load";
    case PipelineAction::finish:
        return "finish";
    default:
        return "unknown";
    }
}
} // namespace detail
} // namespace aera
