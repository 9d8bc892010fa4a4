#include "error_message.h"
#include <sstream>

namespace aera {

ErrorEventMessage::ErrorEventMessage(std::string sender, std::string run,
                                     std::string what) noexcept
    : EventMessage{std::move(sender), std::move(run)}, message{std::move(what)} {}

int ErrorEventMessage::id() const noexcept { return static_cast<int>(EventType::error); }

std::string ErrorEventMessage::to_string() const {
    std::stringstream ss;
    ss << "Source: " << source << ", run: " << run_id << ", cause: " << message;
    return ss.str();
}

void ErrorEventMessage::accept(EventMessageVisitor &visitor) const { visitor.visit(*this); }
} // namespace aera
