#include "types.hpp"

#include <algorithm>
#include <cctype>

std::string label_name(ItemClass c) { return c == ItemClass::Can ? "Can" : "Plastic"; }

std::string wire_name(ItemClass c) { return c == ItemClass::Can ? "can" : "plastic"; }

std::optional<ItemClass> parse_item_class(const std::string& s) {
  std::string lower(s);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  if (lower == "can") return ItemClass::Can;
  if (lower == "plastic") return ItemClass::Plastic;
  return std::nullopt;
}

std::string error_kind_name(ErrorKind k) {
  switch (k) {
    case ErrorKind::CaptureUnavailable:
      return "CaptureUnavailable";
    case ErrorKind::TransportError:
      return "TransportError";
    case ErrorKind::ClassificationError:
      return "ClassificationError";
    case ErrorKind::ActuationError:
      return "ActuationError";
    case ErrorKind::ProtocolError:
      return "ProtocolError";
    case ErrorKind::Busy:
      return "Busy";
    case ErrorKind::InvalidState:
      return "InvalidState";
  }
  return "Unknown";
}

std::string session_status_name(SessionStatus s) {
  switch (s) {
    case SessionStatus::Idle:
      return "idle";
    case SessionStatus::Running:
      return "running";
    case SessionStatus::Stopped:
      return "stopped";
  }
  return "unknown";
}

std::string cycle_state_name(CycleState s) {
  switch (s) {
    case CycleState::Idle:
      return "IDLE";
    case CycleState::Capturing:
      return "CAPTURING";
    case CycleState::Classifying:
      return "CLASSIFYING";
    case CycleState::Actuating:
      return "ACTUATING";
    case CycleState::Done:
      return "DONE";
    case CycleState::Failed:
      return "FAILED";
  }
  return "UNKNOWN";
}
