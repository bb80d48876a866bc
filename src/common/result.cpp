#include "execai/common/result.hpp"

namespace execai::common {

std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "none";
  case ErrorCode::Validation:
    return "validation";
  case ErrorCode::InvalidState:
    return "invalid_state";
  case ErrorCode::NotFound:
    return "not_found";
  case ErrorCode::Io:
    return "io";
  case ErrorCode::Launch:
    return "launch";
  case ErrorCode::Dispatch:
    return "dispatch";
  case ErrorCode::Internal:
    return "internal";
  }
  return "internal";
}

} // namespace execai::common
