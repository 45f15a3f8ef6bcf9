#include "types.hpp"

const char* result_kind_name(ResultKind k) {
  switch (k) {
    case ResultKind::Screen: return "screen";
    case ResultKind::Info: return "info";
    case ResultKind::NotFound: return "not_found";
    case ResultKind::InvalidPattern: return "invalid_pattern";
    case ResultKind::InvalidArgument: return "invalid_argument";
    case ResultKind::UnknownTool: return "unknown_tool";
  }
  return "unknown";
}
