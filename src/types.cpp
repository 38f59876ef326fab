#include <nli/types.hpp>

namespace nli {

std::string_view toString(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::None:
    return "None";
  case ErrorCode::InvalidFieldType:
    return "InvalidFieldType";
  case ErrorCode::DateParseError:
    return "DateParseError";
  case ErrorCode::DanglingParentReference:
    return "DanglingParentReference";
  case ErrorCode::CyclicParentReference:
    return "CyclicParentReference";
  case ErrorCode::PackagingIOError:
    return "PackagingIOError";
  case ErrorCode::MalformedSourceDocument:
    return "MalformedSourceDocument";
  case ErrorCode::DuplicateField:
    return "DuplicateField";
  case ErrorCode::UnknownField:
    return "UnknownField";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::UnhandledException:
    return "UnhandledException";
  }
  return "Unknown";
}

} // namespace nli
