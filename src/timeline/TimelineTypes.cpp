// Repository: ReelForge
// Component: Timeline Types Implementation
// Copyright (c) 2025 ReelForge

#include "reelforge/timeline/TimelineTypes.hpp"

namespace reelforge::timeline {

// New error codes may be added; existing codes must not change meaning
// (they are mirrored on the wire as strings).
const char* ExtractionErrorToString(ExtractionError error) {
  switch (error) {
    case ExtractionError::kNone:
      return "NONE";
    case ExtractionError::kDecodeError:
      return "DECODE_ERROR";
    case ExtractionError::kSeekTimeout:
      return "SEEK_TIMEOUT";
    case ExtractionError::kExtractionTimeout:
      return "EXTRACTION_TIMEOUT";
    case ExtractionError::kEmptyResult:
      return "EMPTY_RESULT";
    case ExtractionError::kComputationError:
      return "COMPUTATION_ERROR";
    case ExtractionError::kCancelled:
      return "CANCELLED";
  }
  return "UNKNOWN_ERROR";
}

bool ExtractionErrorFromString(const std::string& name, ExtractionError* error) {
  static const ExtractionError kAll[] = {
      ExtractionError::kNone,           ExtractionError::kDecodeError,
      ExtractionError::kSeekTimeout,    ExtractionError::kExtractionTimeout,
      ExtractionError::kEmptyResult,    ExtractionError::kComputationError,
      ExtractionError::kCancelled,
  };
  for (ExtractionError e : kAll) {
    if (name == ExtractionErrorToString(e)) {
      *error = e;
      return true;
    }
  }
  return false;
}

}  // namespace reelforge::timeline
