#pragma once

#include <string_view>

#include "snapshot/manager/core/v1/types.pb.h"

namespace snapshot::model {

using snapshot::manager::core::v1::StepKind;

/*
  Capabilities of a workflow step kind.

  The set of kinds is closed; callers branch on capabilities, never on
  provider ids.
*/
struct StepCapabilities {
  // Output files are registered per physical page in the METS document.
  bool page_addressable = false;
  // Output may be imported into a collection.
  bool import_capable = false;
};

constexpr StepCapabilities CapabilitiesOf(StepKind kind) {
  using namespace snapshot::manager::core::v1;
  switch (kind) {
    case STEP_KIND_POSTCORRECTION:
      return {true, true};
    case STEP_KIND_LAUNCHER:
    case STEP_KIND_PREPROCESSING:
    case STEP_KIND_LAYOUT_RECOGNITION:
    case STEP_KIND_CHARACTER_RECOGNITION:
      return {true, false};
    case STEP_KIND_TOOL:
    default:
      return {};
  }
}

constexpr std::string_view StepKindName(StepKind kind) {
  using namespace snapshot::manager::core::v1;
  switch (kind) {
    case STEP_KIND_LAUNCHER:
      return "launcher";
    case STEP_KIND_PREPROCESSING:
      return "preprocessing";
    case STEP_KIND_LAYOUT_RECOGNITION:
      return "layout-recognition";
    case STEP_KIND_CHARACTER_RECOGNITION:
      return "character-recognition";
    case STEP_KIND_POSTCORRECTION:
      return "postcorrection";
    case STEP_KIND_TOOL:
      return "tool";
    default:
      return "unspecified";
  }
}

} // namespace snapshot::model
