#include "internal/mets/file_group_naming.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using snapshot::model::Track;
using snapshot::mets::FileGroupIdFor;
using snapshot::mets::TrackForFileGroup;
using snapshot::mets::ValidateFileGroupTemplate;

constexpr const char* kTemplate = "{group}-{track}";

bool Rejected(const std::string& file_group_template) {
  try {
    ValidateFileGroupTemplate(file_group_template);
  } catch (const snapshot::util::BadRequest&) {
    return true;
  }
  return false;
}

void TestRootAndNestedTracks() {
  assert(FileGroupIdFor(kTemplate, "ocr4all", Track::Root()) == "ocr4all-root");
  assert(FileGroupIdFor(kTemplate, "ocr4all", Track{0}) == "ocr4all-0");
  assert(FileGroupIdFor(kTemplate, "ocr4all", (Track{0, 2})) == "ocr4all-0-2");
  assert(FileGroupIdFor("OCR-D-{track}", "ignored", Track{4}) == "OCR-D-4");
}

void TestInverseMapping() {
  for (const auto& track : {Track::Root(), Track{0}, Track{0, 2}, Track{10, 0, 3}}) {
    const auto id = FileGroupIdFor(kTemplate, "ocr4all", track);
    const auto back = TrackForFileGroup(kTemplate, "ocr4all", id);
    assert(back.has_value());
    assert(*back == track);
  }
}

void TestForeignIdsDoNotMap() {
  assert(!TrackForFileGroup(kTemplate, "ocr4all", "OCR-D-IMG").has_value());
  assert(!TrackForFileGroup(kTemplate, "ocr4all", "ocr4all-").has_value());
  assert(!TrackForFileGroup(kTemplate, "ocr4all", "ocr4all-0-").has_value());
  assert(!TrackForFileGroup(kTemplate, "ocr4all", "ocr4all-01").has_value());
  assert(!TrackForFileGroup(kTemplate, "ocr4all", "ocr4all-a").has_value());
  assert(!TrackForFileGroup(kTemplate, "other", "ocr4all-0").has_value());
}

void TestGroupHoldingPlaceholderText() {
  const auto id = FileGroupIdFor(kTemplate, "{track}", (Track{3, 1}));
  assert(id == "{track}-3-1");
  const auto back = TrackForFileGroup(kTemplate, "{track}", id);
  assert(back.has_value());
  assert(*back == (Track{3, 1}));

  bool rejected = false;
  try {
    snapshot::mets::ValidateMetsGroup("ocr{4}all");
  } catch (const snapshot::util::BadRequest&) {
    rejected = true;
  }
  assert(rejected);
  snapshot::mets::ValidateMetsGroup("ocr4all");
}

void TestTemplateValidation() {
  assert(!Rejected("{group}-{track}"));
  assert(!Rejected("{track}"));
  assert(!Rejected("OCR-D-{group}_{track}_out"));
  assert(Rejected("{group}"));
  assert(Rejected("{track}-{track}"));
  assert(Rejected("{group}-{track}-{page}"));
  assert(Rejected("{track}}"));
}

} // namespace

int main() {
  TestRootAndNestedTracks();
  TestInverseMapping();
  TestForeignIdsDoNotMap();
  TestGroupHoldingPlaceholderText();
  TestTemplateValidation();

  std::cout << "snapshot_manager_unit_file_group_naming: pass\n";
  return 0;
}
