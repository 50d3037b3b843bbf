#pragma once

#include <string>
#include <vector>

namespace snapshot::model {

// File written by a workflow step, relative to the step output folder.
struct ProducedFile {
  std::string folio_id;
  std::string file_name;
  std::string mime_type;
};

struct StepOutput {
  std::vector<ProducedFile> files;
};

} // namespace snapshot::model
