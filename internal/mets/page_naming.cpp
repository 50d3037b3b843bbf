#include "page_naming.hpp"

namespace snapshot::mets {

std::optional<std::string> PhysicalPrefixConvention::FolioForPage(const std::string& page_id) const {
  if (page_id.size() <= prefix_.size() || page_id.compare(0, prefix_.size(), prefix_) != 0) {
    return std::nullopt;
  }
  return page_id.substr(prefix_.size());
}

std::string PhysicalPrefixConvention::PageForFolio(const std::string& folio_id) const {
  return prefix_ + folio_id;
}

std::shared_ptr<const PageNamingConvention> PageNamingFor(const std::string& /*mets_group*/) {
  // every group known so far uses the OCR-D page convention
  static const auto kDefault = std::make_shared<const PhysicalPrefixConvention>();
  return kDefault;
}

} // namespace snapshot::mets
