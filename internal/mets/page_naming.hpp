#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace snapshot::mets {

/*
  Maps METS physical page ids to project folio ids and back.

  The convention belongs to the sandbox METS group; the adapter only
  invokes it.
*/
class PageNamingConvention {
 public:
  virtual ~PageNamingConvention() = default;

  // nullopt when the page id does not follow the convention.
  virtual std::optional<std::string> FolioForPage(const std::string& page_id) const = 0;
  virtual std::string                PageForFolio(const std::string& folio_id) const  = 0;
};

// "PHYS_<folio>"
class PhysicalPrefixConvention final : public PageNamingConvention {
 public:
  explicit PhysicalPrefixConvention(std::string prefix = "PHYS_") : prefix_(std::move(prefix)) {
  }

  std::optional<std::string> FolioForPage(const std::string& page_id) const override;
  std::string                PageForFolio(const std::string& folio_id) const override;

 private:
  std::string prefix_;
};

std::shared_ptr<const PageNamingConvention> PageNamingFor(const std::string& mets_group);

} // namespace snapshot::mets
