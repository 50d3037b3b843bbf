#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tinyxml2 {
class XMLDocument;
class XMLElement;
} // namespace tinyxml2

namespace snapshot::mets {

struct FileEntry {
  std::string id;
  std::string mime_type;
  // Relative to the folder holding the METS document.
  std::string href;
};

struct FileGroup {
  std::string            id;
  std::vector<FileEntry> files;
};

struct Page {
  std::string              id;
  std::vector<std::string> file_ids;
};

struct Agent {
  std::string                                      role{"OTHER"};
  std::string                                      other_role;
  std::string                                      name;
  std::vector<std::pair<std::string, std::string>> notes;

  std::optional<std::string> Note(std::string_view option) const;
};

inline constexpr const char* kNoteOutputFileGroup = "outputFileGrp";
inline constexpr const char* kNoteParameter       = "parameter";

/*
  METS document

  Thin view over the XML DOM. Elements are matched by local name so any
  namespace prefix is accepted; elements this class does not know about
  are preserved on Serialize. New elements use the prefix of the root.

  Not thread-safe; callers hold the owning sandbox lock.
*/
class MetsDocument {
 public:
  // Empty document: header, file section and physical structure map.
  explicit MetsDocument(std::string_view created = {});
  ~MetsDocument();

  MetsDocument(MetsDocument&&) noexcept;
  MetsDocument& operator=(MetsDocument&&) noexcept;

  MetsDocument(const MetsDocument&)            = delete;
  MetsDocument& operator=(const MetsDocument&) = delete;

  // Throws util::MalformedDocument.
  static MetsDocument Parse(std::string_view xml);
  std::string         Serialize() const;

  std::vector<FileGroup>   FileGroups() const;
  std::optional<FileGroup> FindFileGroup(const std::string& id) const;
  std::vector<Page>        Pages() const;
  std::vector<Agent>       Agents() const;

  // Replaces the group with the same id, or appends it.
  void PutFileGroup(const FileGroup& group);
  // Drops the group, the page pointers to its files and the agents that produced it.
  bool RemoveFileGroup(const std::string& id);

  void AddAgent(const Agent& agent);

  // Appends the page to the physical sequence unless present.
  void EnsurePage(const std::string& page_id);
  void AddPagePointer(const std::string& page_id, const std::string& file_id);

 private:
  MetsDocument(std::unique_ptr<tinyxml2::XMLDocument> document, std::string prefix);

  tinyxml2::XMLElement* Root() const;
  tinyxml2::XMLElement* Section(std::string_view local_name, bool create);
  tinyxml2::XMLElement* PhysicalSequence(bool create);
  tinyxml2::XMLElement* NewElement(std::string_view local_name);

  std::unique_ptr<tinyxml2::XMLDocument> document_;
  std::string                            prefix_;
};

} // namespace snapshot::mets
