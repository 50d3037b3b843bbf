#include "mets_document.hpp"

#include <tinyxml2.h>

#include <stdexcept>
#include <unordered_set>

#include "internal/util/errors.hpp"

namespace snapshot::mets {

using tinyxml2::XMLElement;

namespace {

constexpr const char* kSkeleton = R"(<?xml version="1.0" encoding="UTF-8"?>
<mets:mets xmlns:mets="http://www.loc.gov/METS/" xmlns:xlink="http://www.w3.org/1999/xlink">
  <mets:metsHdr/>
  <mets:fileSec/>
  <mets:structMap TYPE="PHYSICAL">
    <mets:div TYPE="physSequence"/>
  </mets:structMap>
</mets:mets>
)";

std::string_view LocalName(const char* name) {
  std::string_view view(name ? name : "");
  const auto       colon = view.find(':');
  return colon == std::string_view::npos ? view : view.substr(colon + 1);
}

bool Is(const XMLElement* element, std::string_view local_name) {
  return LocalName(element->Name()) == local_name;
}

std::string Attribute(const XMLElement* element, std::string_view local_name) {
  for (const auto* attribute = element->FirstAttribute(); attribute; attribute = attribute->Next()) {
    if (LocalName(attribute->Name()) == local_name) {
      return attribute->Value();
    }
  }
  return {};
}

std::string Text(const XMLElement* element) {
  const char* text = element->GetText();
  return text ? text : "";
}

XMLElement* FindChild(XMLElement* parent, std::string_view local_name) {
  if (!parent) return nullptr;
  for (auto* child = parent->FirstChildElement(); child; child = child->NextSiblingElement()) {
    if (Is(child, local_name)) return child;
  }
  return nullptr;
}

std::vector<XMLElement*> Children(XMLElement* parent, std::string_view local_name) {
  std::vector<XMLElement*> children;
  if (!parent) return children;
  for (auto* child = parent->FirstChildElement(); child; child = child->NextSiblingElement()) {
    if (Is(child, local_name)) children.push_back(child);
  }
  return children;
}

XMLElement* FindPhysicalStructMap(XMLElement* root) {
  for (auto* map : Children(root, "structMap")) {
    if (Attribute(map, "TYPE") == "PHYSICAL") return map;
  }
  return nullptr;
}

XMLElement* FindPhysicalSequence(XMLElement* root) {
  for (auto* div : Children(FindPhysicalStructMap(root), "div")) {
    if (Attribute(div, "TYPE") == "physSequence") return div;
  }
  return nullptr;
}

XMLElement* FindPage(XMLElement* sequence, const std::string& page_id) {
  for (auto* div : Children(sequence, "div")) {
    if (Attribute(div, "ID") == page_id) return div;
  }
  return nullptr;
}

XMLElement* FindFileGroup(XMLElement* root, const std::string& id) {
  for (auto* group : Children(FindChild(root, "fileSec"), "fileGrp")) {
    if (Attribute(group, "USE") == id) return group;
  }
  return nullptr;
}

FileGroup ReadFileGroup(XMLElement* group) {
  FileGroup result;
  result.id = Attribute(group, "USE");
  for (auto* file : Children(group, "file")) {
    FileEntry entry;
    entry.id        = Attribute(file, "ID");
    entry.mime_type = Attribute(file, "MIMETYPE");
    if (auto* location = FindChild(file, "FLocat")) {
      entry.href = Attribute(location, "href");
    }
    result.files.push_back(std::move(entry));
  }
  return result;
}

void RemovePagePointers(XMLElement* root, const std::unordered_set<std::string>& file_ids) {
  if (file_ids.empty()) return;
  for (auto* page : Children(FindPhysicalSequence(root), "div")) {
    for (auto* pointer : Children(page, "fptr")) {
      if (file_ids.count(Attribute(pointer, "FILEID")) > 0) {
        page->DeleteChild(pointer);
      }
    }
  }
}

void ValidateStructure(XMLElement* root) {
  for (auto* group : Children(FindChild(root, "fileSec"), "fileGrp")) {
    if (Attribute(group, "USE").empty()) {
      throw util::MalformedDocument("mets: fileGrp without USE");
    }
    for (auto* file : Children(group, "file")) {
      if (Attribute(file, "ID").empty()) {
        throw util::MalformedDocument("mets: file without ID in fileGrp " + Attribute(group, "USE"));
      }
    }
  }
}

} // namespace

std::optional<std::string> Agent::Note(std::string_view option) const {
  for (const auto& [key, value] : notes) {
    if (key == option) return value;
  }
  return std::nullopt;
}

// ------------------------------------------------------------
// Construction
// ------------------------------------------------------------

MetsDocument::MetsDocument(std::string_view created) : document_(std::make_unique<tinyxml2::XMLDocument>()), prefix_("mets:") {
  if (document_->Parse(kSkeleton) != tinyxml2::XML_SUCCESS) {
    throw std::runtime_error(std::string("mets skeleton: ") + document_->ErrorStr());
  }
  if (!created.empty()) {
    Section("metsHdr", true)->SetAttribute("CREATEDATE", std::string(created).c_str());
  }
}

MetsDocument::MetsDocument(std::unique_ptr<tinyxml2::XMLDocument> document, std::string prefix)
    : document_(std::move(document)), prefix_(std::move(prefix)) {
}

MetsDocument::~MetsDocument()                                  = default;
MetsDocument::MetsDocument(MetsDocument&&) noexcept            = default;
MetsDocument& MetsDocument::operator=(MetsDocument&&) noexcept = default;

MetsDocument MetsDocument::Parse(std::string_view xml) {
  auto document = std::make_unique<tinyxml2::XMLDocument>();
  if (document->Parse(xml.data(), xml.size()) != tinyxml2::XML_SUCCESS) {
    throw util::MalformedDocument(std::string("mets: ") + document->ErrorStr());
  }

  auto* root = document->RootElement();
  if (!root || !Is(root, "mets")) {
    throw util::MalformedDocument("mets: root element is not mets");
  }
  ValidateStructure(root);

  std::string_view name(root->Name());
  const auto       colon  = name.find(':');
  std::string      prefix = colon == std::string_view::npos ? "" : std::string(name.substr(0, colon + 1));
  return MetsDocument(std::move(document), std::move(prefix));
}

std::string MetsDocument::Serialize() const {
  tinyxml2::XMLPrinter printer;
  document_->Print(&printer);
  return std::string(printer.CStr(), static_cast<std::size_t>(printer.CStrSize() - 1));
}

// ------------------------------------------------------------
// Queries
// ------------------------------------------------------------

std::vector<FileGroup> MetsDocument::FileGroups() const {
  std::vector<FileGroup> groups;
  for (auto* group : Children(FindChild(Root(), "fileSec"), "fileGrp")) {
    groups.push_back(ReadFileGroup(group));
  }
  return groups;
}

std::optional<FileGroup> MetsDocument::FindFileGroup(const std::string& id) const {
  auto* group = mets::FindFileGroup(Root(), id);
  if (!group) return std::nullopt;
  return ReadFileGroup(group);
}

std::vector<Page> MetsDocument::Pages() const {
  std::vector<Page> pages;
  for (auto* div : Children(FindPhysicalSequence(Root()), "div")) {
    Page page;
    page.id = Attribute(div, "ID");
    for (auto* pointer : Children(div, "fptr")) {
      page.file_ids.push_back(Attribute(pointer, "FILEID"));
    }
    pages.push_back(std::move(page));
  }
  return pages;
}

std::vector<Agent> MetsDocument::Agents() const {
  std::vector<Agent> agents;
  for (auto* element : Children(FindChild(Root(), "metsHdr"), "agent")) {
    Agent agent;
    agent.role       = Attribute(element, "ROLE");
    agent.other_role = Attribute(element, "OTHERROLE");
    if (auto* name = FindChild(element, "name")) {
      agent.name = Text(name);
    }
    for (auto* note : Children(element, "note")) {
      agent.notes.emplace_back(Attribute(note, "option"), Text(note));
    }
    agents.push_back(std::move(agent));
  }
  return agents;
}

// ------------------------------------------------------------
// Mutations
// ------------------------------------------------------------

void MetsDocument::PutFileGroup(const FileGroup& group) {
  auto* element = mets::FindFileGroup(Root(), group.id);
  if (element) {
    std::unordered_set<std::string> stale;
    for (const auto& file : ReadFileGroup(element).files) {
      stale.insert(file.id);
    }
    RemovePagePointers(Root(), stale);
    element->DeleteChildren();
  } else {
    element = NewElement("fileGrp");
    element->SetAttribute("USE", group.id.c_str());
    Section("fileSec", true)->InsertEndChild(element);
  }

  for (const auto& file : group.files) {
    auto* file_element = NewElement("file");
    file_element->SetAttribute("ID", file.id.c_str());
    if (!file.mime_type.empty()) {
      file_element->SetAttribute("MIMETYPE", file.mime_type.c_str());
    }

    auto* location = NewElement("FLocat");
    location->SetAttribute("LOCTYPE", "OTHER");
    location->SetAttribute("OTHERLOCTYPE", "FILE");
    location->SetAttribute("xlink:href", file.href.c_str());
    file_element->InsertEndChild(location);

    element->InsertEndChild(file_element);
  }
}

bool MetsDocument::RemoveFileGroup(const std::string& id) {
  bool  removed = false;
  auto* root    = Root();

  if (auto* element = mets::FindFileGroup(root, id)) {
    std::unordered_set<std::string> file_ids;
    for (const auto& file : ReadFileGroup(element).files) {
      file_ids.insert(file.id);
    }
    RemovePagePointers(root, file_ids);
    element->Parent()->DeleteChild(element);
    removed = true;
  }

  auto* header = FindChild(root, "metsHdr");
  for (auto* agent : Children(header, "agent")) {
    for (auto* note : Children(agent, "note")) {
      if (Attribute(note, "option") == kNoteOutputFileGroup && Text(note) == id) {
        header->DeleteChild(agent);
        removed = true;
        break;
      }
    }
  }
  return removed;
}

void MetsDocument::AddAgent(const Agent& agent) {
  auto* element = NewElement("agent");
  element->SetAttribute("TYPE", "OTHER");
  element->SetAttribute("OTHERTYPE", "SOFTWARE");
  element->SetAttribute("ROLE", agent.role.c_str());
  if (!agent.other_role.empty()) {
    element->SetAttribute("OTHERROLE", agent.other_role.c_str());
  }

  auto* name = NewElement("name");
  name->SetText(agent.name.c_str());
  element->InsertEndChild(name);

  for (const auto& [option, value] : agent.notes) {
    auto* note = NewElement("note");
    note->SetAttribute("option", option.c_str());
    note->SetText(value.c_str());
    element->InsertEndChild(note);
  }

  Section("metsHdr", true)->InsertEndChild(element);
}

void MetsDocument::EnsurePage(const std::string& page_id) {
  auto* sequence = PhysicalSequence(true);
  if (FindPage(sequence, page_id)) return;

  auto* page = NewElement("div");
  page->SetAttribute("TYPE", "page");
  page->SetAttribute("ID", page_id.c_str());
  sequence->InsertEndChild(page);
}

void MetsDocument::AddPagePointer(const std::string& page_id, const std::string& file_id) {
  EnsurePage(page_id);
  auto* page = FindPage(PhysicalSequence(false), page_id);
  for (auto* pointer : Children(page, "fptr")) {
    if (Attribute(pointer, "FILEID") == file_id) return;
  }

  auto* pointer = NewElement("fptr");
  pointer->SetAttribute("FILEID", file_id.c_str());
  page->InsertEndChild(pointer);
}

// ------------------------------------------------------------
// DOM helpers
// ------------------------------------------------------------

XMLElement* MetsDocument::Root() const {
  return document_->RootElement();
}

XMLElement* MetsDocument::NewElement(std::string_view local_name) {
  return document_->NewElement((prefix_ + std::string(local_name)).c_str());
}

XMLElement* MetsDocument::Section(std::string_view local_name, bool create) {
  auto* root    = Root();
  auto* section = FindChild(root, local_name);
  if (section || !create) return section;

  section = NewElement(local_name);
  if (local_name == "metsHdr") {
    root->InsertFirstChild(section);
    return section;
  }

  // sections precede the structure maps
  auto* first_map = FindChild(root, "structMap");
  if (!first_map) {
    root->InsertEndChild(section);
  } else if (auto* previous = first_map->PreviousSibling()) {
    root->InsertAfterChild(previous, section);
  } else {
    root->InsertFirstChild(section);
  }
  return section;
}

XMLElement* MetsDocument::PhysicalSequence(bool create) {
  auto* root     = Root();
  auto* sequence = FindPhysicalSequence(root);
  if (sequence || !create) return sequence;

  auto* map = FindPhysicalStructMap(root);
  if (!map) {
    map = NewElement("structMap");
    map->SetAttribute("TYPE", "PHYSICAL");
    root->InsertEndChild(map);
  }
  sequence = NewElement("div");
  sequence->SetAttribute("TYPE", "physSequence");
  map->InsertEndChild(sequence);
  return sequence;
}

} // namespace snapshot::mets
