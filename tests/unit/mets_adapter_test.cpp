#include "internal/mets/mets_adapter.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include "internal/util/errors.hpp"
#include "test_workspace.hpp"

namespace {

using snapshot::manager::v1::SandboxRecord;
using snapshot::mets::MetsAdapter;
using snapshot::mets::MetsDocument;
using snapshot::mets::PhysicalPrefixConvention;
using snapshot::model::Track;

constexpr const char* kForeignMets = R"(<?xml version="1.0" encoding="UTF-8"?>
<m:mets xmlns:m="http://www.loc.gov/METS/" xmlns:xlink="http://www.w3.org/1999/xlink">
  <m:metsHdr CREATEDATE="2024-01-01T00:00:00">
    <m:agent TYPE="OTHER" ROLE="OTHER" OTHERROLE="preprocessing">
      <m:name>binarization</m:name>
      <m:note option="outputFileGrp">ocr4all-0</m:note>
      <m:note option="parameter">method=sauvola</m:note>
    </m:agent>
  </m:metsHdr>
  <m:dmdSec ID="DMD_1"><m:mdWrap MDTYPE="MODS"/></m:dmdSec>
  <m:fileSec>
    <m:fileGrp USE="ocr4all-root">
      <m:file ID="ocr4all-root_0001" MIMETYPE="image/png"><m:FLocat LOCTYPE="URL" xlink:href="sandbox/0001.png"/></m:file>
      <m:file ID="ocr4all-root_0002" MIMETYPE="image/png"><m:FLocat LOCTYPE="URL" xlink:href="sandbox/0002.png"/></m:file>
    </m:fileGrp>
    <m:fileGrp USE="ocr4all-0">
      <m:file ID="ocr4all-0_0001" MIMETYPE="image/png"><m:FLocat LOCTYPE="URL" xlink:href="derived/0/sandbox/0001.bin.png"/></m:file>
      <m:file ID="stray" MIMETYPE="image/png"><m:FLocat LOCTYPE="URL" xlink:href="derived/0/sandbox/stray.png"/></m:file>
    </m:fileGrp>
  </m:fileSec>
  <m:structMap TYPE="PHYSICAL">
    <m:div TYPE="physSequence">
      <m:div TYPE="page" ID="PHYS_0001"><m:fptr FILEID="ocr4all-root_0001"/><m:fptr FILEID="ocr4all-0_0001"/></m:div>
      <m:div TYPE="page" ID="PHYS_0002"><m:fptr FILEID="ocr4all-root_0002"/></m:div>
      <m:div TYPE="page" ID="page-3"><m:fptr FILEID="stray"/></m:div>
    </m:div>
  </m:structMap>
</m:mets>
)";

SandboxRecord Sandbox() {
  SandboxRecord sandbox;
  sandbox.set_id("s1");
  sandbox.set_mets_group("ocr4all");
  sandbox.set_file_group_template("{group}-{track}");
  return sandbox;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestFilesForTrackResolvesFolios() {
  const auto document = MetsDocument::Parse(kForeignMets);
  const auto group    = MetsAdapter::FilesForTrack(document, Sandbox(), Track{0});

  assert(group.id() == "ocr4all-0");
  assert(group.files_size() == 2);
  assert(group.files(0).folio_id() == "0001");
  assert(group.files(0).location_path() == "derived/0/sandbox/0001.bin.png");
  // "page-3" does not follow the PHYS_ convention
  assert(group.files(1).folio_id().empty());
}

void TestResolveFolioForFile() {
  const auto               document = MetsDocument::Parse(kForeignMets);
  const auto               pages    = document.Pages();
  PhysicalPrefixConvention naming;

  assert(MetsAdapter::ResolveFolioForFile("ocr4all-0_0001", pages, naming) == std::optional<std::string>("0001"));
  assert(MetsAdapter::ResolveFolioForFile("ocr4all-root_0002", pages, naming) == std::optional<std::string>("0002"));
  // only referenced from "page-3"
  assert(!MetsAdapter::ResolveFolioForFile("stray", pages, naming).has_value());
  assert(!MetsAdapter::ResolveFolioForFile("ocr4all-9_0001", pages, naming).has_value());
}

void TestMissingFileGroupIsPreconditionFailure() {
  const auto document = MetsDocument::Parse(kForeignMets);
  assert(Throws<snapshot::util::PreconditionFailed>([&] { MetsAdapter::FilesForTrack(document, Sandbox(), Track{0, 0}); }));
}

void TestMalformedInput() {
  assert(Throws<snapshot::util::MalformedDocument>([] { MetsDocument::Parse("<mets:mets><unclosed></mets:mets>"); }));
  assert(Throws<snapshot::util::MalformedDocument>([] { MetsDocument::Parse("<html/>"); }));
  assert(Throws<snapshot::util::MalformedDocument>([] { MetsDocument::Parse(R"(<mets><fileSec><fileGrp><file ID="a"/></fileGrp></fileSec></mets>)"); }));
}

void TestLoadMissingDocument() {
  const auto dir = snapshot::testing::FreshDirectory("mets_adapter_missing");
  assert(Throws<snapshot::util::PreconditionFailed>([&] { MetsAdapter::Load(dir / "mets.xml"); }));

  snapshot::testing::WriteFile(dir / "broken.xml", "<mets:mets");
  assert(Throws<snapshot::util::MalformedDocument>([&] { MetsAdapter::Load(dir / "broken.xml"); }));
}

void TestAddFileGroupRegistersPagesAndAgent() {
  MetsDocument document("2024-01-01T00:00:00Z");
  const auto   sandbox = Sandbox();

  const auto id = MetsAdapter::AddFileGroup(&document, sandbox, Track{0, 1},
                                            {{"0001", "derived/0/derived/1/sandbox/0001.xml", ""}, {"0002", "derived/0/derived/1/sandbox/0002.xml", ""}},
                                            {"tesseract", "character-recognition", "lang=deu"});
  assert(id == "ocr4all-0-1");

  const auto pages = document.Pages();
  assert(pages.size() == 2);
  assert(pages[0].id == "PHYS_0001");
  assert(pages[0].file_ids.size() == 1);
  assert(pages[0].file_ids[0] == "ocr4all-0-1_0001");

  const auto group = MetsAdapter::FilesForTrack(document, sandbox, Track{0, 1});
  assert(group.files_size() == 2);
  assert(group.files(1).folio_id() == "0002");
  assert(group.files(1).mime_type() == "application/vnd.prima.page+xml");

  const auto synopsis = MetsAdapter::Synopsis(document, sandbox);
  assert(synopsis.size() == 1);
  assert(synopsis[0].name() == "tesseract");
  assert(synopsis[0].parameter() == "lang=deu");
  assert(synopsis[0].file_group() == "ocr4all-0-1");
  assert(Track::FromProto(synopsis[0].track()) == (Track{0, 1}));
  assert(synopsis[0].files_size() == 2);
}

void TestSeveralFilesForOneFolio() {
  MetsDocument document;
  const auto   sandbox = Sandbox();

  MetsAdapter::AddFileGroup(&document, sandbox, Track{0},
                            {{"0001", "derived/0/sandbox/0001.png", ""}, {"0001", "derived/0/sandbox/0001.xml", ""}, {"0002", "derived/0/sandbox/0002.png", ""}},
                            {"segmentation", "layout-recognition", ""});

  const auto group = MetsAdapter::FilesForTrack(document, sandbox, Track{0});
  assert(group.files_size() == 3);
  assert(group.files(0).id() == "ocr4all-0_0001");
  assert(group.files(1).id() == "ocr4all-0_0001_2");
  assert(group.files(2).id() == "ocr4all-0_0002");
  assert(group.files(1).folio_id() == "0001");
  assert(group.files(1).mime_type() == "application/vnd.prima.page+xml");

  const auto pages = document.Pages();
  assert(pages.size() == 2);
  assert(pages[0].id == "PHYS_0001");
  assert(pages[0].file_ids.size() == 2);
  assert(pages[0].file_ids[0] == "ocr4all-0_0001");
  assert(pages[0].file_ids[1] == "ocr4all-0_0001_2");

  const auto reparsed = MetsDocument::Parse(document.Serialize());
  assert(reparsed.Pages()[0].file_ids.size() == 2);
}

void TestReaddingReplacesOlderGroup() {
  MetsDocument document;
  const auto   sandbox = Sandbox();

  MetsAdapter::AddFileGroup(&document, sandbox, Track{0}, {{"0001", "derived/0/sandbox/old.png", "image/png"}}, {"old", "preprocessing", ""});
  MetsAdapter::AddFileGroup(&document, sandbox, Track{0}, {{"0001", "derived/0/sandbox/new.png", "image/png"}}, {"new", "preprocessing", ""});

  const auto group = MetsAdapter::FilesForTrack(document, sandbox, Track{0});
  assert(group.files_size() == 1);
  assert(group.files(0).location_path() == "derived/0/sandbox/new.png");

  const auto synopsis = MetsAdapter::Synopsis(document, sandbox);
  assert(synopsis.size() == 1);
  assert(synopsis[0].name() == "new");
}

void TestRemoveTracksDropsGroupsPointersAndAgents() {
  auto       document = MetsDocument::Parse(kForeignMets);
  const auto removed  = MetsAdapter::RemoveTracks(&document, Sandbox(), {Track{0}, Track{0, 0}});
  assert(removed == 1);
  assert(!document.FindFileGroup("ocr4all-0").has_value());
  assert(document.FindFileGroup("ocr4all-root").has_value());
  assert(document.Agents().empty());

  for (const auto& page : document.Pages()) {
    for (const auto& file_id : page.file_ids) {
      assert(file_id != "ocr4all-0_0001");
    }
  }
}

void TestUnknownElementsSurviveRoundTrip() {
  auto document = MetsDocument::Parse(kForeignMets);
  MetsAdapter::AddFileGroup(&document, Sandbox(), Track{1}, {{"0002", "derived/1/sandbox/0002.png", "image/png"}}, {"copy", "tool", ""});

  const auto xml = document.Serialize();
  assert(xml.find("dmdSec") != std::string::npos);
  assert(xml.find("<m:fileGrp USE=\"ocr4all-1\"") != std::string::npos);

  const auto reparsed = MetsDocument::Parse(xml);
  assert(reparsed.FileGroups().size() == 3);
  assert(reparsed.Agents().size() == 2);
}

void TestPhysicalPrefixConvention() {
  PhysicalPrefixConvention naming;
  assert(naming.PageForFolio("0007") == "PHYS_0007");
  assert(naming.FolioForPage("PHYS_0007") == std::optional<std::string>("0007"));
  assert(!naming.FolioForPage("PHYS_").has_value());
  assert(!naming.FolioForPage("page-3").has_value());
}

void TestMimeTypes() {
  assert(MetsAdapter::MimeTypeFor("a/0001.PNG") == "image/png");
  assert(MetsAdapter::MimeTypeFor("0001.tif") == "image/tiff");
  assert(MetsAdapter::MimeTypeFor("0001.gt.txt") == "text/plain");
  assert(MetsAdapter::MimeTypeFor("0001") == "application/octet-stream");
}

} // namespace

int main() {
  TestFilesForTrackResolvesFolios();
  TestResolveFolioForFile();
  TestMissingFileGroupIsPreconditionFailure();
  TestMalformedInput();
  TestLoadMissingDocument();
  TestAddFileGroupRegistersPagesAndAgent();
  TestSeveralFilesForOneFolio();
  TestReaddingReplacesOlderGroup();
  TestRemoveTracksDropsGroupsPointersAndAgents();
  TestUnknownElementsSurviveRoundTrip();
  TestPhysicalPrefixConvention();
  TestMimeTypes();

  std::cout << "snapshot_manager_unit_mets_adapter: pass\n";
  return 0;
}
