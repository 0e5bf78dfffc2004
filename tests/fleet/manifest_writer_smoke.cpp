#include "fleet/inventory_differ.hpp"
#include "fleet/manifest_writer.hpp"
#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

namespace {

using fleetcap::fleet::DiffInventories;
using fleetcap::fleet::InventoryDiff;
using fleetcap::fleet::RenderManifest;
using fleetcap::fleet::WriteManifest;
using fleetcap::tests::common::AssertContains;
using fleetcap::tests::common::AssertEq;
using fleetcap::tests::common::CreateUniqueTempDir;
using fleetcap::tests::common::Fail;
using fleetcap::tests::common::ReadFileToString;
using fleetcap::tests::common::RemovePathBestEffort;

void TestRendersOnlyDevicesWithNewFiles() {
  const InventoryDiff diff = DiffInventories({{"d1", {"G1.mp4"}}, {"d2", {"G2.mp4"}}},
                                             {{"d1", {"G1.mp4", "G3.mp4"}}, {"d2", {"G2.mp4"}}});
  AssertEq(RenderManifest(diff), std::string("d1:\n\tG3.mp4\n"), "manifest text");

  const InventoryDiff two = DiffInventories({{"a", {}}, {"b", {"x"}}},
                                            {{"a", {"1", "2"}}, {"b", {"x", "y"}}});
  AssertEq(RenderManifest(two), std::string("a:\n\t1\n\t2\nb:\n\ty\n"), "two-device manifest");
}

void TestWritesEmptyManifestForEmptyFleet() {
  const fs::path root = CreateUniqueTempDir("fleetcap-manifest-empty");
  const fs::path storage = root / "Videos";

  fs::path written;
  std::string error;
  if (!WriteManifest(storage, InventoryDiff{}, written, error)) {
    Fail("empty manifest write failed: " + error);
  }
  AssertEq(written.filename().string(), std::string("recordedFiles.txt"), "manifest name");
  if (!fs::exists(written) || fs::file_size(written) != 0U) {
    Fail("zero-device manifest must exist and be empty");
  }
  RemovePathBestEffort(root);
}

void TestOverwritesAtomically() {
  const fs::path root = CreateUniqueTempDir("fleetcap-manifest-rewrite");
  fs::path written;
  std::string error;
  const InventoryDiff first = DiffInventories({{"d1", {}}}, {{"d1", {"A.mp4"}}});
  const InventoryDiff second = DiffInventories({{"d1", {}}}, {{"d1", {"B.mp4"}}});
  if (!WriteManifest(root, first, written, error) || !WriteManifest(root, second, written, error)) {
    Fail("manifest write failed: " + error);
  }
  AssertEq(ReadFileToString(written), std::string("d1:\n\tB.mp4\n"), "rewritten manifest");
  for (const auto& entry : fs::directory_iterator(root)) {
    if (entry.path().filename() != "recordedFiles.txt") {
      Fail("temporary file left behind: " + entry.path().string());
    }
  }
  RemovePathBestEffort(root);
}

void TestUnwritableStorageIsStorageError() {
  const fs::path root = CreateUniqueTempDir("fleetcap-manifest-blocked");
  // A regular file where the storage directory should be.
  const fs::path blocker = root / "Videos";
  std::ofstream(blocker) << "not a directory";

  fs::path written;
  std::string error;
  if (WriteManifest(blocker, InventoryDiff{}, written, error)) {
    Fail("manifest write into a file path must fail");
  }
  AssertContains(error, "STORAGE_ERROR");
  RemovePathBestEffort(root);
}

} // namespace

int main() {
  TestRendersOnlyDevicesWithNewFiles();
  TestWritesEmptyManifestForEmptyFleet();
  TestOverwritesAtomically();
  TestUnwritableStorageIsStorageError();
  std::cout << "manifest_writer_smoke: ok\n";
  return 0;
}
