/**
 * @file blkdev-info.cpp
 * @brief Show the stable identity of one block device.
 *
 * Prints the canonical node, the preferred by-id and by-path aliases, the
 * kernel device number, geometry and udev identity of the given device.
 */

#include "src/storage/inc/AliasPrioritizer.hpp"
#include "src/storage/inc/BlockDevice.hpp"
#include "src/storage/inc/DeviceServices.hpp"
#include "src/storage/inc/IdentityResolver.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Format.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace storage = blkref::storage;
namespace args = blkref::helpers::args;
namespace format = blkref::helpers::format;

namespace {

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_DEVICE = 1,
  ARG_JSON = 2,
  ARG_SYS_DIR = 3,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Show canonical path, stable aliases, device number and geometry of a block device.";

args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_DEVICE] = {"--device", 1, false, "Device path, e.g. /dev/sda or /dev/disk/by-id/..."};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  map[ARG_SYS_DIR] = {"--sys-block", 1, false, "sysfs block directory (default /sys/class/block)"};
  return map;
}

/// Everything the tool reports, gathered once.
struct Report {
  std::string deviceFile;
  std::string canonical;
  std::string byId;
  std::string byPath;
  std::string predictable;
  std::string number;
  std::string description;
  std::string model;
  std::string vendor;
  std::string serial;
  storage::Geometry geometry;
  std::vector<std::string> aliases;
  std::vector<std::string> links;
};

Report collect(storage::BlockDevice& dev, const storage::DeviceServices& services) {
  Report r;
  r.deviceFile = dev.getDeviceFile();
  if (dev.getCanonicalDeviceFile(r.canonical) != storage::DeviceStatus::OK) {
    r.canonical = r.deviceFile;
  }
  r.byId = dev.getDeviceFileById().value_or("");
  r.byPath = dev.getDeviceFileByPath().value_or("");
  r.predictable = dev.getPredictableDeviceFile();
  const std::optional<storage::DeviceNumber> NUMBER = dev.getDeviceNumber();
  r.number = NUMBER ? NUMBER->toString() : "";
  r.description = dev.getDescription();
  r.model = dev.getModel();
  r.vendor = dev.getVendor();
  r.serial = dev.getSerialNumber();

  const storage::DeviceStatus GEO = dev.loadGeometry();
  if (GEO != storage::DeviceStatus::OK) {
    fmt::print(stderr, "Warning: geometry unavailable for {}: {}\n", r.deviceFile,
               storage::toString(GEO));
  }
  r.geometry = dev.geometry();

  const storage::IdentityResolver RESOLVER(services.fs, services.metadata);
  r.aliases = storage::orderByPriority(RESOLVER.listAliases(r.canonical));
  r.links = dev.getDeviceFiles();
  return r;
}

/* ----------------------------- Human Output ----------------------------- */

void printHuman(const Report& r) {
  fmt::print("=== {} ===\n", r.description);
  fmt::print("  Device file: {}\n", r.deviceFile);
  fmt::print("  Canonical:   {}\n", r.canonical);
  fmt::print("  By-id:       {}\n", r.byId.empty() ? "-" : r.byId);
  fmt::print("  By-path:     {}\n", r.byPath.empty() ? "-" : r.byPath);
  fmt::print("  Predictable: {}\n", r.predictable);
  fmt::print("  Number:      {}\n", r.number.empty() ? "unknown" : r.number);

  fmt::print("\n=== Identity ===\n");
  fmt::print("  Vendor: {}\n", r.vendor.empty() ? "-" : r.vendor);
  fmt::print("  Model:  {}\n", r.model.empty() ? "-" : r.model);
  fmt::print("  Serial: {}\n", r.serial.empty() ? "-" : r.serial);

  fmt::print("\n=== Geometry ===\n");
  fmt::print("  Size:        {}\n", format::bytesBinary(r.geometry.sizeBytes));
  fmt::print("  Sector size: {}\n", format::valueOrUnknown(r.geometry.sectorSizeBytes));
  fmt::print("  Block size:  {}\n", format::valueOrUnknown(r.geometry.blockSizeBytes));

  fmt::print("\n=== by-id aliases (preferred first) ===\n");
  if (r.aliases.empty()) {
    fmt::print("  (none)\n");
  }
  for (const std::string& NAME : r.aliases) {
    fmt::print("  [{}] {}\n", storage::classRank(NAME), NAME);
  }

  fmt::print("\n=== All device files ===\n");
  for (const std::string& LINK : r.links) {
    fmt::print("  {}\n", LINK);
  }
}

/* ----------------------------- JSON Output ----------------------------- */

void printJsonList(std::string_view key, const std::vector<std::string>& values, bool last) {
  fmt::print("  \"{}\": [", key);
  for (std::size_t i = 0; i < values.size(); ++i) {
    fmt::print("{}\"{}\"", (i > 0) ? ", " : "", values[i]);
  }
  fmt::print("]{}\n", last ? "" : ",");
}

template <typename T> std::string jsonNumber(const std::optional<T>& v) {
  return v ? fmt::format("{}", *v) : std::string("null");
}

void printJson(const Report& r) {
  fmt::print("{{\n");
  fmt::print("  \"deviceFile\": \"{}\",\n", r.deviceFile);
  fmt::print("  \"canonical\": \"{}\",\n", r.canonical);
  fmt::print("  \"byId\": \"{}\",\n", r.byId);
  fmt::print("  \"byPath\": \"{}\",\n", r.byPath);
  fmt::print("  \"predictable\": \"{}\",\n", r.predictable);
  fmt::print("  \"deviceNumber\": \"{}\",\n", r.number);
  fmt::print("  \"vendor\": \"{}\",\n", r.vendor);
  fmt::print("  \"model\": \"{}\",\n", r.model);
  fmt::print("  \"serial\": \"{}\",\n", r.serial);
  fmt::print("  \"sizeBytes\": {},\n", jsonNumber(r.geometry.sizeBytes));
  fmt::print("  \"sectorSizeBytes\": {},\n", jsonNumber(r.geometry.sectorSizeBytes));
  fmt::print("  \"blockSizeBytes\": {},\n", jsonNumber(r.geometry.blockSizeBytes));
  printJsonList("aliases", r.aliases, false);
  printJsonList("deviceFiles", r.links, true);
  fmt::print("}}\n");
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;

  std::vector<std::string_view> argList;
  argList.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    argList.emplace_back(argv[i]);
  }

  std::string error;
  if (!args::parseArgs(argList, ARG_MAP, pargs, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 1;
  }
  if (args::hasFlag(pargs, ARG_HELP)) {
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 0;
  }

  const std::optional<std::string_view> DEVICE = args::value(pargs, ARG_DEVICE);
  if (!DEVICE) {
    fmt::print(stderr, "Error: --device is required\n\n");
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 1;
  }

  const storage::LinuxDeviceServices SYSTEM(
      std::string(args::value(pargs, ARG_SYS_DIR).value_or(storage::SYS_CLASS_BLOCK)));
  const storage::DeviceServices SERVICES = SYSTEM.services();

  storage::BlockDevice dev(std::string(*DEVICE), SERVICES);
  const storage::DeviceStatus STATUS = dev.assertExists();
  if (STATUS != storage::DeviceStatus::OK) {
    fmt::print(stderr, "Error: '{}' is not a block device ({})\n", *DEVICE,
               storage::toString(STATUS));
    return 1;
  }

  const Report REPORT = collect(dev, SERVICES);
  if (args::hasFlag(pargs, ARG_JSON)) {
    printJson(REPORT);
  } else {
    printHuman(REPORT);
  }
  return 0;
}
