/**
 * @file config-db.cpp
 * @brief Query and edit a YAML configuration database by path expression.
 *
 * Examples:
 *   config-db --file pools.yaml --get "/storage/pools/pool[name=tank]"
 *   config-db --file pools.yaml --bind-device "/storage/pools/pool[name=tank]/devicefile" /dev/sdb
 *   config-db --file pools.yaml --delete "/storage/pools/pool[name=old]"
 */

#include "src/config/inc/ConfigDatabase.hpp"
#include "src/storage/inc/BlockDevice.hpp"
#include "src/storage/inc/DeviceServices.hpp"
#include "src/helpers/inc/Args.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace config = blkref::config;
namespace storage = blkref::storage;
namespace args = blkref::helpers::args;

namespace {

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_FILE = 1,
  ARG_GET = 2,
  ARG_LIST = 3,
  ARG_VALUE = 4,
  ARG_SET_VALUE = 5,
  ARG_MERGE = 6,
  ARG_REPLACE = 7,
  ARG_DELETE = 8,
  ARG_BIND_DEVICE = 9,
  ARG_DUMP = 10,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Query and edit a YAML configuration file addressed by path expressions.";

args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_FILE] = {"--file", 1, false, "Configuration file"};
  map[ARG_GET] = {"--get", 1, false, "Print the first object at path"};
  map[ARG_LIST] = {"--list", 1, false, "Print every object at path"};
  map[ARG_VALUE] = {"--value", 1, false, "Print the scalar at path"};
  map[ARG_SET_VALUE] = {"--set-value", 2, false, "Store scalar <value> at <path>"};
  map[ARG_MERGE] = {"--merge", 2, false, "Merge YAML mapping <yaml> into objects at <path>"};
  map[ARG_REPLACE] = {"--replace", 2, false, "Replace objects at <path> with YAML mapping <yaml>"};
  map[ARG_DELETE] = {"--delete", 1, false, "Delete every node at path"};
  map[ARG_BIND_DEVICE] = {"--bind-device", 2, false,
                          "Store the stable reference of <device> at <path>"};
  map[ARG_DUMP] = {"--dump", 0, false, "Print the whole tree"};
  return map;
}

/// Report a failed operation; true if status is OK.
bool check(config::DatabaseStatus status, std::string_view what, std::string_view path) {
  if (status == config::DatabaseStatus::OK) {
    return true;
  }
  fmt::print(stderr, "Error: {} '{}': {}\n", what, path, config::toString(status));
  return false;
}

/// Parse a YAML mapping argument.
std::optional<config::ConfigObject> parseObject(std::string_view text) {
  config::ConfigObject object;
  if (!config::ConfigObject::fromYaml(std::string(text), object)) {
    fmt::print(stderr, "Error: '{}' is not a YAML mapping\n", text);
    return std::nullopt;
  }
  return object;
}

/// Resolve the most stable name of a device for persistence.
std::optional<std::string> stableReference(std::string_view devicePath) {
  const storage::LinuxDeviceServices SYSTEM;
  storage::BlockDevice dev(std::string(devicePath), SYSTEM.services());

  const storage::DeviceStatus STATUS = dev.assertExists();
  if (STATUS != storage::DeviceStatus::OK) {
    fmt::print(stderr, "Error: '{}' is not a block device ({})\n", devicePath,
               storage::toString(STATUS));
    return std::nullopt;
  }
  if (!dev.hasDeviceFileById()) {
    fmt::print(stderr, "Warning: {} has no by-id alias; storing {}\n", dev.getDescription(),
               dev.getPredictableDeviceFile());
  }
  return dev.getPredictableDeviceFile();
}

/// Run the requested operation. Returns the process exit code.
int run(config::ConfigDatabase& db, const args::ParsedArgs& pargs) {
  if (const auto PATH = args::value(pargs, ARG_GET)) {
    config::ConfigObject object;
    if (!check(db.get(*PATH, object), "get", *PATH)) {
      return 1;
    }
    fmt::print("{}\n", object.toString());
    return 0;
  }

  if (const auto PATH = args::value(pargs, ARG_LIST)) {
    std::vector<config::ConfigObject> objects;
    if (!check(db.getList(*PATH, objects), "list", *PATH)) {
      return 1;
    }
    for (const config::ConfigObject& OBJ : objects) {
      fmt::print("---\n{}\n", OBJ.toString());
    }
    return 0;
  }

  if (const auto PATH = args::value(pargs, ARG_VALUE)) {
    std::string value;
    if (!check(db.getValue(*PATH, value), "value", *PATH)) {
      return 1;
    }
    fmt::print("{}\n", value);
    return 0;
  }

  if (args::hasFlag(pargs, ARG_DUMP)) {
    fmt::print("{}\n", db.dump());
    return 0;
  }

  // Mutations below save the file on success.
  config::DatabaseStatus status = config::DatabaseStatus::OK;
  std::string_view path;

  if (args::hasFlag(pargs, ARG_SET_VALUE)) {
    path = *args::value(pargs, ARG_SET_VALUE);
    status = db.setValue(path, std::string(*args::value(pargs, ARG_SET_VALUE, 1)));
  } else if (args::hasFlag(pargs, ARG_MERGE)) {
    path = *args::value(pargs, ARG_MERGE);
    const std::optional<config::ConfigObject> OBJECT =
        parseObject(*args::value(pargs, ARG_MERGE, 1));
    if (!OBJECT) {
      return 1;
    }
    status = db.update(path, *OBJECT);
  } else if (args::hasFlag(pargs, ARG_REPLACE)) {
    path = *args::value(pargs, ARG_REPLACE);
    const std::optional<config::ConfigObject> OBJECT =
        parseObject(*args::value(pargs, ARG_REPLACE, 1));
    if (!OBJECT) {
      return 1;
    }
    status = db.replace(path, *OBJECT);
  } else if (args::hasFlag(pargs, ARG_DELETE)) {
    path = *args::value(pargs, ARG_DELETE);
    status = db.remove(path);
  } else if (args::hasFlag(pargs, ARG_BIND_DEVICE)) {
    path = *args::value(pargs, ARG_BIND_DEVICE);
    const std::optional<std::string> REFERENCE =
        stableReference(*args::value(pargs, ARG_BIND_DEVICE, 1));
    if (!REFERENCE) {
      return 1;
    }
    status = db.setValue(path, *REFERENCE);
    if (status == config::DatabaseStatus::OK) {
      fmt::print("{} = {}\n", path, *REFERENCE);
    }
  } else {
    fmt::print(stderr, "Error: no operation given\n");
    return 1;
  }

  if (!check(status, "update", path)) {
    return 1;
  }
  return check(db.save(), "save", db.file()) ? 0 : 1;
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
  if (args::hasFlag(pargs, ARG_HELP) || argList.empty()) {
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 0;
  }

  const std::optional<std::string_view> CONFIG_FILE = args::value(pargs, ARG_FILE);
  if (!CONFIG_FILE) {
    fmt::print(stderr, "Error: --file is required\n");
    return 1;
  }

  config::ConfigDatabase db;
  if (!check(db.load(std::string(*CONFIG_FILE)), "load", *CONFIG_FILE)) {
    return 1;
  }
  return run(db, pargs);
}
