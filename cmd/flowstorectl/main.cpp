#include <cctype>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/serialization/json_codec.hpp"
#include "internal/util/errors.hpp"

using flowstore::access::User;
using flowstore::project::ProjectSnapshot;

static void Usage() {
  std::cout << "Usage:\n"
            << "  flowstorectl --config <config.yaml> names\n"
            << "  flowstorectl --config <config.yaml> list <user>\n"
            << "  flowstorectl --config <config.yaml> get <project> <user>\n"
            << "  flowstorectl --config <config.yaml> create <project> <user> <description>\n"
            << "  flowstorectl --config <config.yaml> upload <project> <user> <dir> [--force]\n"
            << "  flowstorectl --config <config.yaml> commit <project>\n"
            << "  flowstorectl --config <config.yaml> grant <project> <admin> <user> [read,write,admin]\n"
            << "  flowstorectl --config <config.yaml> props <project> <user> <source>\n"
            << "  flowstorectl --config <config.yaml> prune <project> <user> <keep>\n";
}

static void PrintProject(const ProjectSnapshot& snapshot) {
  std::cout << snapshot.metadata.name() << "\t" << (snapshot.metadata.source().empty() ? "-" : snapshot.metadata.source()) << "\t"
            << snapshot.flows->Size() << " flows\n";
}

// "read,write" -> {CAPABILITY_READ, CAPABILITY_WRITE}
static std::vector<flowstore::v1::Capability> ParseCapabilities(const std::string& list) {
  std::vector<flowstore::v1::Capability> capabilities;
  std::stringstream                      in(list);
  std::string                            item;
  while (std::getline(in, item, ',')) {
    if (item.empty()) continue;
    std::string upper;
    for (char c : item) upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

    flowstore::v1::Capability capability;
    if (!flowstore::v1::Capability_Parse("CAPABILITY_" + upper, &capability)) {
      throw flowstore::util::ValidationError("Unknown capability " + item);
    }
    capabilities.push_back(capability);
  }
  return capabilities;
}

static int Run(flowstore::core::ProjectManager& store, const std::vector<std::string>& args) {
  const auto& cmd = args[0];

  if (cmd == "names" && args.size() == 1) {
    for (const auto& name : store.GetProjectNames()) std::cout << name << "\n";
    return 0;
  }
  if (cmd == "list" && args.size() == 2) {
    for (const auto& snapshot : store.GetProjects(User{args[1]})) PrintProject(snapshot);
    return 0;
  }
  if (cmd == "get" && args.size() == 3) {
    const auto snapshot = store.GetProject(args[1], User{args[2]});
    std::cout << flowstore::serialization::ToJson(snapshot.metadata) << "\n";
    for (const auto& id : snapshot.flows->Ids()) std::cout << "flow " << id << "\n";
    return 0;
  }
  if (cmd == "create" && args.size() == 4) {
    PrintProject(store.CreateProject(args[1], args[3], User{args[2]}));
    return 0;
  }
  if (cmd == "upload" && (args.size() == 4 || (args.size() == 5 && args[4] == "--force"))) {
    PrintProject(store.UploadProject(args[1], args[3], User{args[2]}, args.size() == 5));
    return 0;
  }
  if (cmd == "commit" && args.size() == 2) {
    store.CommitProject(args[1]);
    return 0;
  }
  if (cmd == "grant" && (args.size() == 4 || args.size() == 5)) {
    const auto capabilities = args.size() == 5 ? ParseCapabilities(args[4]) : std::vector<flowstore::v1::Capability>{};
    store.SetUserPermission(args[1], User{args[2]}, args[3], capabilities);
    return 0;
  }
  if (cmd == "props" && args.size() == 4) {
    const auto props = store.GetProperties(args[1], args[3], User{args[2]});
    for (const auto& [key, value] : props.entries()) std::cout << key << "=" << value << "\n";
    return 0;
  }
  if (cmd == "prune" && args.size() == 4) {
    const auto keep = std::stoul(args[3]);
    for (const auto& version : store.PruneInstallVersions(args[1], User{args[2]}, keep)) std::cout << "removed " << version << "\n";
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string        config_path = argv[2];
  std::vector<std::string> args(argv + 3, argv + argc);

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = flowstore::config::ConfigLoader::LoadFromYaml(config_path);

    flowstore::observability::InitializeTracing(config);
    flowstore::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Recover the store and run the command
    // ------------------------------------------------------------
    auto store = flowstore::factory::Build(config);
    const int rc = Run(*store, args);

    flowstore::observability::ShutdownLogging();
    flowstore::observability::ShutdownTracing();
    return rc;
  } catch (const flowstore::util::UploadRejected& e) {
    std::cerr << "upload rejected:\n" << e.what();
    flowstore::observability::ShutdownLogging();
    flowstore::observability::ShutdownTracing();
    return 3;
  } catch (const std::exception& e) {
    FLOWSTORE_LOG_ERROR("Fatal error", {flowstore::observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
    flowstore::observability::ShutdownLogging();
    flowstore::observability::ShutdownTracing();
    return 2;
  }
}
