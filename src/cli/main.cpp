#include "sceneseek/catalog_import.hpp"
#include "sceneseek/catalog_store.hpp"
#include "sceneseek/chat_service.hpp"
#include "sceneseek/config.hpp"
#include "sceneseek/conversation_store.hpp"
#include "sceneseek/embeddings.hpp"
#include "sceneseek/errors.hpp"
#include "sceneseek/event_stream.hpp"
#include "sceneseek/generation.hpp"
#include "sceneseek/logging.hpp"
#include "sceneseek/rule_based_planner.hpp"
#include "sceneseek/service_runtime.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFatal = 2;

class UsageError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

enum class Command {
  kNone,
  kInit,
  kImport,
  kAsk,
  kList,
  kShow,
  kDelete,
};

struct Options {
  Command command = Command::kNone;
  std::optional<std::string> config_path;
  std::string argument;
  std::optional<std::string> image_path;
  std::optional<std::string> conversation_id;
  std::string user_id = sceneseek::kAnonymousUser;
  int list_limit = 20;
  bool help = false;
};

void PrintUsage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " [--config <file>] --init                 # create catalog and conversation schemas\n"
            << "  " << argv0 << " [--config <file>] --import <catalog.json> # load files into the catalog\n"
            << "  " << argv0
            << " [--config <file>] --ask \"<query>\" [--image <file>] [--conversation <id>] [--user <id>]\n"
            << "  " << argv0 << " [--config <file>] --list [--user <id>] [--limit <n>]\n"
            << "  " << argv0 << " [--config <file>] --show <conversation id> [--user <id>]\n"
            << "  " << argv0 << " [--config <file>] --delete <conversation id> [--user <id>]\n";
}

void SetCommand(Options& options, Command command) {
  if (options.command != Command::kNone) {
    throw UsageError("only one command may be given");
  }
  options.command = command;
}

Options ParseArgs(int argc, char** argv) {
  Options options{};
  auto value_of = [&](int& i, const std::string& flag) -> std::string {
    if (i + 1 >= argc) {
      throw UsageError(flag + " requires a value");
    }
    return argv[++i];
  };
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      options.help = true;
    } else if (arg == "--config") {
      options.config_path = value_of(i, arg);
    } else if (arg == "--init") {
      SetCommand(options, Command::kInit);
    } else if (arg == "--import") {
      SetCommand(options, Command::kImport);
      options.argument = value_of(i, arg);
    } else if (arg == "--ask") {
      SetCommand(options, Command::kAsk);
      options.argument = value_of(i, arg);
    } else if (arg == "--list") {
      SetCommand(options, Command::kList);
    } else if (arg == "--show") {
      SetCommand(options, Command::kShow);
      options.argument = value_of(i, arg);
    } else if (arg == "--delete") {
      SetCommand(options, Command::kDelete);
      options.argument = value_of(i, arg);
    } else if (arg == "--image") {
      options.image_path = value_of(i, arg);
    } else if (arg == "--conversation") {
      options.conversation_id = value_of(i, arg);
    } else if (arg == "--user") {
      options.user_id = value_of(i, arg);
    } else if (arg == "--limit") {
      const auto text = value_of(i, arg);
      try {
        options.list_limit = std::stoi(text);
      } catch (const std::exception&) {
        throw UsageError("--limit must be an integer");
      }
      if (options.list_limit < 1) {
        throw UsageError("--limit must be positive");
      }
    } else {
      throw UsageError("unknown argument: " + arg);
    }
  }
  if (!options.help && options.command == Command::kNone) {
    throw UsageError("no command given");
  }
  if (options.image_path.has_value() && options.command != Command::kAsk) {
    throw UsageError("--image is only valid with --ask");
  }
  return options;
}

std::vector<std::uint8_t> ReadBinaryFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("failed to open image file: " + path);
  }
  return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

sceneseek::Json ReadJsonFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("failed to open catalog file: " + path);
  }
  auto document = sceneseek::Json::parse(in, nullptr, false);
  if (document.is_discarded()) {
    throw std::runtime_error("catalog file is not valid JSON: " + path);
  }
  return document;
}

int RunInit(const sceneseek::ServiceConfig& config) {
  sceneseek::CatalogStore catalog(config.catalog_db);
  sceneseek::SqliteConversationStore conversations(config.conversation_db);
  std::cout << "catalog initialized at: " << config.catalog_db << "\n"
            << "conversations initialized at: " << config.conversation_db << "\n";
  return kExitOk;
}

int RunImport(const sceneseek::ServiceConfig& config, const std::string& path) {
  sceneseek::CatalogStore catalog(config.catalog_db);
  sceneseek::HashingEmbeddingProvider embedder(config.embedding);
  const auto count = sceneseek::ImportCatalog(catalog, ReadJsonFile(path), &embedder);
  std::cout << "imported " << count << " files into " << config.catalog_db << "\n";
  return kExitOk;
}

int RunAsk(const sceneseek::ServiceConfig& config, const Options& options) {
  if (config.planner.kind != sceneseek::PlannerKind::kRules) {
    spdlog::warn("planner '{}' is served by sceneseek_server only; using the rule-based planner",
                 sceneseek::PlannerKindName(config.planner.kind));
  }
  sceneseek::RuleBasedPlannerOptions planner_options{};
  planner_options.search_limit = config.tools.default_limit;
  sceneseek::ServiceRuntime runtime(config, std::make_unique<sceneseek::RuleBasedPlanner>(planner_options));

  sceneseek::ChatRequest request{};
  request.query = options.argument;
  request.conversation_id = options.conversation_id;
  request.user_id = options.user_id;
  if (options.image_path.has_value()) {
    request.uploaded_image = std::make_shared<const std::vector<std::uint8_t>>(ReadBinaryFile(*options.image_path));
  }

  sceneseek::OstreamEventSink sink(std::cout);
  sceneseek::CancellationToken cancel;
  const auto summary = runtime.chat().Handle(request, sink, cancel);
  std::cout.flush();
  return summary.final_state == sceneseek::LoopState::kDone ? kExitOk : kExitFatal;
}

int RunList(const sceneseek::ServiceConfig& config, const Options& options) {
  sceneseek::SqliteConversationStore conversations(config.conversation_db);
  sceneseek::Json items = sceneseek::Json::array();
  for (const auto& summary : conversations.ListConversations(options.user_id, options.list_limit)) {
    items.push_back(sceneseek::ToJson(summary));
  }
  std::cout << sceneseek::Json{{"conversations", items}, {"count", items.size()}}.dump(2) << "\n";
  return kExitOk;
}

int RunShow(const sceneseek::ServiceConfig& config, const Options& options) {
  sceneseek::SqliteConversationStore conversations(config.conversation_db);
  const auto conversation = conversations.GetConversation(options.argument, options.user_id);
  if (!conversation.has_value()) {
    std::cerr << "conversation not found: " << options.argument << "\n";
    return kExitFatal;
  }
  std::cout << sceneseek::ToJson(*conversation).dump(2) << "\n";
  return kExitOk;
}

int RunDelete(const sceneseek::ServiceConfig& config, const Options& options) {
  sceneseek::SqliteConversationStore conversations(config.conversation_db);
  if (!conversations.DeleteConversation(options.argument, options.user_id)) {
    std::cerr << "conversation not found: " << options.argument << "\n";
    return kExitFatal;
  }
  std::cout << "deleted conversation " << options.argument << "\n";
  return kExitOk;
}

}  // namespace

int main(int argc, char** argv) {
  Options options{};
  try {
    options = ParseArgs(argc, argv);
  } catch (const UsageError& ex) {
    std::cerr << "error: " << ex.what() << "\n";
    PrintUsage(argv[0]);
    return kExitUsage;
  }
  if (options.help) {
    PrintUsage(argv[0]);
    return kExitOk;
  }

  try {
    const auto config = sceneseek::ResolveConfig(options.config_path);
    sceneseek::ConfigureLogging(config.logging);
    switch (options.command) {
      case Command::kInit:
        return RunInit(config);
      case Command::kImport:
        return RunImport(config, options.argument);
      case Command::kAsk:
        return RunAsk(config, options);
      case Command::kList:
        return RunList(config, options);
      case Command::kShow:
        return RunShow(config, options);
      case Command::kDelete:
        return RunDelete(config, options);
      case Command::kNone:
        break;
    }
    PrintUsage(argv[0]);
    return kExitUsage;
  } catch (const sceneseek::ConfigError& ex) {
    std::cerr << "config error: " << ex.what() << "\n";
    return kExitUsage;
  } catch (const std::exception& ex) {
    spdlog::error("fatal: {}", ex.what());
    std::cerr << "fatal: " << ex.what() << "\n";
    return kExitFatal;
  }
}
