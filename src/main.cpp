#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>
#include <algorithm>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "config_manager.hpp"
#include "credential_masker.hpp"
#include "logger.hpp"
#include "mongo_database.hpp"
#include "native_importer.hpp"
#include "transfer_engine.hpp"
#include "transfer_exceptions.hpp"

namespace po = boost::program_options;
using namespace xfer;

namespace {

constexpr int EXIT_CANCELLED = 130;

// Prints every engine event as one JSON object per line on stdout
class JsonLinesObserver : public ProgressObserver {
public:
  void onTransferEvent(const TransferEvent &event) override {
    nlohmann::json line = {{"event", event.name}, {"data", event.payload}};
    std::cout << line.dump() << std::endl;
  }
};

// SIGINT/SIGTERM cancel every running job; the job itself then cleans up
class SignalWatcher {
public:
  explicit SignalWatcher(TransferEngine &engine)
      : signals_(io_, SIGINT, SIGTERM) {
    signals_.async_wait(
        [&engine](const boost::system::error_code &ec, int signal) {
          if (ec) {
            return;
          }
          CliLogger::warn("Received signal {}, cancelling {} job(s)", signal,
                          engine.cancelAll());
        });
    thread_ = std::thread([this] { io_.run(); });
  }

  ~SignalWatcher() {
    io_.stop();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

private:
  boost::asio::io_context io_;
  boost::asio::signal_set signals_;
  std::thread thread_;
};

void printJson(const nlohmann::json &value) {
  std::cout << value.dump(2) << std::endl;
}

std::vector<std::string> optionList(const po::variables_map &vm,
                                    const std::string &name) {
  if (vm.count(name) == 0) {
    return {};
  }
  return vm[name].as<std::vector<std::string>>();
}

// --db names whole databases, --collection "db.coll" narrows one database
NativeExportOptions nativeOptions(const po::variables_map &vm) {
  NativeExportOptions options;
  options.outputPath = vm["out"].as<std::string>();
  options.databases = optionList(vm, "db");
  for (const auto &ns : optionList(vm, "collection")) {
    auto dot = ns.find('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == ns.size()) {
      throw createValidationError("collection", ns,
                                  "expected <database>.<collection>");
    }
    auto database = ns.substr(0, dot);
    auto &collections = options.databaseCollections[database];
    collections.push_back(ns.substr(dot + 1));
  }
  for (const auto &[database, collections] : options.databaseCollections) {
    if (std::find(options.databases.begin(), options.databases.end(),
                  database) == options.databases.end()) {
      options.databases.push_back(database);
    }
  }
  return options;
}

NativeImportOptions importOptions(const po::variables_map &vm) {
  NativeImportOptions options;
  options.inputPath = vm["in"].as<std::string>();
  options.databases = optionList(vm, "db");
  options.mode = parseImportMode(vm["mode"].as<std::string>());
  return options;
}

DumpOptions dumpOptions(const po::variables_map &vm) {
  DumpOptions options;
  options.outputPath = vm["out"].as<std::string>();
  auto databases = optionList(vm, "db");
  if (databases.size() == 1) {
    options.selection.database = databases.front();
  } else {
    options.selection.databases = databases;
  }
  options.selection.collections = optionList(vm, "collection");
  options.selection.excludeCollections = optionList(vm, "exclude");
  return options;
}

RestoreOptions restoreOptions(const po::variables_map &vm) {
  RestoreOptions options;
  options.inputPath = vm["in"].as<std::string>();
  auto databases = optionList(vm, "db");
  if (databases.size() > 1) {
    throw createValidationError("db", databases[1],
                                "restore targets at most one database");
  }
  if (!databases.empty()) {
    options.database = databases.front();
  }
  auto collections = optionList(vm, "collection");
  if (collections.size() > 1) {
    throw createValidationError("collection", collections[1],
                                "restore targets at most one collection");
  }
  if (!collections.empty()) {
    options.collection = collections.front();
  }
  options.drop = vm.count("drop") > 0;
  options.dryRun = vm.count("dry-run") > 0;
  options.nsInclude = optionList(vm, "ns-include");
  options.files = optionList(vm, "file");
  return options;
}

std::unique_ptr<TransferEngine> makeEngine(const TransferConfig &transferConfig,
                                           const po::variables_map &vm,
                                           bool needsDatabase) {
  std::string uri = vm.count("uri") ? vm["uri"].as<std::string>() : "";
  if (uri.empty()) {
    uri = ConfigManager::getInstance().getString("database.uri", "");
  }
  if (uri.empty() && needsDatabase) {
    throw ValidationException(ErrorCode::MISSING_FIELD,
                              "a connection string is required (--uri)",
                              "uri");
  }

  std::shared_ptr<DocumentDatabase> database;
  if (!uri.empty()) {
    database = std::make_shared<MongoDatabase>(uri);
  }
  auto engine =
      std::make_unique<TransferEngine>(transferConfig, uri, database);
  engine->emitter().addObserver(std::make_shared<JsonLinesObserver>());
  return engine;
}

void printUsage(const po::options_description &options) {
  std::cout << "Usage: mongoxfer <command> [options]\n\n"
            << "Commands:\n"
            << "  dump      export through mongodump (.archive)\n"
            << "  restore   import through mongorestore\n"
            << "  preview   list the namespaces inside an archive\n"
            << "  export    export through the driver into a zip\n"
            << "  import    load a zip export through the driver\n"
            << "  inspect   summarize the databases of a zip export\n"
            << "  tools     report installed database tools\n"
            << "  scan      list the files of an import directory\n\n"
            << options << std::endl;
}

int runCommand(const std::string &command, const po::variables_map &vm,
               const TransferConfig &transferConfig) {
  if (command == "tools") {
    auto engine = makeEngine(transferConfig, vm, false);
    printJson(engine->checkTools());
    return 0;
  }
  if (command == "scan") {
    auto entries = scanImportDirectory(vm["in"].as<std::string>());
    auto listing = nlohmann::json::array();
    for (const auto &entry : entries) {
      listing.push_back({{"name", entry.name}, {"size", entry.size}});
    }
    printJson(listing);
    return 0;
  }
  if (command == "inspect") {
    printJson(previewNativeImport(vm["in"].as<std::string>()));
    return 0;
  }

  auto engine = makeEngine(transferConfig, vm, true);
  SignalWatcher watcher(*engine);

  if (command == "dump") {
    auto path = engine->exportWithTool(dumpOptions(vm));
    engine->emitter().flush();
    return path ? 0 : EXIT_CANCELLED;
  }
  if (command == "restore") {
    auto result = engine->importWithTool(restoreOptions(vm));
    engine->emitter().flush();
    printJson(result);
    return result.errors.empty() ? 0 : 2;
  }
  if (command == "preview") {
    printJson(engine->previewArchive(vm["in"].as<std::string>()));
    return 0;
  }
  if (command == "export") {
    auto result = engine->exportNative(nativeOptions(vm));
    engine->emitter().flush();
    if (!result) {
      return EXIT_CANCELLED;
    }
    printJson(result->manifest);
    return 0;
  }
  if (command == "import") {
    auto options = importOptions(vm);
    auto result = vm.count("dry-run") ? engine->dryRunNativeImport(options)
                                      : engine->importNative(options);
    engine->emitter().flush();
    printJson(result);
    return result.errors.empty() ? 0 : 2;
  }

  throw ValidationException(ErrorCode::INVALID_INPUT,
                            "unknown command '" + command + "'", "command",
                            command);
}

} // namespace

int main(int argc, char *argv[]) {
  po::options_description general("General options");
  general.add_options()("help,h", "show this help")(
      "config,c", po::value<std::string>()->default_value("config.json"),
      "configuration file")("uri,u", po::value<std::string>(),
                            "connection string")(
      "verbose,v", "log at debug level");

  po::options_description transfer("Transfer options");
  transfer.add_options()("out,o", po::value<std::string>()->default_value(""),
                         "output file or directory")(
      "in,i", po::value<std::string>()->default_value(""),
      "input archive, dump directory or archive directory")(
      "db,d", po::value<std::vector<std::string>>()->composing(),
      "database (repeatable)")(
      "collection", po::value<std::vector<std::string>>()->composing(),
      "collection; <db>.<coll> for export (repeatable)")(
      "exclude", po::value<std::vector<std::string>>()->composing(),
      "collection to exclude from a dump (repeatable)")(
      "ns-include", po::value<std::vector<std::string>>()->composing(),
      "namespace filter for restore (repeatable)")(
      "file", po::value<std::vector<std::string>>()->composing(),
      "restrict an archive directory restore to these files (repeatable)")(
      "drop", "drop collections before restoring")(
      "mode", po::value<std::string>()->default_value("skip"),
      "native import: skip existing documents or override databases")(
      "dry-run", "run the restore or import without writing");

  po::options_description hidden;
  hidden.add_options()("command", po::value<std::string>(), "command");

  po::options_description all;
  all.add(general).add(transfer).add(hidden);
  po::options_description visible;
  visible.add(general).add(transfer);

  po::positional_options_description positional;
  positional.add("command", 1);

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error &e) {
    std::cerr << "mongoxfer: " << e.what() << std::endl;
    printUsage(visible);
    return 1;
  }

  if (vm.count("help") || !vm.count("command")) {
    printUsage(visible);
    return vm.count("help") ? 0 : 1;
  }

  auto &config = ConfigManager::getInstance();
  const auto configPath = vm["config"].as<std::string>();
  if (!config.loadConfig(configPath)) {
    std::cerr << "Using built-in defaults, could not load " << configPath
              << std::endl;
  }

  auto &logger = Logger::getInstance();
  logger.configure(config.getLoggingConfig());
  if (vm.count("verbose")) {
    logger.setLogLevel(LogLevel::DEBUG);
  }

  int status = 1;
  try {
    status = runCommand(vm["command"].as<std::string>(), vm,
                        config.getTransferConfig());
  } catch (const CancelledException &e) {
    CliLogger::warn("Job {} cancelled", e.getJobId());
    status = EXIT_CANCELLED;
  } catch (const TransferException &e) {
    CliLogger::error("{}", e.toLogString());
    std::cerr << "mongoxfer: " << maskCredentials(e.getMessage()) << std::endl;
    status = 1;
  } catch (const std::exception &e) {
    CliLogger::error("Unexpected failure: {}", maskCredentials(e.what()));
    std::cerr << "mongoxfer: " << maskCredentials(e.what()) << std::endl;
    status = 1;
  }

  auto metrics = logger.getMetrics();
  CliLogger::debug("Logged {} message(s): {} warning(s), {} error(s), {} dropped",
                   metrics.totalMessages.load(), metrics.warningCount.load(),
                   metrics.errorCount.load(), metrics.droppedMessages.load());
  logger.shutdown();
  return status;
}
