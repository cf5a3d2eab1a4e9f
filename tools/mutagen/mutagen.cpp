//===- mutagen.cpp - Mutation testing driver ------------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// mutagen runs incremental mutation testing against a live program. The
// program is driven through a test command, a reload command and the trace
// and bridge files its instrumentation writes.
//
//===----------------------------------------------------------------------===//

#include "ProcessServices.h"
#include "mutagen/Engine/Orchestrator.h"
#include "mutagen/Mutation/OperatorCatalog.h"
#include "mutagen/Support/ContentHash.h"
#include "mutagen/Support/Diagnostics.h"
#include "mutagen/Support/MutagenError.h"
#include "mutagen/Support/MutationConfig.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/CommandLine.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"
#include <optional>
#include <string>
#include <vector>

using namespace llvm;
using namespace mutagen;
using mutagen::tool::BridgeFile;
using mutagen::tool::Command;
using mutagen::tool::CommandReloadService;
using mutagen::tool::ProcessTestExecutor;
using mutagen::tool::TraceFileOracle;

//===----------------------------------------------------------------------===//
// Command Line Options
//===----------------------------------------------------------------------===//

static cl::OptionCategory mainCategory("mutagen Options");

enum SubCommand { None, Run, Results, Operators };

static cl::opt<SubCommand> command(
    cl::desc("Command to execute:"),
    cl::values(clEnumValN(Run, "run", "Run mutation testing"),
               clEnumValN(Results, "results", "Print the stored results"),
               clEnumValN(Operators, "operators",
                          "List the selected mutation operators")),
    cl::init(::None), cl::cat(mainCategory));

static cl::list<std::string>
    inputFiles(cl::Positional,
               cl::desc("<source files> (default: sources from the config)"),
               cl::cat(mainCategory));

static cl::opt<std::string>
    configFile("config", cl::desc("Configuration file (default: search for "
                                  "mutagen.yaml upwards)"),
               cl::value_desc("filename"), cl::cat(mainCategory));

static cl::opt<std::string> preset("preset",
                                   cl::desc("Operator preset (fast, default, "
                                            "all)"),
                                   cl::value_desc("name"),
                                   cl::cat(mainCategory));

static cl::list<std::string>
    operatorList("operator",
                 cl::desc("Use only this operator (repeatable)"),
                 cl::value_desc("id"), cl::cat(mainCategory));

static cl::list<std::string>
    disableList("disable-operator",
                cl::desc("Remove this operator (repeatable)"),
                cl::value_desc("id"), cl::cat(mainCategory));

static cl::opt<std::string>
    clusterKey("cluster-key",
               cl::desc("Cluster key (none, operator, location, shape)"),
               cl::value_desc("key"), cl::cat(mainCategory));

static cl::opt<bool>
    noSchemata("no-schemata",
               cl::desc("Apply and revert every mutant individually"),
               cl::cat(mainCategory));

static cl::opt<unsigned>
    timeoutMs("timeout-ms", cl::desc("Bound for one test invocation"),
              cl::value_desc("ms"), cl::cat(mainCategory));

static cl::opt<unsigned>
    testJobs("test-jobs", cl::desc("Covering tests run concurrently per site"),
             cl::value_desc("n"), cl::cat(mainCategory));

static cl::opt<std::string> stateDir("state-dir",
                                     cl::desc("Persisted state directory"),
                                     cl::value_desc("dir"),
                                     cl::cat(mainCategory));

static cl::opt<bool>
    noIncremental("no-incremental",
                  cl::desc("Ignore stored digests and test every form"),
                  cl::cat(mainCategory));

static cl::opt<std::string>
    shard("shard", cl::desc("Only mutate files of shard <i>/<n>"),
          cl::value_desc("i/n"), cl::cat(mainCategory));

static cl::opt<std::string>
    testCommand("test-command",
                cl::desc("Command run as '<cmd> <test-id>' (exit 0 pass, "
                         "1 fail)"),
                cl::value_desc("cmd"), cl::cat(mainCategory));

static cl::opt<std::string>
    reloadCommand("reload-command",
                  cl::desc("Command run as '<cmd> <file>...' after a file "
                           "changed"),
                  cl::value_desc("cmd"), cl::cat(mainCategory));

static cl::opt<std::string>
    traceFile("trace-file",
              cl::desc("JSON-lines trace events written by the program"),
              cl::value_desc("filename"), cl::cat(mainCategory));

static cl::opt<std::string>
    bridgeFile("bridge-file",
               cl::desc("JSON-lines form locations written by the program"),
               cl::value_desc("filename"), cl::cat(mainCategory));

static cl::opt<std::string>
    reportFile("report", cl::desc("Write the JSON report to this file"),
               cl::value_desc("filename"), cl::cat(mainCategory));

static cl::opt<double>
    minScore("min-score",
             cl::desc("Fail when the mutation score is below this percent"),
             cl::value_desc("percent"), cl::init(0.0), cl::cat(mainCategory));

static cl::opt<bool> verbose("v", cl::desc("Verbose output"),
                             cl::cat(mainCategory));

//===----------------------------------------------------------------------===//
// Helper Functions
//===----------------------------------------------------------------------===//

static int reportError(Error err) {
  emitError(toString(std::move(err)));
  return 1;
}

static Expected<std::unique_ptr<MutationConfig>> findConfig() {
  if (!configFile.empty())
    return MutationConfig::loadFromFile(configFile);
  SmallString<256> cwd;
  if (std::error_code ec = sys::fs::current_path(cwd))
    return createStringError(ec, "cannot determine the current directory");
  return MutationConfig::findAndLoadRecursive(cwd);
}

/// Load the configuration and apply the command line on top of it.
static Expected<std::unique_ptr<MutationConfig>> loadConfig() {
  auto config = findConfig();
  if (!config)
    return config.takeError();

  MutationSettings &settings = (*config)->getMutationSettings();
  if (!preset.empty())
    settings.preset = preset;
  if (!operatorList.empty())
    settings.operators.assign(operatorList.begin(), operatorList.end());
  for (const std::string &id : disableList)
    settings.disableOperators.push_back(id);
  if (!clusterKey.empty())
    settings.clusterKey = clusterKey;
  if (noSchemata)
    settings.schemata = false;
  if (timeoutMs.getNumOccurrences())
    settings.timeoutMs = timeoutMs;
  if (testJobs.getNumOccurrences())
    settings.testJobs = testJobs;

  StateConfig &state = (*config)->getStateConfig();
  if (!stateDir.empty())
    state.dir = stateDir;
  if (noIncremental)
    state.incremental = false;
  return config;
}

/// Parse "<i>/<n>" with i < n.
static Expected<std::pair<unsigned, unsigned>> parseShard(StringRef text) {
  auto [index, count] = text.split('/');
  unsigned i = 0, n = 0;
  if (index.getAsInteger(10, i) || count.getAsInteger(10, n) || n == 0 ||
      i >= n)
    return makeError(ErrorKind::ConfigError,
                     "invalid shard '" + text + "', expected <i>/<n> with "
                                                "i < n");
  return std::make_pair(i, n);
}

/// Shard of `file`, from a hash of its path relative to the project root so
/// every checkout agrees.
static unsigned getShard(const MutationConfig &config, StringRef file,
                         unsigned count) {
  StringRef relative = file;
  StringRef root = config.getRootDirectory();
  if (!root.empty() && relative.consume_front(root))
    relative = relative.ltrim(sys::path::get_separator());
  return ContentHash::fromString(relative).low % count;
}

static Expected<std::vector<std::string>>
selectFiles(MutationConfig &config) {
  std::vector<std::string> files;
  if (inputFiles.empty()) {
    auto resolved = config.resolveSourceFiles();
    if (!resolved)
      return resolved.takeError();
    files = std::move(*resolved);
  } else {
    for (const std::string &file : inputFiles)
      files.push_back(config.resolvePath(file));
  }

  if (shard.empty())
    return files;
  auto range = parseShard(shard);
  if (!range)
    return range.takeError();
  unsigned index = range->first, count = range->second;
  llvm::erase_if(files, [&](const std::string &file) {
    return getShard(config, file, count) != index;
  });
  // Shards keep separate state so they can run side by side.
  StateConfig &state = config.getStateConfig();
  state.dir += "/shard-" + std::to_string(index) + "-of-" +
               std::to_string(count);
  return files;
}

static std::string getResultsPath(const MutationConfig &config) {
  SmallString<256> path(config.resolvePath(config.getStateConfig().dir));
  sys::path::append(path, "results.json");
  return std::string(path);
}

//===----------------------------------------------------------------------===//
// Run Command
//===----------------------------------------------------------------------===//

static int runMutation() {
  auto config = loadConfig();
  if (!config)
    return reportError(config.takeError());
  auto files = selectFiles(**config);
  if (!files)
    return reportError(files.takeError());
  if (files->empty()) {
    emitWarning("no source files to mutate");
    return 0;
  }

  if (testCommand.empty() || traceFile.empty() || bridgeFile.empty()) {
    emitError("run requires --test-command, --trace-file and --bridge-file");
    return 1;
  }
  auto test = Command::parse(testCommand);
  if (!test)
    return reportError(test.takeError());
  std::optional<Command> reload;
  if (!reloadCommand.empty()) {
    auto parsed = Command::parse(reloadCommand);
    if (!parsed)
      return reportError(parsed.takeError());
    reload = std::move(*parsed);
  }

  ProcessTestExecutor executor(std::move(*test));
  CommandReloadService reloader(std::move(reload));
  TraceFileOracle oracle((*config)->resolvePath(traceFile));
  BridgeFile bridge((*config)->resolvePath(bridgeFile),
                    (*config)->getRootDirectory().str());

  Orchestrator orchestrator(**config,
                            EngineServices{oracle, bridge, reloader, executor});
  auto report = orchestrator.run(*files);
  if (!report)
    return reportError(report.takeError());

  report->print(outs(), verbose);
  if (verbose) {
    outs() << "\n";
    orchestrator.getStatistics().print(outs());
  }

  if (!reportFile.empty())
    if (auto err = report->save(reportFile))
      return reportError(std::move(err));

  auto score = report->getScore();
  if (score && *score * 100.0 < minScore) {
    errs() << "Mutation score "
           << format("%.1f%%", *score * 100.0) << " is below the threshold "
           << format("%.1f%%", static_cast<double>(minScore)) << "\n";
    return 1;
  }
  return 0;
}

//===----------------------------------------------------------------------===//
// Results Command
//===----------------------------------------------------------------------===//

static int runResults() {
  auto config = loadConfig();
  if (!config)
    return reportError(config.takeError());
  if (!shard.empty()) {
    // Only the state directory suffix matters here.
    auto files = selectFiles(**config);
    if (!files)
      return reportError(files.takeError());
  }
  auto report = MutationReport::load(getResultsPath(**config));
  if (!report)
    return reportError(report.takeError());
  report->print(outs(), verbose);
  if (!reportFile.empty())
    if (auto err = report->save(reportFile))
      return reportError(std::move(err));
  return 0;
}

//===----------------------------------------------------------------------===//
// Operators Command
//===----------------------------------------------------------------------===//

static int runOperators() {
  auto config = loadConfig();
  if (!config)
    return reportError(config.takeError());
  const MutationSettings &settings = (*config)->getMutationSettings();
  auto catalog = OperatorCatalog::getBuiltin().select(
      settings.preset, settings.operators, settings.disableOperators);
  if (!catalog)
    return reportError(catalog.takeError());

  for (const Operator &op : catalog->getOperators()) {
    outs() << left_justify(op.id, 24) << " "
           << left_justify(getOperatorCategoryName(op.category), 12) << " "
           << format("%.2f", op.hardness);
    if (verbose && !op.dominates.empty()) {
      outs() << "  dominates:";
      for (const std::string &other : op.dominates)
        outs() << " " << other;
    }
    outs() << "\n";
  }
  outs() << catalog->size() << " operators\n";
  return 0;
}

int main(int argc, char **argv) {
  InitLLVM y(argc, argv);

  cl::HideUnrelatedOptions(mainCategory);
  cl::ParseCommandLineOptions(argc, argv, "mutagen mutation testing tool\n");
  if (verbose)
    setDiagnosticThreshold(DiagSeverity::Remark);

  switch (command) {
  case Run:
    return runMutation();
  case Results:
    return runResults();
  case Operators:
    return runOperators();
  case ::None:
    cl::PrintHelpMessage();
    return 0;
  }
  return 1;
}
