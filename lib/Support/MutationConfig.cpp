//===- MutationConfig.cpp - Mutation run configuration --------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file implements the MutationConfig class for loading the configuration
// of a mutation run from YAML files.
//
//===----------------------------------------------------------------------===//

#include "mutagen/Support/MutationConfig.h"
#include "mutagen/Support/MutagenError.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/GlobPattern.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/SourceMgr.h"
#include "llvm/Support/YAMLParser.h"

#include <algorithm>
#include <functional>

using namespace mutagen;

//===----------------------------------------------------------------------===//
// Configuration File Names
//===----------------------------------------------------------------------===//

static const StringRef configFileNames[] = {"mutagen.yaml", ".mutagen.yaml",
                                            "mutagen.yml", ".mutagen.yml"};

ArrayRef<StringRef> mutagen::getMutationConfigFileNames() {
  return configFileNames;
}

bool mutagen::isMutationConfigFile(StringRef filename) {
  StringRef basename = llvm::sys::path::filename(filename);
  for (const auto &name : configFileNames) {
    if (basename == name)
      return true;
  }
  return false;
}

//===----------------------------------------------------------------------===//
// YAML Parsing Helpers
//===----------------------------------------------------------------------===//

namespace {

/// Get scalar value from a YAML node.
StringRef getScalar(llvm::yaml::Node *node, SmallVectorImpl<char> &storage) {
  if (auto *scalar = dyn_cast_or_null<llvm::yaml::ScalarNode>(node))
    return scalar->getValue(storage);
  return "";
}

/// Get boolean value from a YAML node.
bool getBool(llvm::yaml::Node *node) {
  llvm::SmallString<16> storage;
  auto val = getScalar(node, storage);
  return val == "true" || val == "yes" || val == "1" || val == "on";
}

/// Parse an unsigned scalar; leaves `out` untouched and returns false on
/// malformed input.
bool getUnsigned(llvm::yaml::Node *node, uint64_t &out) {
  llvm::SmallString<32> storage;
  uint64_t value = 0;
  if (getScalar(node, storage).trim().getAsInteger(10, value))
    return false;
  out = value;
  return true;
}

/// Parse a string sequence from a YAML node.
void parseStringSequence(llvm::yaml::Node *node,
                         std::vector<std::string> &out) {
  if (auto *seq = dyn_cast_or_null<llvm::yaml::SequenceNode>(node)) {
    for (auto &item : *seq) {
      llvm::SmallString<128> storage;
      auto val = getScalar(&item, storage);
      if (!val.empty())
        out.push_back(val.str());
    }
  }
}

/// Parse a YAML mapping node with a callback for each key-value pair.
bool parseMapping(llvm::yaml::MappingNode *mapping,
                  std::function<bool(StringRef, llvm::yaml::Node *)> cb) {
  for (auto &entry : *mapping) {
    auto *keyNode = dyn_cast<llvm::yaml::ScalarNode>(entry.getKey());
    if (!keyNode)
      continue;

    llvm::SmallString<64> keyStorage;
    StringRef key = keyNode->getValue(keyStorage);

    if (!cb(key, entry.getValue()))
      return false;
  }
  return true;
}

void parseProjectInfo(llvm::yaml::MappingNode *node, ProjectInfo &info) {
  parseMapping(node, [&](StringRef key, llvm::yaml::Node *value) {
    llvm::SmallString<128> storage;
    if (key == "name")
      info.name = getScalar(value, storage).str();
    return true;
  });
}

void parseSourceConfig(llvm::yaml::MappingNode *node, SourceConfig &config) {
  parseMapping(node, [&](StringRef key, llvm::yaml::Node *value) {
    if (key == "files" || key == "sources")
      parseStringSequence(value, config.files);
    else if (key == "exclude" || key == "exclude_patterns")
      parseStringSequence(value, config.exclude);
    return true;
  });
}

/// Parse one entry of `tests.units`.
TestUnitConfig parseTestUnit(llvm::yaml::MappingNode *node) {
  TestUnitConfig unit;
  parseMapping(node, [&](StringRef key, llvm::yaml::Node *value) {
    llvm::SmallString<256> storage;
    if (key == "id" || key == "name")
      unit.id = getScalar(value, storage).str();
    else if (key == "file")
      unit.file = getScalar(value, storage).str();
    else if (key == "tests")
      parseStringSequence(value, unit.tests);
    else if (key == "depends" || key == "dependencies")
      parseStringSequence(value, unit.depends);
    return true;
  });
  return unit;
}

void parseTestsSection(llvm::yaml::MappingNode *node,
                       std::vector<TestUnitConfig> &units) {
  parseMapping(node, [&](StringRef key, llvm::yaml::Node *value) {
    if (key != "units")
      return true;
    if (auto *seq = dyn_cast<llvm::yaml::SequenceNode>(value)) {
      for (auto &item : *seq)
        if (auto *unitMap = dyn_cast<llvm::yaml::MappingNode>(&item))
          units.push_back(parseTestUnit(unitMap));
    }
    return true;
  });
}

/// Parse the mutation section. Returns false and sets `error` on a value that
/// is present but malformed.
bool parseMutationSettings(llvm::yaml::MappingNode *node,
                           MutationSettings &settings, std::string &error) {
  return parseMapping(node, [&](StringRef key, llvm::yaml::Node *value) {
    llvm::SmallString<128> storage;
    if (key == "preset") {
      settings.preset = getScalar(value, storage).str();
    } else if (key == "operators") {
      parseStringSequence(value, settings.operators);
    } else if (key == "disable_operators" || key == "disable") {
      parseStringSequence(value, settings.disableOperators);
    } else if (key == "cluster_key") {
      settings.clusterKey = getScalar(value, storage).str();
    } else if (key == "coordinate_prefix") {
      uint64_t n = 0;
      if (!getUnsigned(value, n)) {
        error = "mutation.coordinate_prefix must be an unsigned integer";
        return false;
      }
      settings.coordinatePrefix = static_cast<unsigned>(n);
    } else if (key == "schemata") {
      settings.schemata = getBool(value);
    } else if (key == "selector") {
      settings.selector = getScalar(value, storage).str();
    } else if (key == "timeout_ms") {
      if (!getUnsigned(value, settings.timeoutMs)) {
        error = "mutation.timeout_ms must be an unsigned integer";
        return false;
      }
    } else if (key == "test_jobs") {
      uint64_t n = 0;
      if (!getUnsigned(value, n)) {
        error = "mutation.test_jobs must be an unsigned integer";
        return false;
      }
      settings.testJobs = static_cast<unsigned>(n);
    } else if (key == "skip_forms") {
      settings.skipForms.clear();
      parseStringSequence(value, settings.skipForms);
    }
    return true;
  });
}

void parseStateConfig(llvm::yaml::MappingNode *node, StateConfig &config) {
  parseMapping(node, [&](StringRef key, llvm::yaml::Node *value) {
    llvm::SmallString<256> storage;
    if (key == "dir" || key == "directory")
      config.dir = getScalar(value, storage).str();
    else if (key == "incremental")
      config.incremental = getBool(value);
    return true;
  });
}

/// Relative path of `path` below `base`, or `path` itself.
StringRef relativeTo(StringRef path, StringRef base) {
  if (base.empty() || path.size() <= base.size() ||
      path.substr(0, base.size()) != base)
    return path;
  path = path.drop_front(base.size());
  while (!path.empty() && llvm::sys::path::is_separator(path.front()))
    path = path.drop_front();
  return path;
}

} // namespace

//===----------------------------------------------------------------------===//
// MutationConfig Implementation
//===----------------------------------------------------------------------===//

MutationConfig::MutationConfig() = default;
MutationConfig::~MutationConfig() = default;

std::unique_ptr<MutationConfig> MutationConfig::createDefault() {
  return std::make_unique<MutationConfig>();
}

llvm::Expected<std::unique_ptr<MutationConfig>>
MutationConfig::loadFromFile(StringRef filePath) {
  auto fileOrErr = llvm::MemoryBuffer::getFile(filePath);
  if (auto ec = fileOrErr.getError())
    return llvm::createStringError(ec, "failed to open config file: %s",
                                   filePath.str().c_str());

  auto result = loadFromYAML((*fileOrErr)->getBuffer());
  if (!result)
    return result.takeError();

  // Set root directory to the directory containing the config file
  llvm::SmallString<256> absPath(filePath);
  llvm::sys::fs::make_absolute(absPath);
  (*result)->setRootDirectory(llvm::sys::path::parent_path(absPath));

  return result;
}

llvm::Expected<std::unique_ptr<MutationConfig>>
MutationConfig::loadFromYAML(StringRef yamlContent) {
  auto config = std::make_unique<MutationConfig>();

  // Handle empty content as valid empty config
  if (yamlContent.trim().empty())
    return std::move(config);

  llvm::SourceMgr srcMgr;
  std::string diagText;
  srcMgr.setDiagHandler(
      [](const llvm::SMDiagnostic &diag, void *context) {
        *static_cast<std::string *>(context) = diag.getMessage().str();
      },
      &diagText);
  llvm::yaml::Stream stream(yamlContent, srcMgr);

  auto docIt = stream.begin();
  if (docIt == stream.end())
    return std::move(config);

  auto *root = dyn_cast_or_null<llvm::yaml::MappingNode>(docIt->getRoot());
  if (!root || stream.failed())
    return makeError(ErrorKind::ConfigError,
                     diagText.empty() ? "config root must be a mapping"
                                      : "malformed config: " + diagText);

  std::string error;
  bool ok = parseMapping(root, [&](StringRef key, llvm::yaml::Node *value) {
    auto *mapping = dyn_cast<llvm::yaml::MappingNode>(value);
    if (!mapping)
      return true;

    config->sawAnySection = true;
    if (key == "project")
      parseProjectInfo(mapping, config->projectInfo);
    else if (key == "sources" || key == "source")
      parseSourceConfig(mapping, config->sourceConfig);
    else if (key == "tests")
      parseTestsSection(mapping, config->testUnits);
    else if (key == "mutation")
      return parseMutationSettings(mapping, config->settings, error);
    else if (key == "state")
      parseStateConfig(mapping, config->stateConfig);
    return true;
  });
  if (!ok)
    return makeError(ErrorKind::ConfigError, error);
  if (stream.failed())
    return makeError(ErrorKind::ConfigError, "malformed config: " + diagText);

  return std::move(config);
}

llvm::Expected<std::unique_ptr<MutationConfig>>
MutationConfig::findAndLoad(StringRef directory) {
  llvm::SmallString<256> path;

  for (const auto &name : configFileNames) {
    path = directory;
    llvm::sys::path::append(path, name);

    if (llvm::sys::fs::exists(path))
      return loadFromFile(path);
  }

  return llvm::createStringError(std::errc::no_such_file_or_directory,
                                 "no mutagen configuration file found in: %s",
                                 directory.str().c_str());
}

llvm::Expected<std::unique_ptr<MutationConfig>>
MutationConfig::findAndLoadRecursive(StringRef startPath) {
  llvm::SmallString<256> current(startPath);
  llvm::sys::fs::make_absolute(current);

  while (!current.empty()) {
    auto result = findAndLoad(current);
    if (result)
      return result;
    llvm::consumeError(result.takeError());

    auto parent = llvm::sys::path::parent_path(current);
    if (parent == current)
      break;
    current.resize(parent.size());
  }

  return llvm::createStringError(
      std::errc::no_such_file_or_directory,
      "no mutagen configuration file found in directory tree starting from: %s",
      startPath.str().c_str());
}

bool MutationConfig::isEmpty() const {
  return !sawAnySection && sourceConfig.files.empty() && testUnits.empty();
}

std::string MutationConfig::resolvePath(StringRef path) const {
  if (llvm::sys::path::is_absolute(path) || rootDirectory.empty())
    return path.str();

  llvm::SmallString<256> resolved(rootDirectory);
  llvm::sys::path::append(resolved, path);
  return resolved.str().str();
}

llvm::Expected<std::vector<std::string>>
MutationConfig::expandGlob(StringRef pattern) const {
  std::vector<std::string> result;

  bool isGlob = pattern.find_first_of("*?[{") != StringRef::npos;
  if (!isGlob) {
    std::string resolved = resolvePath(pattern);
    if (llvm::sys::fs::exists(resolved))
      result.push_back(resolved);
    return result;
  }

  // Split the pattern into a literal base directory and the glob part.
  StringRef patternPath = pattern;
  llvm::SmallString<256> baseDir(rootDirectory.empty() ? "." : rootDirectory);
  size_t globPos = patternPath.find_first_of("*?[{");
  size_t sepPos = patternPath.substr(0, globPos).rfind('/');
  if (sepPos != StringRef::npos) {
    llvm::sys::path::append(baseDir, patternPath.substr(0, sepPos));
    patternPath = patternPath.substr(sepPos + 1);
  }

  auto globOrErr = llvm::GlobPattern::create(patternPath);
  if (!globOrErr)
    return globOrErr.takeError();

  // "**/x" also matches "x" directly below the base directory.
  std::optional<llvm::GlobPattern> shallow;
  StringRef shallowPattern = patternPath;
  if (shallowPattern.consume_front("**/")) {
    auto shallowOrErr = llvm::GlobPattern::create(shallowPattern);
    if (!shallowOrErr)
      return shallowOrErr.takeError();
    shallow.emplace(std::move(*shallowOrErr));
  }

  std::error_code ec;
  for (llvm::sys::fs::recursive_directory_iterator it(baseDir, ec), end;
       it != end && !ec; it.increment(ec)) {
    if (it->type() == llvm::sys::fs::file_type::directory_file)
      continue;
    StringRef filePath = it->path();
    StringRef relPath = relativeTo(filePath, baseDir);
    if (globOrErr->match(relPath) || (shallow && shallow->match(relPath)))
      result.push_back(filePath.str());
  }
  if (ec && ec != std::errc::no_such_file_or_directory)
    return llvm::createStringError(ec, "failed to walk '%s'",
                                   baseDir.str().str().c_str());

  std::sort(result.begin(), result.end());
  return result;
}

llvm::Expected<std::vector<std::string>>
MutationConfig::resolveSourceFiles() const {
  std::vector<std::string> files;
  for (const auto &pattern : sourceConfig.files) {
    auto expanded = expandGlob(pattern);
    if (!expanded)
      return expanded.takeError();
    files.insert(files.end(), expanded->begin(), expanded->end());
  }

  std::vector<llvm::GlobPattern> excludes;
  for (const auto &pattern : sourceConfig.exclude) {
    auto globOrErr = llvm::GlobPattern::create(pattern);
    if (!globOrErr)
      return globOrErr.takeError();
    excludes.push_back(std::move(*globOrErr));
  }

  llvm::StringSet<> seen;
  std::vector<std::string> result;
  for (auto &file : files) {
    StringRef rel = relativeTo(file, rootDirectory);
    bool excluded = llvm::any_of(
        excludes, [&](const llvm::GlobPattern &g) { return g.match(rel); });
    if (!excluded && seen.insert(file).second)
      result.push_back(std::move(file));
  }
  std::sort(result.begin(), result.end());
  return result;
}

llvm::Error MutationConfig::validate() const {
  static const StringRef presets[] = {"fast", "default", "all"};
  static const StringRef clusterKeys[] = {"none", "operator", "location",
                                          "shape"};

  if (settings.operators.empty() &&
      !llvm::is_contained(presets, StringRef(settings.preset)))
    return makeError(ErrorKind::ConfigError,
                     "unknown operator preset '" + settings.preset + "'");
  if (!llvm::is_contained(clusterKeys, StringRef(settings.clusterKey)))
    return makeError(ErrorKind::ConfigError,
                     "unknown cluster key '" + settings.clusterKey + "'");
  if (settings.testJobs == 0)
    return makeError(ErrorKind::ConfigError, "mutation.test_jobs must be > 0");
  if (settings.schemata && StringRef(settings.selector).trim().empty())
    return makeError(ErrorKind::ConfigError,
                     "mutation.selector must not be empty");

  llvm::StringSet<> unitIds;
  for (const auto &unit : testUnits) {
    if (unit.id.empty())
      return makeError(ErrorKind::ConfigError, "test unit without an id");
    if (!unitIds.insert(unit.id).second)
      return makeError(ErrorKind::ConfigError,
                       "duplicate test unit '" + unit.id + "'");
    if (unit.tests.empty())
      return makeError(ErrorKind::ConfigError,
                       "test unit '" + unit.id + "' lists no tests");
  }
  return llvm::Error::success();
}
