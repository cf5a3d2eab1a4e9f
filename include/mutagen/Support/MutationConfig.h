//===- MutationConfig.h - Mutation run configuration ------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file declares the MutationConfig class for loading the configuration of
// a mutation run from YAML files (mutagen.yaml).
//
// Example configuration:
//
// ```yaml
// project:
//   name: "demo"
//
// sources:
//   files:
//     - "src/**/*.clj"
//   exclude:
//     - "src/demo/generated/*.clj"
//
// tests:
//   units:
//     - id: "demo.core-test"
//       file: "test/demo/core_test.clj"
//       tests: ["demo.core-test/test-add"]
//       depends: ["src/demo/core.clj"]
//
// mutation:
//   preset: "default"
//   cluster_key: "none"
//   schemata: true
//   timeout_ms: 2000
//
// state:
//   dir: ".mutagen"
// ```
//
//===----------------------------------------------------------------------===//

#ifndef MUTAGEN_SUPPORT_MUTATIONCONFIG_H
#define MUTAGEN_SUPPORT_MUTATIONCONFIG_H

#include "mutagen/Support/LLVM.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace mutagen {

//===----------------------------------------------------------------------===//
// Sections
//===----------------------------------------------------------------------===//

/// Basic project information.
struct ProjectInfo {
  std::string name;
};

/// Which files are mutated.
struct SourceConfig {
  /// File patterns (supports glob patterns), relative to the root directory.
  std::vector<std::string> files;

  /// Patterns removed from the expanded file set.
  std::vector<std::string> exclude;
};

/// A logical test unit whose coverage is persisted as one record.
struct TestUnitConfig {
  /// Unit identifier (typically a test namespace).
  std::string id;

  /// File defining the tests of this unit.
  std::string file;

  /// Test identifiers in this unit.
  std::vector<std::string> tests;

  /// Source files this unit depends on. Their content keys the coverage.
  std::vector<std::string> depends;
};

/// Knobs of the mutation pipeline.
struct MutationSettings {
  /// Operator preset: fast, default or all.
  std::string preset = "default";

  /// Explicit operator allow-list. Overrides the preset when non-empty.
  std::vector<std::string> operators;

  /// Operators removed after preset/allow-list selection.
  std::vector<std::string> disableOperators;

  /// Cluster key: none, operator, location or shape.
  std::string clusterKey = "none";

  /// Number of trailing coordinate segments dropped by the location key.
  unsigned coordinatePrefix = 1;

  /// Whether to embed mutants of one file into a single schemata edit.
  bool schemata = true;

  /// Expression read by the schemata choice to find the active mutant.
  std::string selector = "(mutagen.runtime/active-mutant)";

  /// Bound for a single test invocation; 0 disables the bound.
  uint64_t timeoutMs = 2000;

  /// Covering tests of one site that may run concurrently.
  unsigned testJobs = 1;

  /// Head symbols of top-level forms that are never scanned.
  std::vector<std::string> skipForms = {"comment"};
};

/// Where and whether state is persisted between runs.
struct StateConfig {
  std::string dir = ".mutagen";
  bool incremental = true;
};

//===----------------------------------------------------------------------===//
// MutationConfig Class
//===----------------------------------------------------------------------===//

/// Names searched for by findAndLoad, in priority order.
ArrayRef<StringRef> getMutationConfigFileNames();

/// Returns true if the file name is a recognized configuration file name.
bool isMutationConfigFile(StringRef filename);

class MutationConfig {
public:
  MutationConfig();
  ~MutationConfig();

  //===--------------------------------------------------------------------===//
  // Loading Methods
  //===--------------------------------------------------------------------===//

  /// Load configuration from a YAML file. The root directory becomes the
  /// directory containing the file.
  static llvm::Expected<std::unique_ptr<MutationConfig>>
  loadFromFile(StringRef filePath);

  /// Load configuration from a YAML string.
  static llvm::Expected<std::unique_ptr<MutationConfig>>
  loadFromYAML(StringRef yamlContent);

  /// Find and load configuration from a directory.
  static llvm::Expected<std::unique_ptr<MutationConfig>>
  findAndLoad(StringRef directory);

  /// Search the directory and its parents for a configuration file.
  static llvm::Expected<std::unique_ptr<MutationConfig>>
  findAndLoadRecursive(StringRef startPath);

  /// A configuration with every default applied.
  static std::unique_ptr<MutationConfig> createDefault();

  //===--------------------------------------------------------------------===//
  // Accessors
  //===--------------------------------------------------------------------===//

  const ProjectInfo &getProjectInfo() const { return projectInfo; }
  ProjectInfo &getProjectInfo() { return projectInfo; }

  const SourceConfig &getSourceConfig() const { return sourceConfig; }
  SourceConfig &getSourceConfig() { return sourceConfig; }

  const std::vector<TestUnitConfig> &getTestUnits() const { return testUnits; }
  std::vector<TestUnitConfig> &getTestUnits() { return testUnits; }

  const MutationSettings &getMutationSettings() const { return settings; }
  MutationSettings &getMutationSettings() { return settings; }

  const StateConfig &getStateConfig() const { return stateConfig; }
  StateConfig &getStateConfig() { return stateConfig; }

  StringRef getRootDirectory() const { return rootDirectory; }
  void setRootDirectory(StringRef dir) { rootDirectory = dir.str(); }

  /// True when no section carried any value.
  bool isEmpty() const;

  //===--------------------------------------------------------------------===//
  // Resolution Methods
  //===--------------------------------------------------------------------===//

  /// Resolve a path relative to the root directory.
  std::string resolvePath(StringRef path) const;

  /// Expand one glob pattern relative to the root directory. Results are
  /// sorted so that runs are reproducible.
  llvm::Expected<std::vector<std::string>> expandGlob(StringRef pattern) const;

  /// Expand `sources.files` minus `sources.exclude`, sorted and unique.
  llvm::Expected<std::vector<std::string>> resolveSourceFiles() const;

  /// Check values that cannot be rejected while parsing.
  llvm::Error validate() const;

private:
  ProjectInfo projectInfo;
  SourceConfig sourceConfig;
  std::vector<TestUnitConfig> testUnits;
  MutationSettings settings;
  StateConfig stateConfig;
  std::string rootDirectory;
  bool sawAnySection = false;
};

} // namespace mutagen

#endif // MUTAGEN_SUPPORT_MUTATIONCONFIG_H
