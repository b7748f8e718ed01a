/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <folly/ExceptionString.h>
#include <folly/Format.h>
#include <folly/String.h>
#include <folly/dynamic.h>
#include <folly/init/Init.h>
#include <gflags/gflags.h>
#include <glog/logging.h>

#include "stackupgrade/common/JsonUtils.h"
#include "stackupgrade/planner/InMemoryCluster.h"
#include "stackupgrade/planner/UpgradeContext.h"
#include "stackupgrade/planner/UpgradeHelper.h"
#include "stackupgrade/planner/UpgradePackJson.h"

using namespace stackupgrade;

DEFINE_string(cluster_file, "", "JSON file describing the cluster");
DEFINE_string(
    cluster_overrides_file,
    "",
    "Optional JSON file merged on top of the cluster description");
DEFINE_string(
    pack_files,
    "",
    "Comma-separated list of upgrade pack JSON files for the current stack");
DEFINE_string(direction, "UPGRADE", "UPGRADE or DOWNGRADE");
DEFINE_string(
    upgrade_type, "ROLLING", "ROLLING, NON_ROLLING or HOST_ORDERED");
DEFINE_string(
    target_version,
    "",
    "Repository version being upgraded to (or downgraded to)");
DEFINE_string(
    from_version,
    "",
    "Repository version being downgraded from (required for downgrades)");
DEFINE_string(preferred_pack, "", "Name of the upgrade pack to prefer");
DEFINE_string(scope, "COMPLETE", "Orchestration scope: COMPLETE or PARTIAL");
DEFINE_string(user, "admin", "User name recorded with new configurations");
DEFINE_bool(
    reconcile_configs,
    false,
    "Update desired repositories and reconcile configurations after planning");
DEFINE_string(
    downgrade_policy,
    "REVERT_ALL_SERVICES",
    "REVERT_ALL_SERVICES or REVERT_FIRST_SERVICE_ONLY");
DEFINE_string(output_file, "", "Write the plan to this file instead of stdout");

namespace {

ConfigMerger::DowngradePolicy
parseDowngradePolicy(const std::string& name) {
  if (name == "REVERT_ALL_SERVICES") {
    return ConfigMerger::DowngradePolicy::REVERT_ALL_SERVICES;
  } else if (name == "REVERT_FIRST_SERVICE_ONLY") {
    return ConfigMerger::DowngradePolicy::REVERT_FIRST_SERVICE_ONLY;
  }
  throw std::invalid_argument(
      folly::sformat("Unknown downgrade policy: {}", name));
}

RepositoryVersion
findRepositoryVersion(
    const InMemoryCluster& cluster, const std::string& version) {
  auto repo = cluster.findRepositoryVersion(
      cluster.getCurrentStackVersion().getStackName(), version);
  if (!repo) {
    throw std::invalid_argument(
        folly::sformat("Repository version {} was not found", version));
  }
  return *repo;
}

folly::dynamic
runPlanner() {
  if (FLAGS_cluster_file.empty() || FLAGS_pack_files.empty() ||
      FLAGS_target_version.empty()) {
    throw std::invalid_argument(
        "--cluster_file, --pack_files and --target_version are required");
  }
  const Direction direction = parseDirection(FLAGS_direction);
  const UpgradeType type = parseUpgradeType(FLAGS_upgrade_type);
  if (direction == Direction::DOWNGRADE && FLAGS_from_version.empty()) {
    throw std::invalid_argument("--from_version is required for downgrades");
  }

  folly::dynamic description =
      JsonUtils::readJsonFile2DynamicObject(FLAGS_cluster_file);
  if (!FLAGS_cluster_overrides_file.empty()) {
    JsonUtils::dynamicObjectMerge(
        description,
        JsonUtils::readJsonFile2DynamicObject(FLAGS_cluster_overrides_file));
  }
  auto cluster = InMemoryCluster::fromDynamic(description);

  std::vector<std::string> packFiles;
  folly::split(',', FLAGS_pack_files, packFiles, true);
  for (const auto& packFile : packFiles) {
    auto pack = UpgradePackJson::parseUpgradePack(
        JsonUtils::readJsonFile2DynamicObject(packFile));
    VLOG(1) << "Loaded upgrade pack " << pack->getName() << " from "
            << packFile;
    cluster->addUpgradePack(cluster->getCurrentStackVersion(), pack);
  }

  ConfigMerger::Options mergeOptions;
  mergeOptions.downgradePolicy = parseDowngradePolicy(FLAGS_downgrade_policy);
  UpgradeHelper helper(cluster, cluster, mergeOptions);

  std::optional<std::string> fromVersion;
  if (!FLAGS_from_version.empty()) {
    fromVersion = FLAGS_from_version;
  }
  auto pack = helper.suggestUpgradePack(
      *cluster,
      fromVersion,
      FLAGS_target_version,
      direction,
      type,
      FLAGS_preferred_pack);

  // A downgrade is associated with the version it leaves
  const RepositoryVersion targetRepo =
      findRepositoryVersion(*cluster, FLAGS_target_version);
  const RepositoryVersion sourceRepo = fromVersion
      ? findRepositoryVersion(*cluster, *fromVersion)
      : RepositoryVersion{cluster->getCurrentStackVersion(), ""};

  UpgradeContext context(
      cluster,
      cluster,
      direction,
      pack->getType(),
      direction == Direction::DOWNGRADE ? sourceRepo : targetRepo);
  context.setScope(parseUpgradeScope(FLAGS_scope));
  context.setUserName(FLAGS_user);

  const folly::dynamic empty = folly::dynamic::array;
  for (const auto& service : description.getDefault("services", empty)) {
    context.addService(
        JsonUtils::getString(service, "name"), sourceRepo, targetRepo);
  }

  PlanningNotes notes;
  const auto groups = helper.createSequence(*pack, context, notes);
  LOG(INFO) << folly::sformat(
      "Planned {} groups using upgrade pack {}",
      groups.size(),
      pack->getName());

  folly::dynamic output = folly::dynamic::object(
      "upgradePack", pack->getName())("direction", toString(direction))(
      "type", toString(pack->getType()))(
      "groups", UpgradePackJson::planToDynamic(groups))(
      "notes", UpgradePackJson::notesToDynamic(notes));

  if (FLAGS_reconcile_configs) {
    helper.updateDesiredRepositoriesAndConfigs(context);
    folly::dynamic configs = folly::dynamic::object;
    for (const auto& serviceName : context.getSupportedServices()) {
      configs[serviceName] = cluster->getLiveConfig(serviceName);
    }
    output["configs"] = std::move(configs);
  }
  return output;
}

} // namespace

int
main(int argc, char* argv[]) {
  folly::init(&argc, &argv, true);
  FLAGS_logtostderr = true;

  folly::dynamic output;
  try {
    output = runPlanner();
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Planning failed: " << folly::exceptionStr(ex);
    return 1;
  }

  try {
    if (FLAGS_output_file.empty()) {
      std::cout << JsonUtils::toSortedPrettyJson(output) << std::endl;
    } else {
      JsonUtils::writeDynamicObject2JsonFile(output, FLAGS_output_file);
      LOG(INFO) << "Wrote plan to " << FLAGS_output_file;
    }
  } catch (const std::invalid_argument& ex) {
    LOG(ERROR) << "Unable to write plan: " << folly::exceptionStr(ex);
    return 1;
  }
  return 0;
}
