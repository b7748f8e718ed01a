/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "UpgradeHelper.h"

#include <folly/Format.h>
#include <glog/logging.h>

#include "UpgradeErrors.h"
#include "stackupgrade/common/Consts.h"

namespace stackupgrade {

UpgradeHelper::UpgradeHelper(
    std::shared_ptr<ConfigStore> configStore,
    std::shared_ptr<MetadataCatalog> catalog,
    ConfigMerger::Options mergeOptions)
    : configStore_(std::move(configStore)),
      catalog_(std::move(catalog)),
      sequenceBuilder_(*configStore_, *catalog_),
      configMerger_(*configStore_, mergeOptions) {}

std::shared_ptr<const UpgradePack>
UpgradeHelper::suggestUpgradePack(
    const ClusterStore& cluster,
    const std::optional<std::string>& upgradeFromVersion,
    const std::string& upgradeToVersion,
    Direction direction,
    UpgradeType type,
    const std::string& preferredUpgradePackName) const {
  // Packs are defined by the stack being upgraded from
  const StackId stack = cluster.getCurrentStackVersion();

  std::string repoVersion = upgradeToVersion;
  if (direction == Direction::DOWNGRADE && upgradeFromVersion) {
    repoVersion = *upgradeFromVersion;
  }

  auto versionEntity =
      catalog_->findRepositoryVersion(stack.getStackName(), repoVersion);
  if (!versionEntity) {
    throw UpgradePlanningError(
        folly::sformat("Repository version {} was not found", repoVersion));
  }

  auto packs = catalog_->getUpgradePacks(stack);
  if (!preferredUpgradePackName.empty()) {
    auto iter = packs.find(preferredUpgradePackName);
    if (iter != packs.end()) {
      return iter->second;
    }
  }

  const std::string repoStackId = versionEntity->stackId.getStackId();
  std::shared_ptr<const UpgradePack> pack;
  for (const auto& entry : packs) {
    const auto& candidate = entry.second;
    if (!candidate || !candidate->getTargetStack() ||
        *candidate->getTargetStack() != repoStackId ||
        candidate->getType() != type) {
      continue;
    }
    if (pack) {
      throw UpgradePlanningError(folly::sformat(
          "Unable to perform {}. Found multiple upgrade packs for type {} and "
          "target version {}",
          DirectionText::text(direction, false),
          toString(type),
          repoVersion));
    }
    pack = candidate;
  }

  if (!pack) {
    throw UpgradePlanningError(folly::sformat(
        "Unable to perform {}. Could not locate {} upgrade pack for version {}",
        DirectionText::text(direction, false),
        toString(type),
        repoVersion));
  }

  LOG(INFO) << folly::sformat(
      "Using upgrade pack {} for the {} {} {}",
      pack->getName(),
      DirectionText::text(direction, false),
      DirectionText::preposition(direction),
      repoVersion);
  return pack;
}

std::vector<UpgradeGroupHolder>
UpgradeHelper::createSequence(
    const UpgradePack& pack,
    const UpgradeContext& context,
    PlanningNotes& notes) const {
  return sequenceBuilder_.createSequence(pack, context, notes);
}

void
UpgradeHelper::updateDesiredRepositoriesAndConfigs(
    const UpgradeContext& context) {
  ConfigTransaction transaction(*configStore_);
  setDesiredRepositories(context);
  configMerger_.reconcileConfigurationsInTransaction(context);
  transaction.commit();
}

void
UpgradeHelper::reconcileConfigurations(const UpgradeContext& context) {
  configMerger_.reconcileConfigurations(context);
}

void
UpgradeHelper::setDesiredRepositories(const UpgradeContext& context) {
  ClusterStore& cluster = context.getCluster();

  try {
    for (const auto& serviceName : context.getSupportedServices()) {
      const RepositoryVersion& targetRepositoryVersion =
          context.getTargetRepositoryVersion(serviceName);
      const StackId& targetStack = targetRepositoryVersion.stackId;

      cluster.setServiceDesiredRepository(serviceName, targetRepositoryVersion);

      for (const auto& componentName : cluster.getComponents(serviceName)) {
        bool versionAdvertised = false;
        try {
          versionAdvertised = catalog_->isVersionAdvertised(
              targetStack, serviceName, componentName);
        } catch (const std::exception& ex) {
          LOG(WARNING) << folly::sformat(
              "Component {}/{} doesn't exist for stack {}. Setting version to "
              "{} ({})",
              serviceName,
              componentName,
              targetStack.getStackId(),
              UpgradeConsts::kUnknownVersion,
              ex.what());
        }

        const UpgradeState upgradeStateToSet = versionAdvertised
            ? UpgradeState::IN_PROGRESS
            : UpgradeState::NONE;

        for (const auto& hostComponent :
             cluster.getHostComponents(serviceName, componentName)) {
          if (hostComponent.upgradeState != upgradeStateToSet) {
            cluster.setUpgradeState(
                serviceName,
                componentName,
                hostComponent.host,
                upgradeStateToSet);
          }
          // Components that don't advertise a version can't report one
          if (!versionAdvertised &&
              hostComponent.version != UpgradeConsts::kUnknownVersion) {
            cluster.setVersion(
                serviceName,
                componentName,
                hostComponent.host,
                UpgradeConsts::kUnknownVersion);
          }
        }

        cluster.setComponentDesiredRepository(
            serviceName, componentName, targetRepositoryVersion);
      }
    }
  } catch (const UpgradePlanningError&) {
    throw;
  } catch (const std::exception& ex) {
    throw UpgradePlanningError(folly::sformat(
        "Unable to set desired repositories: {}", ex.what()));
  }
}

} // namespace stackupgrade
