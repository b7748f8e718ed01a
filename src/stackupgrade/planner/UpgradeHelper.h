/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ConfigMerger.h"
#include "ConfigStore.h"
#include "MetadataCatalog.h"
#include "PlanningNotes.h"
#include "SequenceBuilder.h"
#include "UpgradeContext.h"
#include "UpgradePack.h"

namespace stackupgrade {

/**
 * Entry point for upgrading a cluster: picks the upgrade pack, plans the
 * orchestration and moves desired repositories and configurations to the
 * target stack.
 */
class UpgradeHelper {
 public:
  /**
   * Constructor.
   * @param configStore the configuration store; its transactions cover all
   *                    writes made through this helper
   * @param catalog the stack metadata catalog
   * @param mergeOptions configuration reconciliation options
   */
  UpgradeHelper(
      std::shared_ptr<ConfigStore> configStore,
      std::shared_ptr<MetadataCatalog> catalog,
      ConfigMerger::Options mergeOptions = ConfigMerger::Options());

  /**
   * Find the upgrade pack for an orchestration.
   *
   * Packs are looked up for the cluster's current stack. The preferred pack is
   * used if it exists; otherwise the single pack whose target stack matches
   * the repository version's stack and whose type matches is used.
   *
   * Throws UpgradePlanningError if the repository version is unknown, or if
   * no pack or more than one pack matches.
   *
   * @param cluster the cluster
   * @param upgradeFromVersion the version being downgraded from, if any
   * @param upgradeToVersion the version being upgraded to
   * @param direction upgrade or downgrade
   * @param type the upgrade type
   * @param preferredUpgradePackName the pack to prefer (may be empty)
   */
  std::shared_ptr<const UpgradePack> suggestUpgradePack(
      const ClusterStore& cluster,
      const std::optional<std::string>& upgradeFromVersion,
      const std::string& upgradeToVersion,
      Direction direction,
      UpgradeType type,
      const std::string& preferredUpgradePackName) const;

  /**
   * Plan the orchestration.
   * @see SequenceBuilder::createSequence()
   */
  std::vector<UpgradeGroupHolder> createSequence(
      const UpgradePack& pack,
      const UpgradeContext& context,
      PlanningNotes& notes) const;

  /**
   * Point every participating service and component at its target
   * repository, and reconcile configurations, in a single transaction.
   *
   * Throws UpgradePlanningError if the cluster can't be updated, or
   * ConfigMergeError if configurations can't be reconciled. Nothing is
   * committed on failure.
   */
  void updateDesiredRepositoriesAndConfigs(const UpgradeContext& context);

  /**
   * Reconcile configurations only.
   * @see ConfigMerger::reconcileConfigurations()
   */
  void reconcileConfigurations(const UpgradeContext& context);

 private:
  /**
   * Set desired repositories and host component upgrade states.
   *
   * Host components of components that advertise a version on the target
   * stack move to IN_PROGRESS; all others move to NONE and report an
   * UNKNOWN version.
   */
  void setDesiredRepositories(const UpgradeContext& context);

  std::shared_ptr<ConfigStore> configStore_;
  std::shared_ptr<MetadataCatalog> catalog_;
  SequenceBuilder sequenceBuilder_;
  ConfigMerger configMerger_;
};

} // namespace stackupgrade
