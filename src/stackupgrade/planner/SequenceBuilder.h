/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ConfigStore.h"
#include "MetadataCatalog.h"
#include "PlanningNotes.h"
#include "StageWrapperBuilder.h"
#include "UpgradeContext.h"
#include "UpgradePack.h"
#include "UpgradeTypes.h"

namespace stackupgrade {

/**
 * Turns an upgrade pack and an upgrade context into an ordered plan of
 * groups, stages and host-bound tasks.
 *
 * Work flow, per grouping of the pack (in declared order):
 * - Groupings out of scope, or whose condition doesn't hold, are skipped.
 * - Services are visited in declared order (reversed for rolling
 *   downgrades), components in declared order.
 * - Each component's hosts are resolved and its tasks are found in the pack
 *   or synthesized from the grouping's function.
 * - The HDFS NameNode is special-cased to honor HA roles.
 * - The grouping's StageWrapperBuilder turns everything into stages; groupings
 *   without stages are dropped.
 * - Text in the resulting plan has its placeholders resolved.
 *
 * Skipped groupings and components never fail planning; they are logged and
 * recorded in PlanningNotes.
 */
class SequenceBuilder {
 public:
  /**
   * Constructor.
   * @param configStore the store used to resolve configuration placeholders
   * @param catalog the stack metadata catalog
   */
  SequenceBuilder(
      const ConfigStore& configStore, const MetadataCatalog& catalog)
      : configStore_(configStore), catalog_(catalog) {}

  /**
   * Create the ordered plan.
   *
   * Throws UpgradePlanningError if cluster metadata can't be resolved.
   *
   * @param pack the upgrade pack
   * @param context the upgrade context
   * @param notes populated with unhealthy hosts, display names and skips
   */
  std::vector<UpgradeGroupHolder> createSequence(
      const UpgradePack& pack,
      const UpgradeContext& context,
      PlanningNotes& notes) const;

  /** Create the ordered plan, discarding the planning notes. */
  std::vector<UpgradeGroupHolder> createSequence(
      const UpgradePack& pack, const UpgradeContext& context) const;

 private:
  /**
   * Hand a resolved component to the grouping's builder, applying the
   * NameNode special case. Returns the reason if the component was skipped.
   */
  std::optional<SkipReason> submitComponent(
      const UpgradeContext& context,
      StageWrapperBuilder& builder,
      const HostsType& hostsType,
      const std::string& serviceName,
      bool isClientOnly,
      const ProcessingComponent& pc) const;

  /** Look up and record display names (best effort). */
  void setDisplayNames(
      const UpgradeContext& context,
      PlanningNotes& notes,
      const std::string& serviceName,
      const std::string& componentName) const;

  /** Returns whether a service only has client components. */
  bool isClientOnlyService(
      const UpgradeContext& context, const std::string& serviceName) const;

  /** Resolve placeholders in all text of a planned group. */
  void postProcess(
      const UpgradeContext& context, UpgradeGroupHolder& holder) const;

  /** Log the whole plan at verbose level. */
  static void logPlan(const std::vector<UpgradeGroupHolder>& groups);

  const ConfigStore& configStore_;
  const MetadataCatalog& catalog_;
};

} // namespace stackupgrade
