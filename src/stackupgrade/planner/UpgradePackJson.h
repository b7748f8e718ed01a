/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <folly/dynamic.h>

#include "PlanningNotes.h"
#include "UpgradePack.h"
#include "UpgradeTypes.h"

namespace stackupgrade {

/**
 * Conversion of upgrade packs and plans to and from JSON.
 *
 * An upgrade pack is described as:
 * ```
 * {
 *   "name": "upgrade-2.6",
 *   "type": "ROLLING",
 *   "target": "HDP-2.6",
 *   "groups": [<grouping>, ...],
 *   "downgradeGroups": [<grouping>, ...],
 *   "processing": {
 *     "<service>": {"<component>": [<task>, ...]}
 *   }
 * }
 * ```
 * where a grouping is
 * ```
 * {
 *   "name": "ZOOKEEPER", "title": "ZooKeeper", "kind": "RESTART",
 *   "scope": "ANY", "skippable": false, "allowRetry": true,
 *   "supportsAutoSkipOnFailure": true, "performServiceCheck": true,
 *   "condition": {"requiresServices": ["HDFS"], "nameNodeHA": true},
 *   "services": [{"name": "ZOOKEEPER", "components": ["ZOOKEEPER_SERVER"]}]
 * }
 * ```
 * and a task is `{"type": "MANUAL", "summary": "...", "messages": [...]}`.
 */
class UpgradePackJson {
 public:
  /**
   * Parse an upgrade pack.
   *
   * Throws std::invalid_argument if the description is malformed.
   */
  static std::shared_ptr<UpgradePack> parseUpgradePack(
      const folly::dynamic& pack);

  /**
   * Parse one grouping.
   *
   * Throws std::invalid_argument if the description is malformed.
   */
  static Grouping parseGrouping(const folly::dynamic& grouping);

  /**
   * Parse one task.
   *
   * Throws std::invalid_argument if the description is malformed.
   */
  static Task parseTask(const folly::dynamic& task);

  /** Render a plan. */
  static folly::dynamic planToDynamic(
      const std::vector<UpgradeGroupHolder>& groups);

  /** Render planning notes. */
  static folly::dynamic notesToDynamic(const PlanningNotes& notes);

 private:
  static std::optional<GroupCondition> parseCondition(
      const folly::dynamic& condition);
  static folly::dynamic taskToDynamic(const Task& task);
};

} // namespace stackupgrade
