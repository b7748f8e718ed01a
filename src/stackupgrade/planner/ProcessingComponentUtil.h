/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <string>

#include "UpgradePack.h"
#include "UpgradeTypes.h"

namespace stackupgrade {

/**
 * Utilities for deriving the tasks of a service component.
 * @see SequenceBuilder
 */
class ProcessingComponentUtil {
 public:
  /**
   * Returns the tasks to run for a service component within a grouping.
   *
   * - Without a function, the pack's explicit tasks are used, if any.
   * - A STOP function always yields a single synthesized STOP task; stopping
   *   is uniform across components.
   * - START and RESTART functions prefer the pack's explicit tasks and fall
   *   back to a single synthesized START or RESTART task.
   *
   * Returns std::nullopt if no tasks can be derived.
   *
   * @param pack the upgrade pack
   * @param serviceName the service name
   * @param componentName the component name
   * @param function the grouping's implied function, if any
   */
  static std::optional<ProcessingComponent> resolve(
      const UpgradePack& pack,
      const std::string& serviceName,
      const std::string& componentName,
      const std::optional<TaskType>& function);

  /** Create a component with a single task of the given type. */
  static ProcessingComponent synthesize(
      const std::string& componentName, TaskType type);
};

} // namespace stackupgrade
