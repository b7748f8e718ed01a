/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>

namespace stackupgrade {

/**
 * Constants used within the stack upgrade planner.
 */
class UpgradeConsts {
 public:
  // --- Services & components ---

  /** Service whose NameNode gets HA-aware orchestration. */
  const static std::string kHdfsService;
  /** Component of kHdfsService that gets HA-aware orchestration. */
  const static std::string kNameNodeComponent;

  // --- Task parameters ---

  /** Parameter telling a NameNode which role to assume after the upgrade. */
  const static std::string kDesiredNameNodeRoleParam;
  /** Value of kDesiredNameNodeRoleParam for the active NameNode. */
  const static std::string kNameNodeRoleActive;
  /** Value of kDesiredNameNodeRoleParam for the standby NameNode. */
  const static std::string kNameNodeRoleStandby;

  // --- Versions ---

  /** Version reported for host components that don't advertise one. */
  const static std::string kUnknownVersion;

  // --- Configuration ---

  /** Change comment attached to configurations created by an upgrade. */
  const static std::string kUpgradeConfigComment;
  /** Separator between a stack name and its version (e.g. "HDP-2.5"). */
  const static char kStackIdSeparator;
};

} // namespace stackupgrade
