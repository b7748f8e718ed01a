/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Consts.h"

namespace stackupgrade {

// --- Services & components ---
const std::string UpgradeConsts::kHdfsService{"HDFS"};
const std::string UpgradeConsts::kNameNodeComponent{"NAMENODE"};

// --- Task parameters ---
const std::string UpgradeConsts::kDesiredNameNodeRoleParam{
    "desired_namenode_role"};
const std::string UpgradeConsts::kNameNodeRoleActive{"active"};
const std::string UpgradeConsts::kNameNodeRoleStandby{"standby"};

// --- Versions ---
const std::string UpgradeConsts::kUnknownVersion{"UNKNOWN"};

// --- Configuration ---
const std::string UpgradeConsts::kUpgradeConfigComment{
    "Configuration created for Upgrade"};
const char UpgradeConsts::kStackIdSeparator{'-'};

} // namespace stackupgrade
