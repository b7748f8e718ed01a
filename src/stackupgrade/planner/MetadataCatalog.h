/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "UpgradeTypes.h"

namespace stackupgrade {

class UpgradePack;

/**
 * Read-only stack metadata: service/component descriptions, repository
 * versions and upgrade packs.
 *
 * Lookups of unknown services or components throw std::runtime_error (or a
 * subclass).
 */
class MetadataCatalog {
 public:
  virtual ~MetadataCatalog() {}

  /** Returns the display name of a service. */
  virtual std::string getDisplayName(
      const StackId& stackId, const std::string& serviceName) const = 0;

  /** Returns the display name of a component. */
  virtual std::string getComponentDisplayName(
      const StackId& stackId,
      const std::string& serviceName,
      const std::string& componentName) const = 0;

  /** Returns whether a component reports its own version. */
  virtual bool isVersionAdvertised(
      const StackId& stackId,
      const std::string& serviceName,
      const std::string& componentName) const = 0;

  /** Find a repository version by stack name and version string. */
  virtual std::optional<RepositoryVersion> findRepositoryVersion(
      const std::string& stackName, const std::string& version) const = 0;

  /** Returns the upgrade packs defined for a source stack, by name. */
  virtual std::map<std::string, std::shared_ptr<const UpgradePack>>
  getUpgradePacks(const StackId& stackId) const = 0;
};

} // namespace stackupgrade
