/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <string>

#include "UpgradeTypes.h"

namespace stackupgrade {

/**
 * Resolves the hosts a service component is deployed on, including
 * master/secondary detection for HA components.
 */
class HostResolver {
 public:
  virtual ~HostResolver() {}

  /**
   * Resolve the hosts for a service component.
   *
   * Returns std::nullopt if the component is not deployed.
   */
  virtual std::optional<HostsType> resolve(
      const std::string& serviceName,
      const std::string& componentName) const = 0;

  /** Returns whether NameNode high availability is enabled. */
  virtual bool isNameNodeHA() const = 0;
};

} // namespace stackupgrade
