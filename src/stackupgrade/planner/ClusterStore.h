/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <vector>

#include "UpgradeTypes.h"

namespace stackupgrade {

/**
 * Cluster state persistence: services, components and host components.
 *
 * Implementations throw std::runtime_error (or a subclass) for unknown
 * services or components.
 */
class ClusterStore {
 public:
  /** State of one component on one host. */
  struct HostComponentState {
    /** The host name. */
    std::string host;
    /** The upgrade state. */
    UpgradeState upgradeState{UpgradeState::NONE};
    /** The version reported by the host component. */
    std::string version;
  };

  virtual ~ClusterStore() {}

  /** Returns the cluster name. */
  virtual std::string getClusterName() const = 0;

  /** Returns the stack the cluster currently runs. */
  virtual StackId getCurrentStackVersion() const = 0;

  /** Returns the stack the cluster is moving to. */
  virtual StackId getDesiredStackVersion() const = 0;

  /** Returns whether a service consists only of client components. */
  virtual bool isClientOnlyService(const std::string& serviceName) const = 0;

  /** Returns the component names of a service. */
  virtual std::vector<std::string> getComponents(
      const std::string& serviceName) const = 0;

  /** Returns the per-host states of a component. */
  virtual std::vector<HostComponentState> getHostComponents(
      const std::string& serviceName,
      const std::string& componentName) const = 0;

  /** Set the upgrade state of a component on a host. */
  virtual void setUpgradeState(
      const std::string& serviceName,
      const std::string& componentName,
      const std::string& host,
      UpgradeState state) = 0;

  /** Set the reported version of a component on a host. */
  virtual void setVersion(
      const std::string& serviceName,
      const std::string& componentName,
      const std::string& host,
      const std::string& version) = 0;

  /** Set the desired repository version of a service. */
  virtual void setServiceDesiredRepository(
      const std::string& serviceName, const RepositoryVersion& version) = 0;

  /** Set the desired repository version of a component. */
  virtual void setComponentDesiredRepository(
      const std::string& serviceName,
      const std::string& componentName,
      const RepositoryVersion& version) = 0;
};

} // namespace stackupgrade
