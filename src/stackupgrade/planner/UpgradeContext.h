/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "ClusterStore.h"
#include "HostResolver.h"
#include "UpgradeTypes.h"

namespace stackupgrade {

/**
 * Run-time parameters of one upgrade or downgrade.
 *
 * The context is owned by the caller and is not modified by planning;
 * anything discovered while planning is collected in PlanningNotes instead.
 */
class UpgradeContext {
 public:
  /**
   * Constructor.
   * @param cluster the cluster being upgraded
   * @param resolver the host resolver for the cluster
   * @param direction upgrade or downgrade
   * @param type the upgrade type
   * @param repositoryVersion the repository version associated with the
   *                          orchestration (the target of an upgrade, the
   *                          source of a downgrade)
   */
  UpgradeContext(
      std::shared_ptr<ClusterStore> cluster,
      std::shared_ptr<HostResolver> resolver,
      Direction direction,
      UpgradeType type,
      const RepositoryVersion& repositoryVersion);

  // ---- Accessors ----

  /** Returns the cluster. */
  ClusterStore& getCluster() const {
    return *cluster_;
  }

  /** Returns the host resolver. */
  const HostResolver& getResolver() const {
    return *resolver_;
  }

  /** Returns the direction. */
  Direction getDirection() const {
    return direction_;
  }

  /** Returns whether this is a downgrade. */
  bool isDowngrade() const {
    return direction_ == Direction::DOWNGRADE;
  }

  /** Returns the upgrade type. */
  UpgradeType getType() const {
    return type_;
  }

  /** Returns the repository version associated with the orchestration. */
  const RepositoryVersion& getRepositoryVersion() const {
    return repositoryVersion_;
  }

  /** Returns the participating services, in the order they were added. */
  const std::vector<std::string>& getSupportedServices() const {
    return supportedServices_;
  }

  /** Returns whether a service participates in the orchestration. */
  bool isServiceSupported(const std::string& serviceName) const;

  /**
   * Returns the repository version a service is moving from.
   *
   * Throws std::invalid_argument if the service doesn't participate.
   */
  const RepositoryVersion& getSourceRepositoryVersion(
      const std::string& serviceName) const;

  /**
   * Returns the repository version a service is moving to.
   *
   * Throws std::invalid_argument if the service doesn't participate.
   */
  const RepositoryVersion& getTargetRepositoryVersion(
      const std::string& serviceName) const;

  /** Returns the orchestration scope. */
  UpgradeScope getScope() const {
    return scope_;
  }

  /**
   * Returns whether a grouping with the given scope belongs to this
   * orchestration. ANY is always in scope.
   */
  bool isScoped(UpgradeScope scope) const;

  /** Returns the name of the user acting on the cluster. */
  const std::string& getUserName() const {
    return userName_;
  }

  // ---- Mutators ----

  /**
   * Add a participating service with its source and target repositories.
   * Adding a service twice replaces its repositories.
   */
  void addService(
      const std::string& serviceName,
      const RepositoryVersion& source,
      const RepositoryVersion& target);

  /** Set the orchestration scope (COMPLETE by default). */
  void setScope(UpgradeScope scope) {
    scope_ = scope;
  }

  /** Set the name of the user acting on the cluster. */
  void setUserName(const std::string& userName) {
    userName_ = userName;
  }

 private:
  std::shared_ptr<ClusterStore> cluster_;
  std::shared_ptr<HostResolver> resolver_;
  Direction direction_;
  UpgradeType type_;
  RepositoryVersion repositoryVersion_;
  UpgradeScope scope_{UpgradeScope::COMPLETE};
  std::string userName_;

  /** Participating services, in insertion order. */
  std::vector<std::string> supportedServices_;
  /** Source and target repositories of each participating service. */
  std::unordered_map<
      std::string,
      std::pair<RepositoryVersion, RepositoryVersion>>
      serviceRepositories_;
};

} // namespace stackupgrade
