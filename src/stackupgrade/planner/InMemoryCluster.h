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
#include <vector>

#include <folly/dynamic.h>

#include "ClusterStore.h"
#include "ConfigStore.h"
#include "HostResolver.h"
#include "MetadataCatalog.h"
#include "UpgradePack.h"

namespace stackupgrade {

/**
 * A cluster, its configurations and its stack metadata held in memory.
 *
 * Implements every collaborator the planner needs, so that plans can be
 * computed offline from a JSON description of a cluster (see fromDynamic()).
 *
 * Configuration history is kept per service: every createConfigTypes() call
 * adds a revision and makes it live, and applyLatestConfigurations() makes the
 * latest revision of a stack live again. Transactions snapshot all cluster
 * state and restore it on rollback.
 */
class InMemoryCluster : public ClusterStore,
                        public ConfigStore,
                        public HostResolver,
                        public MetadataCatalog {
 public:
  /** One configuration revision of a service. */
  struct ConfigRevision {
    /** The stack the revision was created for. */
    StackId stackId;
    /** The configurations, by type. */
    folly::dynamic configs;
    /** The user who created the revision. */
    std::string userName;
    /** The change comment. */
    std::string comment;
  };

  /**
   * Constructor.
   * @param clusterName the cluster name
   * @param currentStack the stack the cluster runs
   * @param desiredStack the stack the cluster is moving to
   */
  InMemoryCluster(
      const std::string& clusterName,
      const StackId& currentStack,
      const StackId& desiredStack);

  /**
   * Build a cluster from a JSON description.
   *
   * Throws std::invalid_argument if the description is malformed.
   */
  static std::shared_ptr<InMemoryCluster> fromDynamic(
      const folly::dynamic& description);

  // ---- Setup ----

  /** Add (or replace) a deployed service. */
  void addService(const std::string& serviceName, bool clientOnly);

  /**
   * Deploy a component on hosts. Every host starts in upgrade state NONE
   * reporting "version".
   *
   * Throws std::invalid_argument if the service was not added.
   */
  void addComponent(
      const std::string& serviceName,
      const std::string& componentName,
      const HostsType& hostsType,
      const std::string& version = "");

  /**
   * Set the live configuration of a service and record it as a revision of
   * the current stack.
   *
   * Throws std::invalid_argument if the service was not added.
   */
  void setLiveConfig(
      const std::string& serviceName, const folly::dynamic& configsByType);

  /** Set whether NameNode HA is enabled. */
  void setNameNodeHA(bool enabled) {
    nameNodeHA_ = enabled;
  }

  /** Describe a service of a stack. */
  void addStackService(
      const StackId& stackId,
      const std::string& serviceName,
      const std::string& displayName,
      const folly::dynamic& defaults);

  /**
   * Describe a component of a stack service.
   *
   * Throws std::invalid_argument if the stack service was not added.
   */
  void addStackComponent(
      const StackId& stackId,
      const std::string& serviceName,
      const std::string& componentName,
      const std::string& displayName,
      bool versionAdvertised);

  /** Register a repository version. */
  void addRepositoryVersion(const RepositoryVersion& version);

  /** Register an upgrade pack for a source stack. */
  void addUpgradePack(
      const StackId& sourceStack, std::shared_ptr<const UpgradePack> pack);

  // ---- Inspection ----

  /** Returns the configuration revisions of a service, oldest first. */
  std::vector<ConfigRevision> getRevisions(
      const std::string& serviceName) const;

  /** Returns the state of a component on a host. */
  std::optional<HostComponentState> getHostComponent(
      const std::string& serviceName,
      const std::string& componentName,
      const std::string& host) const;

  /** Returns the desired repository of a service. */
  std::optional<RepositoryVersion> getServiceDesiredRepository(
      const std::string& serviceName) const;

  /** Returns the desired repository of a component. */
  std::optional<RepositoryVersion> getComponentDesiredRepository(
      const std::string& serviceName, const std::string& componentName) const;

  /** Returns whether a transaction is open. */
  bool inTransaction() const {
    return snapshot_.has_value();
  }

  // ---- ClusterStore ----

  std::string getClusterName() const override;
  StackId getCurrentStackVersion() const override;
  StackId getDesiredStackVersion() const override;
  bool isClientOnlyService(const std::string& serviceName) const override;
  std::vector<std::string> getComponents(
      const std::string& serviceName) const override;
  std::vector<HostComponentState> getHostComponents(
      const std::string& serviceName,
      const std::string& componentName) const override;
  void setUpgradeState(
      const std::string& serviceName,
      const std::string& componentName,
      const std::string& host,
      UpgradeState state) override;
  void setVersion(
      const std::string& serviceName,
      const std::string& componentName,
      const std::string& host,
      const std::string& version) override;
  void setServiceDesiredRepository(
      const std::string& serviceName,
      const RepositoryVersion& version) override;
  void setComponentDesiredRepository(
      const std::string& serviceName,
      const std::string& componentName,
      const RepositoryVersion& version) override;

  // ---- ConfigStore ----

  folly::dynamic getDefaultProperties(
      const StackId& stackId, const std::string& serviceName) const override;
  folly::dynamic getLiveConfig(const std::string& serviceName) const override;
  void applyLatestConfigurations(
      const StackId& stackId, const std::string& serviceName) override;
  void createConfigTypes(
      const std::string& clusterName,
      const StackId& stackId,
      const folly::dynamic& configsByType,
      const std::string& userName,
      const std::string& comment) override;
  std::optional<std::string> getPlaceholderValue(
      const std::string& clusterName, const std::string& token) const override;
  void beginTransaction() override;
  void commitTransaction() override;
  void rollbackTransaction() override;

  // ---- HostResolver ----

  std::optional<HostsType> resolve(
      const std::string& serviceName,
      const std::string& componentName) const override;
  bool isNameNodeHA() const override;

  // ---- MetadataCatalog ----

  std::string getDisplayName(
      const StackId& stackId, const std::string& serviceName) const override;
  std::string getComponentDisplayName(
      const StackId& stackId,
      const std::string& serviceName,
      const std::string& componentName) const override;
  bool isVersionAdvertised(
      const StackId& stackId,
      const std::string& serviceName,
      const std::string& componentName) const override;
  std::optional<RepositoryVersion> findRepositoryVersion(
      const std::string& stackName, const std::string& version) const override;
  std::map<std::string, std::shared_ptr<const UpgradePack>> getUpgradePacks(
      const StackId& stackId) const override;

 private:
  /** A deployed component. */
  struct Component {
    HostsType hostsType;
    std::map<std::string, HostComponentState> hostStates;
    std::optional<RepositoryVersion> desiredRepository;
  };

  /** A deployed service. */
  struct Service {
    bool clientOnly{false};
    std::vector<std::string> componentOrder;
    std::map<std::string, Component> components;
    folly::dynamic liveConfigs = folly::dynamic::object;
    std::optional<RepositoryVersion> desiredRepository;
    std::vector<ConfigRevision> revisions;
  };

  /** A component as described by a stack. */
  struct StackComponent {
    std::string displayName;
    bool versionAdvertised{false};
  };

  /** A service as described by a stack. */
  struct StackService {
    std::string displayName;
    std::map<std::string, StackComponent> components;
    folly::dynamic defaults = folly::dynamic::object;
  };

  /** Throws std::runtime_error if the service isn't deployed. */
  const Service& getService(const std::string& serviceName) const;
  Service& getService(const std::string& serviceName);

  /** Throws std::runtime_error if the component isn't deployed. */
  Component& getComponent(
      const std::string& serviceName, const std::string& componentName);

  /** Throws std::runtime_error if the stack doesn't describe the service. */
  const StackService& getStackService(
      const StackId& stackId, const std::string& serviceName) const;

  /** Returns the service owning a configuration type, if any. */
  std::optional<std::string> findServiceForConfigType(
      const StackId& stackId, const std::string& configType) const;

  std::string clusterName_;
  StackId currentStack_;
  StackId desiredStack_;
  bool nameNodeHA_{false};
  std::map<std::string, Service> services_;
  std::map<std::string, std::map<std::string, StackService>> stacks_;
  std::vector<RepositoryVersion> repositoryVersions_;
  std::map<
      std::string,
      std::map<std::string, std::shared_ptr<const UpgradePack>>>
      packs_;

  /** Deployed services at the start of the open transaction. */
  std::optional<std::map<std::string, Service>> snapshot_;
};

} // namespace stackupgrade
