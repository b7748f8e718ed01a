/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace stackupgrade {

/** Why part of an upgrade pack did not make it into a plan. */
enum class SkipReason {
  /** The grouping's scope doesn't apply to this orchestration. */
  OUT_OF_SCOPE,
  /** The grouping's condition is not satisfied. */
  CONDITION_NOT_SATISFIED,
  /** The service doesn't participate in this orchestration. */
  SERVICE_NOT_SUPPORTED,
  /** Rolling upgrade, and the pack has no tasks for the service. */
  NO_SERVICE_TASKS,
  /** Rolling upgrade, and the pack has no tasks for the component. */
  NO_COMPONENT_TASKS,
  /** The component is not deployed on any host. */
  NO_HOSTS,
  /** No tasks could be found or synthesized for the component. */
  NO_PROCESSING_COMPONENT,
  /** Rolling NameNode upgrade without resolved active and standby hosts. */
  NAMENODE_HOSTS_UNRESOLVED,
  /** The upgrade type has no NameNode orchestration (host-ordered). */
  NAMENODE_UNSUPPORTED_UPGRADE_TYPE,
  /** The grouping's builder produced no stages. */
  EMPTY_GROUP,
};

/** Returns the name of a skip reason. */
std::string toString(SkipReason reason);

/** One skipped grouping or component. */
struct PlanningSkip {
  /** Why it was skipped. */
  SkipReason reason;
  /** The grouping name. */
  std::string group;
  /** The service name (empty for grouping-level skips). */
  std::string service;
  /** The component name (empty for grouping/service-level skips). */
  std::string component;
};

/**
 * Information collected while planning: unhealthy hosts, display names and
 * the skips that shaped the plan.
 */
class PlanningNotes {
 public:
  /** Merge newly discovered unhealthy hosts. */
  void addUnhealthy(const std::set<std::string>& hosts);

  /** Returns all unhealthy hosts discovered so far. */
  const std::set<std::string>& getUnhealthyHosts() const {
    return unhealthyHosts_;
  }

  /** Record a service display name. */
  void setServiceDisplay(
      const std::string& serviceName, const std::string& displayName);

  /** Record a component display name. */
  void setComponentDisplay(
      const std::string& serviceName,
      const std::string& componentName,
      const std::string& displayName);

  /** Returns a recorded service display name. */
  std::optional<std::string> getServiceDisplay(
      const std::string& serviceName) const;

  /** Returns a recorded component display name. */
  std::optional<std::string> getComponentDisplay(
      const std::string& serviceName, const std::string& componentName) const;

  /** Record a skip. */
  void recordSkip(
      SkipReason reason,
      const std::string& group,
      const std::string& service = "",
      const std::string& component = "");

  /** Returns all skips, in the order they happened. */
  const std::vector<PlanningSkip>& getSkips() const {
    return skips_;
  }

  /** Returns the number of skips with the given reason. */
  size_t countSkips(SkipReason reason) const;

 private:
  std::set<std::string> unhealthyHosts_;
  std::map<std::string, std::string> serviceDisplayNames_;
  std::map<std::pair<std::string, std::string>, std::string>
      componentDisplayNames_;
  std::vector<PlanningSkip> skips_;
};

} // namespace stackupgrade
