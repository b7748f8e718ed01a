/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "PlanningNotes.h"

#include <algorithm>

namespace stackupgrade {

std::string
toString(SkipReason reason) {
  switch (reason) {
    case SkipReason::OUT_OF_SCOPE:
      return "OUT_OF_SCOPE";
    case SkipReason::CONDITION_NOT_SATISFIED:
      return "CONDITION_NOT_SATISFIED";
    case SkipReason::SERVICE_NOT_SUPPORTED:
      return "SERVICE_NOT_SUPPORTED";
    case SkipReason::NO_SERVICE_TASKS:
      return "NO_SERVICE_TASKS";
    case SkipReason::NO_COMPONENT_TASKS:
      return "NO_COMPONENT_TASKS";
    case SkipReason::NO_HOSTS:
      return "NO_HOSTS";
    case SkipReason::NO_PROCESSING_COMPONENT:
      return "NO_PROCESSING_COMPONENT";
    case SkipReason::NAMENODE_HOSTS_UNRESOLVED:
      return "NAMENODE_HOSTS_UNRESOLVED";
    case SkipReason::NAMENODE_UNSUPPORTED_UPGRADE_TYPE:
      return "NAMENODE_UNSUPPORTED_UPGRADE_TYPE";
    case SkipReason::EMPTY_GROUP:
      return "EMPTY_GROUP";
  }
  return "UNKNOWN";
}

void
PlanningNotes::addUnhealthy(const std::set<std::string>& hosts) {
  unhealthyHosts_.insert(hosts.begin(), hosts.end());
}

void
PlanningNotes::setServiceDisplay(
    const std::string& serviceName, const std::string& displayName) {
  serviceDisplayNames_[serviceName] = displayName;
}

void
PlanningNotes::setComponentDisplay(
    const std::string& serviceName,
    const std::string& componentName,
    const std::string& displayName) {
  componentDisplayNames_[std::make_pair(serviceName, componentName)] =
      displayName;
}

std::optional<std::string>
PlanningNotes::getServiceDisplay(const std::string& serviceName) const {
  auto iter = serviceDisplayNames_.find(serviceName);
  if (iter == serviceDisplayNames_.end()) {
    return std::nullopt;
  }
  return iter->second;
}

std::optional<std::string>
PlanningNotes::getComponentDisplay(
    const std::string& serviceName, const std::string& componentName) const {
  auto iter =
      componentDisplayNames_.find(std::make_pair(serviceName, componentName));
  if (iter == componentDisplayNames_.end()) {
    return std::nullopt;
  }
  return iter->second;
}

void
PlanningNotes::recordSkip(
    SkipReason reason,
    const std::string& group,
    const std::string& service,
    const std::string& component) {
  skips_.push_back(PlanningSkip{reason, group, service, component});
}

size_t
PlanningNotes::countSkips(SkipReason reason) const {
  return std::count_if(
      skips_.begin(), skips_.end(), [reason](const PlanningSkip& skip) {
        return skip.reason == reason;
      });
}

} // namespace stackupgrade
