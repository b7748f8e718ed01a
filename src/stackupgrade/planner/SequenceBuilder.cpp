/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "SequenceBuilder.h"

#include <algorithm>
#include <cctype>

#include <folly/Format.h>
#include <folly/String.h>
#include <glog/logging.h>

#include "PlaceholderResolver.h"
#include "ProcessingComponentUtil.h"
#include "UpgradeErrors.h"
#include "stackupgrade/common/Consts.h"

namespace {

bool
equalsIgnoreCase(const std::string& a, const std::string& b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

bool
isNameNode(const std::string& serviceName, const std::string& componentName) {
  return equalsIgnoreCase(
             serviceName, stackupgrade::UpgradeConsts::kHdfsService) &&
         equalsIgnoreCase(
             componentName, stackupgrade::UpgradeConsts::kNameNodeComponent);
}

} // namespace

namespace stackupgrade {

std::vector<UpgradeGroupHolder>
SequenceBuilder::createSequence(
    const UpgradePack& pack, const UpgradeContext& context) const {
  PlanningNotes notes;
  return createSequence(pack, context, notes);
}

std::vector<UpgradeGroupHolder>
SequenceBuilder::createSequence(
    const UpgradePack& pack,
    const UpgradeContext& context,
    PlanningNotes& notes) const {
  const UpgradeType type = context.getType();
  if (pack.getType() != type) {
    LOG(WARNING) << folly::sformat(
        "Planning a {} orchestration with {} upgrade pack {}",
        toString(type),
        toString(pack.getType()),
        pack.getName());
  }

  std::vector<UpgradeGroupHolder> groups;
  for (const auto& group : pack.getGroups(context.getDirection())) {
    if (!context.isScoped(group.scope)) {
      VLOG(2) << "Skipping " << group.toString() << " (out of scope)";
      notes.recordSkip(SkipReason::OUT_OF_SCOPE, group.name);
      continue;
    }

    if (group.condition && group.condition->isSatisfied &&
        !group.condition->isSatisfied(context)) {
      LOG(INFO) << folly::sformat(
          "Skipping {} while building upgrade orchestration due to {}",
          group.toString(),
          group.condition->description);
      notes.recordSkip(SkipReason::CONDITION_NOT_SATISFIED, group.name);
      continue;
    }

    UpgradeGroupHolder groupHolder;
    groupHolder.name = group.name;
    groupHolder.title = group.title;
    groupHolder.kind = group.kind;
    groupHolder.skippable = group.skippable;
    groupHolder.supportsAutoSkipOnFailure = group.supportsAutoSkipOnFailure;
    groupHolder.allowRetry = group.allowRetry;

    // All downgrades are skippable
    if (context.isDowngrade()) {
      groupHolder.skippable = true;
    }

    const std::optional<TaskType> function = group.getFunction();

    // Non-rolling upgrades only run service checks in service check groups
    bool performServiceCheck = group.performServiceCheck;
    if (type == UpgradeType::NON_ROLLING &&
        group.kind != GroupingKind::SERVICE_CHECK) {
      performServiceCheck = false;
    }

    auto builder = group.createBuilder(performServiceCheck);

    // Rolling downgrades reverse the order of services
    std::vector<OrderService> services = group.services;
    if (type == UpgradeType::ROLLING && context.isDowngrade()) {
      std::reverse(services.begin(), services.end());
    }

    for (const auto& service : services) {
      const std::string& serviceName = service.serviceName;
      if (!context.isServiceSupported(serviceName)) {
        notes.recordSkip(
            SkipReason::SERVICE_NOT_SUPPORTED, group.name, serviceName);
        continue;
      }

      if (type == UpgradeType::ROLLING && !pack.hasServiceTasks(serviceName)) {
        notes.recordSkip(SkipReason::NO_SERVICE_TASKS, group.name, serviceName);
        continue;
      }

      for (const auto& componentName : service.components) {
        // Rolling upgrades have exactly one set of tasks per component
        if (type == UpgradeType::ROLLING &&
            !pack.getProcessingComponent(serviceName, componentName)) {
          notes.recordSkip(
              SkipReason::NO_COMPONENT_TASKS,
              group.name,
              serviceName,
              componentName);
          continue;
        }

        auto hostsType =
            context.getResolver().resolve(serviceName, componentName);
        if (!hostsType || hostsType->hosts.empty()) {
          VLOG(2) << folly::sformat(
              "No hosts found for {}/{} in group {}",
              serviceName,
              componentName,
              group.name);
          notes.recordSkip(
              SkipReason::NO_HOSTS, group.name, serviceName, componentName);
          continue;
        }

        if (!hostsType->unhealthy.empty()) {
          notes.addUnhealthy(hostsType->unhealthy);
        }

        const bool isClientOnly = isClientOnlyService(context, serviceName);

        auto pc = ProcessingComponentUtil::resolve(
            pack, serviceName, componentName, function);
        if (!pc) {
          LOG(ERROR) << folly::sformat(
              "Couldn't create a processing component for service {} and "
              "component {}.",
              serviceName,
              componentName);
          notes.recordSkip(
              SkipReason::NO_PROCESSING_COMPONENT,
              group.name,
              serviceName,
              componentName);
          continue;
        }

        setDisplayNames(context, notes, serviceName, componentName);

        auto skipReason = submitComponent(
            context, *builder, *hostsType, serviceName, isClientOnly, *pc);
        if (skipReason) {
          notes.recordSkip(*skipReason, group.name, serviceName, componentName);
        }
      }
    }

    auto stages = builder->build(context);
    if (stages.empty()) {
      VLOG(2) << "Dropping group " << group.name << " (no stages)";
      notes.recordSkip(SkipReason::EMPTY_GROUP, group.name);
      continue;
    }

    groupHolder.items = std::move(stages);
    postProcess(context, groupHolder);
    groups.push_back(std::move(groupHolder));
  }

  logPlan(groups);
  return groups;
}

std::optional<SkipReason>
SequenceBuilder::submitComponent(
    const UpgradeContext& context,
    StageWrapperBuilder& builder,
    const HostsType& hostsType,
    const std::string& serviceName,
    bool isClientOnly,
    const ProcessingComponent& pc) const {
  if (!isNameNode(serviceName, pc.name)) {
    builder.add(
        context, hostsType, serviceName, isClientOnly, pc, std::nullopt);
    return std::nullopt;
  }

  switch (context.getType()) {
    case UpgradeType::ROLLING: {
      // Upgrade the standby first, then the active NameNode
      if (hostsType.hosts.empty() || !hostsType.master ||
          !hostsType.secondary) {
        LOG(WARNING) << folly::sformat(
            "Could not orchestrate NameNode. Hosts could not be resolved: "
            "hosts={}, active={}, standby={}",
            folly::join(",", hostsType.hosts),
            hostsType.master.value_or(""),
            hostsType.secondary.value_or(""));
        return SkipReason::NAMENODE_HOSTS_UNRESOLVED;
      }
      HostsType ordered = hostsType;
      ordered.hosts = {*hostsType.secondary};
      if (*hostsType.master != *hostsType.secondary) {
        ordered.hosts.push_back(*hostsType.master);
      }
      builder.add(
          context, ordered, serviceName, isClientOnly, pc, std::nullopt);
      return std::nullopt;
    }
    case UpgradeType::NON_ROLLING: {
      // With HA, each NameNode needs to know the role it will take, so submit
      // them separately with different parameters
      if (context.getResolver().isNameNodeHA() && hostsType.master &&
          hostsType.secondary) {
        HostsType active;
        active.hosts = {*hostsType.master};
        HostsType standby;
        standby.hosts = {*hostsType.secondary};
        builder.add(
            context,
            active,
            serviceName,
            isClientOnly,
            pc,
            std::map<std::string, std::string>{
                {UpgradeConsts::kDesiredNameNodeRoleParam,
                 UpgradeConsts::kNameNodeRoleActive}});
        builder.add(
            context,
            standby,
            serviceName,
            isClientOnly,
            pc,
            std::map<std::string, std::string>{
                {UpgradeConsts::kDesiredNameNodeRoleParam,
                 UpgradeConsts::kNameNodeRoleStandby}});
      } else {
        builder.add(
            context, hostsType, serviceName, isClientOnly, pc, std::nullopt);
      }
      return std::nullopt;
    }
    case UpgradeType::HOST_ORDERED:
      break;
  }
  LOG(WARNING) << folly::sformat(
      "NameNode cannot be orchestrated for {} upgrades",
      toString(context.getType()));
  return SkipReason::NAMENODE_UNSUPPORTED_UPGRADE_TYPE;
}

void
SequenceBuilder::setDisplayNames(
    const UpgradeContext& context,
    PlanningNotes& notes,
    const std::string& serviceName,
    const std::string& componentName) const {
  try {
    const StackId stackId = context.getCluster().getDesiredStackVersion();
    notes.setServiceDisplay(
        serviceName, catalog_.getDisplayName(stackId, serviceName));
    notes.setComponentDisplay(
        serviceName,
        componentName,
        catalog_.getComponentDisplayName(stackId, serviceName, componentName));
  } catch (const std::exception& ex) {
    VLOG(2) << folly::sformat(
        "Could not get service detail for {}/{}: {}",
        serviceName,
        componentName,
        ex.what());
  }
}

bool
SequenceBuilder::isClientOnlyService(
    const UpgradeContext& context, const std::string& serviceName) const {
  try {
    return context.getCluster().isClientOnlyService(serviceName);
  } catch (const std::exception& ex) {
    throw UpgradePlanningError(folly::sformat(
        "Unable to look up service {} in cluster {}: {}",
        serviceName,
        context.getCluster().getClusterName(),
        ex.what()));
  }
}

void
SequenceBuilder::postProcess(
    const UpgradeContext& context, UpgradeGroupHolder& holder) const {
  PlaceholderResolver resolver(context, configStore_);

  holder.title =
      resolver.tokenReplace(holder.title, std::nullopt, std::nullopt);
  for (auto& stage : holder.items) {
    if (stage.text) {
      stage.text =
          resolver.tokenReplace(*stage.text, std::nullopt, std::nullopt);
    }
    for (auto& taskWrapper : stage.tasks) {
      for (auto& task : taskWrapper.tasks) {
        if (task.summary) {
          task.summary =
              resolver.tokenReplace(*task.summary, std::nullopt, std::nullopt);
        }
        if (task.type == TaskType::MANUAL) {
          for (auto& message : task.messages) {
            message = resolver.tokenReplace(
                message, taskWrapper.service, taskWrapper.component);
          }
        }
      }
    }
  }
}

void
SequenceBuilder::logPlan(const std::vector<UpgradeGroupHolder>& groups) {
  if (!VLOG_IS_ON(2)) {
    return;
  }
  for (const auto& group : groups) {
    VLOG(2) << group.name;
    size_t i = 0;
    for (const auto& stage : group.items) {
      VLOG(2) << "  Stage " << i++;
      size_t j = 0;
      for (const auto& taskWrapper : stage.tasks) {
        VLOG(2) << "    Task " << j++ << " " << taskWrapper.toString();
      }
    }
  }
}

} // namespace stackupgrade
