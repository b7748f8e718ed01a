/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "StageWrapperBuilder.h"

#include <algorithm>

#include <folly/Format.h>
#include <folly/String.h>
#include <glog/logging.h>

#include "UpgradeContext.h"

namespace {

// Returns the progressive verb used in stage text for a lifecycle task
std::string
lifecycleVerb(stackupgrade::TaskType type) {
  switch (type) {
    case stackupgrade::TaskType::RESTART:
      return "Restarting";
    case stackupgrade::TaskType::START:
      return "Starting";
    case stackupgrade::TaskType::STOP:
      return "Stopping";
    default:
      return "Running";
  }
}

bool
isLifecycleTask(stackupgrade::TaskType type) {
  return type == stackupgrade::TaskType::RESTART ||
         type == stackupgrade::TaskType::START ||
         type == stackupgrade::TaskType::STOP;
}

void
appendUnique(std::vector<std::string>& v, const std::string& s) {
  if (std::find(v.begin(), v.end(), s) == v.end()) {
    v.push_back(s);
  }
}

stackupgrade::StageWrapper
serviceCheckStage(const std::string& serviceName) {
  stackupgrade::Task task;
  task.type = stackupgrade::TaskType::SERVICE_CHECK;

  stackupgrade::TaskWrapper taskWrapper;
  taskWrapper.service = serviceName;
  taskWrapper.tasks.push_back(task);

  stackupgrade::StageWrapper stage;
  stage.text = folly::sformat("Service Check {}", serviceName);
  stage.tasks.push_back(std::move(taskWrapper));
  return stage;
}

} // namespace

namespace stackupgrade {

void
DefaultStageWrapperBuilder::add(
    const UpgradeContext& context,
    const HostsType& hostsType,
    const std::string& serviceName,
    bool isClientOnly,
    const ProcessingComponent& pc,
    const std::optional<std::map<std::string, std::string>>& params) {
  for (const auto& task : pc.tasks) {
    TaskWrapper taskWrapper;
    taskWrapper.service = serviceName;
    taskWrapper.component = pc.name;
    taskWrapper.params = params.value_or(std::map<std::string, std::string>());
    taskWrapper.tasks.push_back(task);

    if (task.type == TaskType::SERVICE_CHECK) {
      appendUnique(servicesToCheck_, serviceName);
      continue;
    }

    if (isLifecycleTask(task.type)) {
      // Rolling upgrades take one host down at a time
      if (context.getType() == UpgradeType::ROLLING) {
        for (const auto& host : hostsType.hosts) {
          StageWrapper stage;
          stage.text = folly::sformat(
              "{} {} on {}", lifecycleVerb(task.type), pc.name, host);
          taskWrapper.hosts = {host};
          stage.tasks.push_back(taskWrapper);
          stages_.push_back(std::move(stage));
        }
      } else {
        StageWrapper stage;
        stage.text = folly::sformat(
            "{} {} on {}",
            lifecycleVerb(task.type),
            pc.name,
            folly::join(", ", hostsType.hosts));
        taskWrapper.hosts = hostsType.hosts;
        stage.tasks.push_back(std::move(taskWrapper));
        stages_.push_back(std::move(stage));
      }
      if (!isClientOnly && task.type != TaskType::STOP) {
        appendUnique(servicesToCheck_, serviceName);
      }
      continue;
    }

    StageWrapper stage;
    stage.text = task.summary
        ? *task.summary
        : folly::sformat("{} for {}", toString(task.type), pc.name);
    taskWrapper.hosts = hostsType.hosts;
    stage.tasks.push_back(std::move(taskWrapper));
    stages_.push_back(std::move(stage));
  }
}

std::vector<StageWrapper>
DefaultStageWrapperBuilder::build(const UpgradeContext& /* context */) {
  std::vector<StageWrapper> stages = stages_;
  if (performServiceCheck_) {
    for (const auto& serviceName : servicesToCheck_) {
      stages.push_back(serviceCheckStage(serviceName));
    }
  }
  VLOG(3) << folly::sformat(
      "Built {} stage(s) for group {}", stages.size(), groupName_);
  return stages;
}

void
ServiceCheckStageWrapperBuilder::add(
    const UpgradeContext& /* context */,
    const HostsType& /* hostsType */,
    const std::string& serviceName,
    bool isClientOnly,
    const ProcessingComponent& /* pc */,
    const std::optional<std::map<std::string, std::string>>& /* params */) {
  if (!isClientOnly) {
    appendUnique(services_, serviceName);
  }
}

std::vector<StageWrapper>
ServiceCheckStageWrapperBuilder::build(const UpgradeContext& /* context */) {
  std::vector<StageWrapper> stages;
  for (const auto& serviceName : services_) {
    stages.push_back(serviceCheckStage(serviceName));
  }
  return stages;
}

} // namespace stackupgrade
