/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "UpgradePack.h"

#include <folly/Format.h>

namespace stackupgrade {

std::optional<TaskType>
Grouping::getFunction() const {
  switch (kind) {
    case GroupingKind::STOP:
      return TaskType::STOP;
    case GroupingKind::START:
      return TaskType::START;
    case GroupingKind::RESTART:
      return TaskType::RESTART;
    default:
      return std::nullopt;
  }
}

std::unique_ptr<StageWrapperBuilder>
Grouping::createBuilder(bool performServiceCheck) const {
  if (builderFactory) {
    return builderFactory(*this, performServiceCheck);
  }
  if (kind == GroupingKind::SERVICE_CHECK) {
    return std::make_unique<ServiceCheckStageWrapperBuilder>();
  }
  return std::make_unique<DefaultStageWrapperBuilder>(
      name, performServiceCheck);
}

std::string
Grouping::toString() const {
  return folly::sformat(
      "Grouping{{name={}, kind={}, scope={}}}",
      name,
      stackupgrade::toString(kind),
      stackupgrade::toString(scope));
}

const std::vector<Grouping>&
UpgradePack::getGroups(Direction direction) const {
  if (direction == Direction::DOWNGRADE && !downgradeGroups_.empty()) {
    return downgradeGroups_;
  }
  return upgradeGroups_;
}

void
UpgradePack::addGroup(Direction direction, Grouping grouping) {
  if (direction == Direction::DOWNGRADE) {
    downgradeGroups_.push_back(std::move(grouping));
  } else {
    upgradeGroups_.push_back(std::move(grouping));
  }
}

void
UpgradePack::addProcessingComponent(
    const std::string& serviceName, ProcessingComponent pc) {
  auto componentName = pc.name;
  tasks_[serviceName][componentName] = std::move(pc);
}

bool
UpgradePack::hasServiceTasks(const std::string& serviceName) const {
  return tasks_.count(serviceName) > 0;
}

const ProcessingComponent*
UpgradePack::getProcessingComponent(
    const std::string& serviceName, const std::string& componentName) const {
  auto serviceIt = tasks_.find(serviceName);
  if (serviceIt == tasks_.end()) {
    return nullptr;
  }
  auto componentIt = serviceIt->second.find(componentName);
  if (componentIt == serviceIt->second.end()) {
    return nullptr;
  }
  return &componentIt->second;
}

} // namespace stackupgrade
