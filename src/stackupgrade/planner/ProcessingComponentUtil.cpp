/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "ProcessingComponentUtil.h"

#include <glog/logging.h>

namespace stackupgrade {

std::optional<ProcessingComponent>
ProcessingComponentUtil::resolve(
    const UpgradePack& pack,
    const std::string& serviceName,
    const std::string& componentName,
    const std::optional<TaskType>& function) {
  const ProcessingComponent* explicitPc =
      pack.getProcessingComponent(serviceName, componentName);

  if (!function) {
    if (explicitPc == nullptr) {
      return std::nullopt;
    }
    return *explicitPc;
  }

  switch (*function) {
    case TaskType::STOP:
      return synthesize(componentName, TaskType::STOP);
    case TaskType::START:
    case TaskType::RESTART:
      if (explicitPc != nullptr) {
        return *explicitPc;
      }
      return synthesize(componentName, *function);
    default:
      LOG(ERROR) << "Unsupported grouping function " << toString(*function)
                 << " for " << serviceName << "/" << componentName;
      return std::nullopt;
  }
}

ProcessingComponent
ProcessingComponentUtil::synthesize(
    const std::string& componentName, TaskType type) {
  ProcessingComponent pc;
  pc.name = componentName;
  Task task;
  task.type = type;
  pc.tasks.push_back(task);
  return pc;
}

} // namespace stackupgrade
