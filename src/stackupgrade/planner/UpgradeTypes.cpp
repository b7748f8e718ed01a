/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "UpgradeTypes.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

#include <folly/Format.h>
#include <folly/String.h>

#include "stackupgrade/common/Consts.h"

namespace {

const std::vector<std::pair<stackupgrade::Direction, std::string>>
    kDirectionNames{
        {stackupgrade::Direction::UPGRADE, "UPGRADE"},
        {stackupgrade::Direction::DOWNGRADE, "DOWNGRADE"},
    };

const std::vector<std::pair<stackupgrade::UpgradeType, std::string>>
    kUpgradeTypeNames{
        {stackupgrade::UpgradeType::ROLLING, "ROLLING"},
        {stackupgrade::UpgradeType::NON_ROLLING, "NON_ROLLING"},
        {stackupgrade::UpgradeType::HOST_ORDERED, "HOST_ORDERED"},
    };

const std::vector<std::pair<stackupgrade::UpgradeScope, std::string>>
    kUpgradeScopeNames{
        {stackupgrade::UpgradeScope::ANY, "ANY"},
        {stackupgrade::UpgradeScope::COMPLETE, "COMPLETE"},
        {stackupgrade::UpgradeScope::PARTIAL, "PARTIAL"},
    };

const std::vector<std::pair<stackupgrade::TaskType, std::string>>
    kTaskTypeNames{
        {stackupgrade::TaskType::MANUAL, "MANUAL"},
        {stackupgrade::TaskType::RESTART, "RESTART"},
        {stackupgrade::TaskType::START, "START"},
        {stackupgrade::TaskType::STOP, "STOP"},
        {stackupgrade::TaskType::EXECUTE, "EXECUTE"},
        {stackupgrade::TaskType::CONFIGURE, "CONFIGURE"},
        {stackupgrade::TaskType::SERVICE_CHECK, "SERVICE_CHECK"},
    };

const std::vector<std::pair<stackupgrade::GroupingKind, std::string>>
    kGroupingKindNames{
        {stackupgrade::GroupingKind::DEFAULT, "DEFAULT"},
        {stackupgrade::GroupingKind::SERVICE_CHECK, "SERVICE_CHECK"},
        {stackupgrade::GroupingKind::STOP, "STOP"},
        {stackupgrade::GroupingKind::START, "START"},
        {stackupgrade::GroupingKind::RESTART, "RESTART"},
    };

const std::vector<std::pair<stackupgrade::UpgradeState, std::string>>
    kUpgradeStateNames{
        {stackupgrade::UpgradeState::NONE, "NONE"},
        {stackupgrade::UpgradeState::IN_PROGRESS, "IN_PROGRESS"},
        {stackupgrade::UpgradeState::COMPLETE, "COMPLETE"},
        {stackupgrade::UpgradeState::FAILED, "FAILED"},
    };

template <typename T>
std::string
enumName(const std::vector<std::pair<T, std::string>>& names, T value) {
  for (const auto& entry : names) {
    if (entry.first == value) {
      return entry.second;
    }
  }
  return "UNKNOWN";
}

template <typename T>
T
enumValue(
    const std::vector<std::pair<T, std::string>>& names,
    const std::string& name,
    const std::string& enumType) {
  std::string upper = folly::trimWhitespace(name).str();
  std::transform(upper.begin(), upper.end(), upper.begin(), [](char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  });
  for (const auto& entry : names) {
    if (entry.second == upper) {
      return entry.first;
    }
  }
  throw std::invalid_argument(
      folly::sformat("Unknown {} value '{}'", enumType, name));
}

std::string
capitalize(std::string s, bool proper) {
  if (proper && !s.empty()) {
    s[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
  }
  return s;
}

} // namespace

namespace stackupgrade {

std::string
toString(Direction direction) {
  return enumName(kDirectionNames, direction);
}

std::string
toString(UpgradeType type) {
  return enumName(kUpgradeTypeNames, type);
}

std::string
toString(UpgradeScope scope) {
  return enumName(kUpgradeScopeNames, scope);
}

std::string
toString(TaskType type) {
  return enumName(kTaskTypeNames, type);
}

std::string
toString(GroupingKind kind) {
  return enumName(kGroupingKindNames, kind);
}

std::string
toString(UpgradeState state) {
  return enumName(kUpgradeStateNames, state);
}

Direction
parseDirection(const std::string& name) {
  return enumValue(kDirectionNames, name, "direction");
}

UpgradeType
parseUpgradeType(const std::string& name) {
  return enumValue(kUpgradeTypeNames, name, "upgrade type");
}

UpgradeScope
parseUpgradeScope(const std::string& name) {
  return enumValue(kUpgradeScopeNames, name, "upgrade scope");
}

TaskType
parseTaskType(const std::string& name) {
  return enumValue(kTaskTypeNames, name, "task type");
}

GroupingKind
parseGroupingKind(const std::string& name) {
  return enumValue(kGroupingKindNames, name, "grouping kind");
}

std::string
DirectionText::text(Direction direction, bool proper) {
  return capitalize(
      direction == Direction::UPGRADE ? "upgrade" : "downgrade", proper);
}

std::string
DirectionText::past(Direction direction, bool proper) {
  return capitalize(
      direction == Direction::UPGRADE ? "upgraded" : "downgraded", proper);
}

std::string
DirectionText::plural(Direction direction, bool proper) {
  return capitalize(
      direction == Direction::UPGRADE ? "upgrades" : "downgrades", proper);
}

std::string
DirectionText::verb(Direction direction, bool proper) {
  return capitalize(
      direction == Direction::UPGRADE ? "upgrading" : "downgrading", proper);
}

std::string
DirectionText::preposition(Direction direction) {
  return direction == Direction::UPGRADE ? "to" : "from";
}

StackId::StackId(const std::string& stackId) {
  auto pos = stackId.find(UpgradeConsts::kStackIdSeparator);
  if (pos == std::string::npos || pos == 0 || pos == stackId.size() - 1) {
    throw std::invalid_argument(
        folly::sformat("Invalid stack identifier '{}'", stackId));
  }
  stackName_ = stackId.substr(0, pos);
  stackVersion_ = stackId.substr(pos + 1);
}

std::string
StackId::getStackId() const {
  return stackName_ + UpgradeConsts::kStackIdSeparator + stackVersion_;
}

std::string
Task::toString() const {
  return folly::sformat(
      "{}{}", stackupgrade::toString(type),
      summary ? folly::sformat(" ({})", *summary) : "");
}

std::string
TaskWrapper::toString() const {
  std::vector<std::string> taskNames;
  for (const auto& task : tasks) {
    taskNames.push_back(task.toString());
  }
  return folly::sformat(
      "TaskWrapper{{service={}, component={}, hosts=[{}], tasks=[{}]}}",
      service,
      component,
      folly::join(", ", hosts),
      folly::join(", ", taskNames));
}

std::string
UpgradeGroupHolder::toString() const {
  return folly::sformat(
      "UpgradeGroupHolder{{name={}, title={}, allowRetry={}, skippable={}}}",
      name,
      title,
      allowRetry,
      skippable);
}

} // namespace stackupgrade
