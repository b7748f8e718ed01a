/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "UpgradePackJson.h"

#include <stdexcept>

#include <folly/Format.h>
#include <folly/String.h>

#include "UpgradeContext.h"
#include "stackupgrade/common/JsonUtils.h"

namespace stackupgrade {

std::shared_ptr<UpgradePack>
UpgradePackJson::parseUpgradePack(const folly::dynamic& pack) {
  if (!pack.isObject()) {
    throw std::invalid_argument("Upgrade pack must be an object");
  }

  auto upgradePack = std::make_shared<UpgradePack>(
      JsonUtils::getString(pack, "name"),
      parseUpgradeType(JsonUtils::getString(pack, "type")),
      JsonUtils::getOptionalString(pack, "target"));

  const folly::dynamic empty = folly::dynamic::array;
  const auto groups = pack.getDefault("groups", empty);
  const auto downgradeGroups = pack.getDefault("downgradeGroups", empty);
  if (!groups.isArray() || !downgradeGroups.isArray()) {
    throw std::invalid_argument("Upgrade pack groups must be arrays");
  }
  for (const auto& grouping : groups) {
    upgradePack->addGroup(Direction::UPGRADE, parseGrouping(grouping));
  }
  for (const auto& grouping : downgradeGroups) {
    upgradePack->addGroup(Direction::DOWNGRADE, parseGrouping(grouping));
  }

  const auto processing =
      pack.getDefault("processing", folly::dynamic::object);
  if (!processing.isObject()) {
    throw std::invalid_argument("Upgrade pack processing must be an object");
  }
  for (const auto& service : processing.items()) {
    if (!service.second.isObject()) {
      throw std::invalid_argument(folly::sformat(
          "Processing of service {} must be an object",
          service.first.asString()));
    }
    for (const auto& component : service.second.items()) {
      if (!component.second.isArray()) {
        throw std::invalid_argument(folly::sformat(
            "Tasks of {}/{} must be an array",
            service.first.asString(),
            component.first.asString()));
      }
      ProcessingComponent pc;
      pc.name = component.first.asString();
      for (const auto& task : component.second) {
        pc.tasks.push_back(parseTask(task));
      }
      upgradePack->addProcessingComponent(
          service.first.asString(), std::move(pc));
    }
  }

  return upgradePack;
}

Grouping
UpgradePackJson::parseGrouping(const folly::dynamic& grouping) {
  if (!grouping.isObject()) {
    throw std::invalid_argument("Grouping must be an object");
  }

  Grouping g;
  g.name = JsonUtils::getString(grouping, "name");
  g.title = JsonUtils::getOptionalString(grouping, "title").value_or(g.name);
  if (auto kind = JsonUtils::getOptionalString(grouping, "kind")) {
    g.kind = parseGroupingKind(*kind);
  }
  if (auto scope = JsonUtils::getOptionalString(grouping, "scope")) {
    g.scope = parseUpgradeScope(*scope);
  }
  g.skippable = JsonUtils::getBool(grouping, "skippable", g.skippable);
  g.allowRetry = JsonUtils::getBool(grouping, "allowRetry", g.allowRetry);
  g.supportsAutoSkipOnFailure = JsonUtils::getBool(
      grouping, "supportsAutoSkipOnFailure", g.supportsAutoSkipOnFailure);
  g.performServiceCheck = JsonUtils::getBool(
      grouping, "performServiceCheck", g.performServiceCheck);

  auto condition = grouping.get_ptr("condition");
  if (condition != nullptr && !condition->isNull()) {
    g.condition = parseCondition(*condition);
  }

  auto services = grouping.get_ptr("services");
  if (services != nullptr) {
    if (!services->isArray()) {
      throw std::invalid_argument(
          folly::sformat("Services of grouping {} must be an array", g.name));
    }
    for (const auto& service : *services) {
      g.services.push_back(OrderService{
          JsonUtils::getString(service, "name"),
          JsonUtils::getStringList(service, "components")});
    }
  }
  return g;
}

Task
UpgradePackJson::parseTask(const folly::dynamic& task) {
  if (!task.isObject()) {
    throw std::invalid_argument("Task must be an object");
  }
  Task t;
  t.type = parseTaskType(JsonUtils::getString(task, "type"));
  t.summary = JsonUtils::getOptionalString(task, "summary");
  t.messages = JsonUtils::getStringList(task, "messages");
  return t;
}

std::optional<GroupCondition>
UpgradePackJson::parseCondition(const folly::dynamic& condition) {
  if (!condition.isObject()) {
    throw std::invalid_argument("Grouping condition must be an object");
  }

  const auto requiredServices =
      JsonUtils::getStringList(condition, "requiresServices");
  std::optional<bool> nameNodeHA;
  if (condition.count("nameNodeHA")) {
    nameNodeHA = JsonUtils::getBool(condition, "nameNodeHA", false);
  }
  if (requiredServices.empty() && !nameNodeHA) {
    return std::nullopt;
  }

  std::vector<std::string> description;
  if (!requiredServices.empty()) {
    description.push_back(folly::sformat(
        "requires services [{}]", folly::join(", ", requiredServices)));
  }
  if (nameNodeHA) {
    description.push_back(
        folly::sformat("requires NameNode HA {}", *nameNodeHA ? "on" : "off"));
  }

  GroupCondition groupCondition;
  groupCondition.description = folly::join(" and ", description);
  groupCondition.isSatisfied = [requiredServices,
                                nameNodeHA](const UpgradeContext& context) {
    for (const auto& serviceName : requiredServices) {
      if (!context.isServiceSupported(serviceName)) {
        return false;
      }
    }
    return !nameNodeHA || context.getResolver().isNameNodeHA() == *nameNodeHA;
  };
  return groupCondition;
}

folly::dynamic
UpgradePackJson::taskToDynamic(const Task& task) {
  folly::dynamic obj = folly::dynamic::object("type", toString(task.type));
  if (task.summary) {
    obj["summary"] = *task.summary;
  }
  if (!task.messages.empty()) {
    obj["messages"] =
        folly::dynamic(task.messages.begin(), task.messages.end());
  }
  return obj;
}

folly::dynamic
UpgradePackJson::planToDynamic(const std::vector<UpgradeGroupHolder>& groups) {
  folly::dynamic plan = folly::dynamic::array;
  for (const auto& group : groups) {
    folly::dynamic stages = folly::dynamic::array;
    for (const auto& stage : group.items) {
      folly::dynamic tasks = folly::dynamic::array;
      for (const auto& wrapper : stage.tasks) {
        folly::dynamic params = folly::dynamic::object;
        for (const auto& kv : wrapper.params) {
          params[kv.first] = kv.second;
        }
        folly::dynamic wrapperTasks = folly::dynamic::array;
        for (const auto& task : wrapper.tasks) {
          wrapperTasks.push_back(taskToDynamic(task));
        }
        folly::dynamic hosts =
            folly::dynamic(wrapper.hosts.begin(), wrapper.hosts.end());
        tasks.push_back(folly::dynamic::object("service", wrapper.service)(
            "component", wrapper.component)("hosts", std::move(hosts))(
            "params", std::move(params))("tasks", std::move(wrapperTasks)));
      }
      folly::dynamic obj = folly::dynamic::object("tasks", std::move(tasks));
      if (stage.text) {
        obj["text"] = *stage.text;
      }
      stages.push_back(std::move(obj));
    }
    plan.push_back(folly::dynamic::object("name", group.name)(
        "title", group.title)("kind", toString(group.kind))(
        "allowRetry", group.allowRetry)("skippable", group.skippable)(
        "supportsAutoSkipOnFailure", group.supportsAutoSkipOnFailure)(
        "stages", std::move(stages)));
  }
  return plan;
}

folly::dynamic
UpgradePackJson::notesToDynamic(const PlanningNotes& notes) {
  const auto& unhealthy = notes.getUnhealthyHosts();
  folly::dynamic skips = folly::dynamic::array;
  for (const auto& skip : notes.getSkips()) {
    folly::dynamic obj = folly::dynamic::object(
        "reason", toString(skip.reason))("group", skip.group);
    if (!skip.service.empty()) {
      obj["service"] = skip.service;
    }
    if (!skip.component.empty()) {
      obj["component"] = skip.component;
    }
    skips.push_back(std::move(obj));
  }
  return folly::dynamic::object(
      "unhealthyHosts", folly::dynamic(unhealthy.begin(), unhealthy.end()))(
      "skips", std::move(skips));
}

} // namespace stackupgrade
