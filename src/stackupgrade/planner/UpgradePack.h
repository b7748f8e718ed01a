/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "StageWrapperBuilder.h"
#include "UpgradeTypes.h"

namespace stackupgrade {

class UpgradeContext;
struct Grouping;

/** A service and the ordered components of it that a grouping processes. */
struct OrderService {
  /** The service name. */
  std::string serviceName;
  /** The component names, in processing order. */
  std::vector<std::string> components;
};

/** A condition that must hold for a grouping to be scheduled. */
struct GroupCondition {
  /** Description used in log messages. */
  std::string description;
  /** Returns whether the condition holds for the given context. */
  std::function<bool(const UpgradeContext&)> isSatisfied;
};

/** Creates the stage builder for a grouping. */
using StageWrapperBuilderFactory =
    std::function<std::unique_ptr<StageWrapperBuilder>(
        const Grouping& grouping, bool performServiceCheck)>;

/** A named phase of an upgrade. */
struct Grouping {
  /** The grouping name. */
  std::string name;
  /** The display title; may contain placeholder tokens. */
  std::string title;
  /** The grouping subtype. */
  GroupingKind kind{GroupingKind::DEFAULT};
  /** The orchestration scope the grouping belongs to. */
  UpgradeScope scope{UpgradeScope::ANY};
  /** Optional condition for scheduling the grouping. */
  std::optional<GroupCondition> condition;
  /** Whether the grouping may be skipped. */
  bool skippable{false};
  /** Whether failed stages may be retried. */
  bool allowRetry{true};
  /** Whether failures may be skipped automatically. */
  bool supportsAutoSkipOnFailure{true};
  /** Whether service checks run after the grouping's restarts. */
  bool performServiceCheck{true};
  /** Services processed by the grouping, in order. */
  std::vector<OrderService> services;
  /**
   * Custom stage builder factory. If unset, the builder is chosen by kind.
   * @see createBuilder()
   */
  StageWrapperBuilderFactory builderFactory;

  /**
   * Returns the task type this grouping implicitly runs for every component
   * (STOP, START or RESTART), or std::nullopt for explicit-task groupings.
   */
  std::optional<TaskType> getFunction() const;

  /**
   * Create a new stage builder for one planning call.
   * @param performServiceCheck the effective service check setting
   */
  std::unique_ptr<StageWrapperBuilder> createBuilder(
      bool performServiceCheck) const;

  /** Returns a short description for logging. */
  std::string toString() const;
};

/**
 * Declarative upgrade definition for one source stack and upgrade type.
 *
 * Read-only during planning.
 */
class UpgradePack {
 public:
  /**
   * Constructor.
   * @param name the pack name
   * @param type the upgrade type the pack implements
   * @param targetStack the stack identifier the pack upgrades to
   */
  UpgradePack(
      const std::string& name,
      UpgradeType type,
      const std::optional<std::string>& targetStack)
      : name_(name), type_(type), targetStack_(targetStack) {}

  /** Returns the pack name. */
  const std::string& getName() const {
    return name_;
  }

  /** Returns the upgrade type. */
  UpgradeType getType() const {
    return type_;
  }

  /** Returns the target stack identifier, if declared. */
  const std::optional<std::string>& getTargetStack() const {
    return targetStack_;
  }

  /**
   * Returns the ordered groupings for a direction.
   *
   * Downgrades use the downgrade groupings if any were declared, and the
   * upgrade groupings otherwise.
   */
  const std::vector<Grouping>& getGroups(Direction direction) const;

  /** Append a grouping for a direction. */
  void addGroup(Direction direction, Grouping grouping);

  /** Register the explicit tasks of a service component. */
  void addProcessingComponent(
      const std::string& serviceName, ProcessingComponent pc);

  /** Returns all explicit tasks, by service then component. */
  const std::map<std::string, std::map<std::string, ProcessingComponent>>&
  getTasks() const {
    return tasks_;
  }

  /** Returns whether any explicit tasks exist for a service. */
  bool hasServiceTasks(const std::string& serviceName) const;

  /**
   * Returns the explicit tasks of a service component, or nullptr if the pack
   * doesn't define any.
   */
  const ProcessingComponent* getProcessingComponent(
      const std::string& serviceName, const std::string& componentName) const;

 private:
  std::string name_;
  UpgradeType type_;
  std::optional<std::string> targetStack_;
  std::vector<Grouping> upgradeGroups_;
  std::vector<Grouping> downgradeGroups_;
  std::map<std::string, std::map<std::string, ProcessingComponent>> tasks_;
};

} // namespace stackupgrade
