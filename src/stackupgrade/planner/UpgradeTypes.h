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
#include <vector>

namespace stackupgrade {

/** Whether an orchestration moves a cluster forward or backward. */
enum class Direction {
  UPGRADE,
  DOWNGRADE,
};

/** The upgrade strategy. */
enum class UpgradeType {
  ROLLING,
  NON_ROLLING,
  HOST_ORDERED,
};

/** The orchestration scope a grouping applies to. */
enum class UpgradeScope {
  ANY,
  COMPLETE,
  PARTIAL,
};

/** The kind of a single unit of work. */
enum class TaskType {
  MANUAL,
  RESTART,
  START,
  STOP,
  EXECUTE,
  CONFIGURE,
  SERVICE_CHECK,
};

/** The grouping subtype; selects the stage builder and implied function. */
enum class GroupingKind {
  DEFAULT,
  SERVICE_CHECK,
  STOP,
  START,
  RESTART,
};

/** Per-host component upgrade state. */
enum class UpgradeState {
  NONE,
  IN_PROGRESS,
  COMPLETE,
  FAILED,
};

/** \{ */
std::string toString(Direction direction);
std::string toString(UpgradeType type);
std::string toString(UpgradeScope scope);
std::string toString(TaskType type);
std::string toString(GroupingKind kind);
std::string toString(UpgradeState state);
/** \} */

/**
 * Enum name parsers (case-insensitive).
 *
 * Throws std::invalid_argument on unknown names.
 */
/** \{ */
Direction parseDirection(const std::string& name);
UpgradeType parseUpgradeType(const std::string& name);
UpgradeScope parseUpgradeScope(const std::string& name);
TaskType parseTaskType(const std::string& name);
GroupingKind parseGroupingKind(const std::string& name);
/** \} */

/**
 * Grammatical forms of a Direction, used when rendering text shown to
 * operators. "proper" capitalizes the first letter.
 */
class DirectionText {
 public:
  /** "upgrade" / "downgrade" */
  static std::string text(Direction direction, bool proper);
  /** "upgraded" / "downgraded" */
  static std::string past(Direction direction, bool proper);
  /** "upgrades" / "downgrades" */
  static std::string plural(Direction direction, bool proper);
  /** "upgrading" / "downgrading" */
  static std::string verb(Direction direction, bool proper);
  /** "to" / "from" */
  static std::string preposition(Direction direction);
};

/** A stack identifier of the form "<name>-<version>", e.g. "HDP-2.5". */
class StackId {
 public:
  /** Empty constructor. */
  StackId() {}

  /**
   * Parse a stack identifier.
   *
   * Throws std::invalid_argument if the string has no separator.
   */
  explicit StackId(const std::string& stackId);

  /** Construct from a stack name and version. */
  StackId(const std::string& stackName, const std::string& stackVersion)
      : stackName_(stackName), stackVersion_(stackVersion) {}

  /** Returns the stack name (e.g. "HDP"). */
  const std::string& getStackName() const {
    return stackName_;
  }

  /** Returns the stack version (e.g. "2.5"). */
  const std::string& getStackVersion() const {
    return stackVersion_;
  }

  /** Returns the combined identifier (e.g. "HDP-2.5"). */
  std::string getStackId() const;

  /** \{ */
  bool operator==(const StackId& other) const {
    return stackName_ == other.stackName_ &&
           stackVersion_ == other.stackVersion_;
  }
  bool operator!=(const StackId& other) const {
    return !(*this == other);
  }
  bool operator<(const StackId& other) const {
    if (stackName_ != other.stackName_) {
      return stackName_ < other.stackName_;
    }
    return stackVersion_ < other.stackVersion_;
  }
  /** \} */

 private:
  std::string stackName_;
  std::string stackVersion_;
};

/** A repository version: a concrete build of a stack. */
struct RepositoryVersion {
  /** The stack the repository belongs to. */
  StackId stackId;
  /** The full version string (e.g. "2.5.0.0-1234"). */
  std::string version;
};

/** Resolved target hosts for one service/component. */
struct HostsType {
  /** Ordered, de-duplicated host names. */
  std::vector<std::string> hosts;
  /** The master (active) host, if the component has one. */
  std::optional<std::string> master;
  /** The secondary (standby) host, if the component has one. */
  std::optional<std::string> secondary;
  /** Hosts that are currently unhealthy. */
  std::set<std::string> unhealthy;
};

/** One unit of work for a component. */
struct Task {
  /** The task type. */
  TaskType type{TaskType::MANUAL};
  /** Optional human-readable summary; may contain placeholder tokens. */
  std::optional<std::string> summary;
  /** Instruction lines for MANUAL tasks; may contain placeholder tokens. */
  std::vector<std::string> messages;

  /** Returns a short description for logging. */
  std::string toString() const;
};

/** Ordered tasks for one component. */
struct ProcessingComponent {
  /** The component name. */
  std::string name;
  /** The tasks to run for the component. */
  std::vector<Task> tasks;
};

/** Tasks bound to a specific service/component and host set. */
struct TaskWrapper {
  /** The service name. */
  std::string service;
  /** The component name. */
  std::string component;
  /** The hosts to run the tasks on, in order. */
  std::vector<std::string> hosts;
  /** Extra parameters passed to every task (e.g. the NameNode role). */
  std::map<std::string, std::string> params;
  /** The tasks. */
  std::vector<Task> tasks;

  /** Returns a short description for logging. */
  std::string toString() const;
};

/**
 * One executable step of a plan.
 *
 * Tasks of a stage may run concurrently on their distinct hosts; a stage may
 * only start once the previous stage has completed.
 */
struct StageWrapper {
  /** Display text. */
  std::optional<std::string> text;
  /** The tasks. */
  std::vector<TaskWrapper> tasks;
};

/** A planned group: the output unit of sequence planning. */
struct UpgradeGroupHolder {
  /** The grouping name. */
  std::string name;
  /** The display title. */
  std::string title;
  /** The kind of the grouping this holder was created from. */
  GroupingKind kind{GroupingKind::DEFAULT};
  /** Whether failed stages of the group may be retried. */
  bool allowRetry{true};
  /** Whether the group may be skipped. */
  bool skippable{false};
  /** Whether failures in the group may be skipped automatically. */
  bool supportsAutoSkipOnFailure{true};
  /** Ordered stages. */
  std::vector<StageWrapper> items;

  /** Returns a short description for logging. */
  std::string toString() const;
};

} // namespace stackupgrade
