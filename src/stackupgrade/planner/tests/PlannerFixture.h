/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "../InMemoryCluster.h"
#include "../StageWrapperBuilder.h"
#include "../UpgradeContext.h"
#include "../UpgradePack.h"

// Records every add() call, and emits one stage per call so that the group is
// kept in the plan.
class RecordingStageWrapperBuilder
    : public stackupgrade::StageWrapperBuilder {
 public:
  struct Call {
    std::string service;
    std::string component;
    std::vector<std::string> hosts;
    bool isClientOnly;
    std::optional<std::map<std::string, std::string>> params;
  };

  explicit RecordingStageWrapperBuilder(
      std::shared_ptr<std::vector<Call>> calls)
      : calls_(std::move(calls)) {}

  void add(
      const stackupgrade::UpgradeContext& context,
      const stackupgrade::HostsType& hostsType,
      const std::string& serviceName,
      bool isClientOnly,
      const stackupgrade::ProcessingComponent& pc,
      const std::optional<std::map<std::string, std::string>>& params)
      override;

  std::vector<stackupgrade::StageWrapper> build(
      const stackupgrade::UpgradeContext& context) override;

 private:
  std::shared_ptr<std::vector<Call>> calls_;
  std::vector<stackupgrade::StageWrapper> stages_;
};

// A common fixture for planner unit tests.
//
// The cluster runs HDP-2.5 and is moving to HDP-2.6:
//   HDFS:      NAMENODE on h1 (active), h2 (standby); DATANODE on h1, h2, h3
//   ZOOKEEPER: ZOOKEEPER_SERVER on h1, h2, h3
//   TEZ:       TEZ_CLIENT on h1 (client-only service)
class PlannerFixture : public ::testing::Test {
 public:
  void SetUp() override;

  // Create a context with every deployed service crossing from HDP-2.5 to
  // HDP-2.6 (or back, for downgrades)
  stackupgrade::UpgradeContext createContext(
      stackupgrade::Direction direction, stackupgrade::UpgradeType type) const;

  // Create a grouping over the given services
  static stackupgrade::Grouping createGrouping(
      const std::string& name,
      stackupgrade::GroupingKind kind,
      const std::vector<stackupgrade::OrderService>& services);

  // Create a processing component with one task of each given type
  static stackupgrade::ProcessingComponent createProcessingComponent(
      const std::string& componentName,
      const std::vector<stackupgrade::TaskType>& taskTypes);

  // Returns the text of every stage of a group
  static std::vector<std::string> stageTexts(
      const stackupgrade::UpgradeGroupHolder& group);

  // Use a RecordingStageWrapperBuilder for a grouping
  void recordCalls(stackupgrade::Grouping& grouping);

  const stackupgrade::StackId sourceStack_{"HDP", "2.5"};
  const stackupgrade::StackId targetStack_{"HDP", "2.6"};
  const stackupgrade::RepositoryVersion sourceRepo_{sourceStack_, "2.5.0.0-1"};
  const stackupgrade::RepositoryVersion targetRepo_{targetStack_, "2.6.0.0-1"};

  std::shared_ptr<stackupgrade::InMemoryCluster> cluster_;
  std::shared_ptr<std::vector<RecordingStageWrapperBuilder::Call>> calls_;
};
