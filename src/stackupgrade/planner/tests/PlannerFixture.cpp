/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "PlannerFixture.h"

#include <folly/Format.h>
#include <folly/String.h>
#include <folly/dynamic.h>

using namespace stackupgrade;

void
RecordingStageWrapperBuilder::add(
    const UpgradeContext& /* context */,
    const HostsType& hostsType,
    const std::string& serviceName,
    bool isClientOnly,
    const ProcessingComponent& pc,
    const std::optional<std::map<std::string, std::string>>& params) {
  calls_->push_back(
      Call{serviceName, pc.name, hostsType.hosts, isClientOnly, params});

  TaskWrapper taskWrapper;
  taskWrapper.service = serviceName;
  taskWrapper.component = pc.name;
  taskWrapper.hosts = hostsType.hosts;
  taskWrapper.tasks = pc.tasks;
  StageWrapper stage;
  stage.text = folly::sformat(
      "{} on {}", pc.name, folly::join(", ", hostsType.hosts));
  stage.tasks.push_back(std::move(taskWrapper));
  stages_.push_back(std::move(stage));
}

std::vector<StageWrapper>
RecordingStageWrapperBuilder::build(const UpgradeContext& /* context */) {
  return stages_;
}

void
PlannerFixture::SetUp() {
  cluster_ =
      std::make_shared<InMemoryCluster>("c1", sourceStack_, targetStack_);
  calls_ = std::make_shared<std::vector<RecordingStageWrapperBuilder::Call>>();

  // Stack metadata
  for (const auto& stackId : {sourceStack_, targetStack_}) {
    const bool isTarget = stackId == targetStack_;
    cluster_->addStackService(
        stackId,
        "HDFS",
        "HDFS",
        folly::dynamic::object(
            "hdfs-site",
            folly::dynamic::object("dfs.replication", "3")(
                "dfs.blocksize", isTarget ? "256m" : "128m")));
    cluster_->addStackComponent(stackId, "HDFS", "NAMENODE", "NameNode", true);
    cluster_->addStackComponent(stackId, "HDFS", "DATANODE", "DataNode", true);
    cluster_->addStackService(
        stackId,
        "ZOOKEEPER",
        "ZooKeeper",
        folly::dynamic::object(
            "zoo.cfg",
            folly::dynamic::object("tickTime", isTarget ? "3000" : "2000")));
    cluster_->addStackComponent(
        stackId, "ZOOKEEPER", "ZOOKEEPER_SERVER", "ZooKeeper Server", true);
    cluster_->addStackService(stackId, "TEZ", "Tez", folly::dynamic::object);
    cluster_->addStackComponent(
        stackId, "TEZ", "TEZ_CLIENT", "Tez Client", false);
  }
  cluster_->addRepositoryVersion(sourceRepo_);
  cluster_->addRepositoryVersion(targetRepo_);

  // Deployment
  HostsType nameNodes;
  nameNodes.hosts = {"h1", "h2"};
  nameNodes.master = "h1";
  nameNodes.secondary = "h2";
  HostsType allHosts;
  allHosts.hosts = {"h1", "h2", "h3"};
  HostsType firstHost;
  firstHost.hosts = {"h1"};

  cluster_->addService("HDFS", false);
  cluster_->addComponent("HDFS", "NAMENODE", nameNodes, sourceRepo_.version);
  cluster_->addComponent("HDFS", "DATANODE", allHosts, sourceRepo_.version);
  cluster_->setLiveConfig(
      "HDFS",
      folly::dynamic::object(
          "hdfs-site",
          folly::dynamic::object("dfs.replication", "2")(
              "dfs.blocksize", "128m")));
  cluster_->addService("ZOOKEEPER", false);
  cluster_->addComponent(
      "ZOOKEEPER", "ZOOKEEPER_SERVER", allHosts, sourceRepo_.version);
  cluster_->setLiveConfig(
      "ZOOKEEPER",
      folly::dynamic::object(
          "zoo.cfg", folly::dynamic::object("tickTime", "2000")));
  cluster_->addService("TEZ", true);
  cluster_->addComponent("TEZ", "TEZ_CLIENT", firstHost, sourceRepo_.version);
  cluster_->setLiveConfig(
      "TEZ",
      folly::dynamic::object(
          "tez-site",
          folly::dynamic::object("tez.am.resource.memory.mb", "1024")));
  cluster_->setNameNodeHA(true);
}

UpgradeContext
PlannerFixture::createContext(Direction direction, UpgradeType type) const {
  const bool isDowngrade = direction == Direction::DOWNGRADE;
  const RepositoryVersion& from = isDowngrade ? targetRepo_ : sourceRepo_;
  const RepositoryVersion& to = isDowngrade ? sourceRepo_ : targetRepo_;

  // A downgrade is associated with the version it leaves
  UpgradeContext context(
      cluster_, cluster_, direction, type, isDowngrade ? from : to);
  for (const auto& serviceName : {"HDFS", "ZOOKEEPER", "TEZ"}) {
    context.addService(serviceName, from, to);
  }
  context.setUserName("admin");
  return context;
}

Grouping
PlannerFixture::createGrouping(
    const std::string& name,
    GroupingKind kind,
    const std::vector<OrderService>& services) {
  Grouping grouping;
  grouping.name = name;
  grouping.title = name;
  grouping.kind = kind;
  grouping.services = services;
  return grouping;
}

ProcessingComponent
PlannerFixture::createProcessingComponent(
    const std::string& componentName, const std::vector<TaskType>& taskTypes) {
  ProcessingComponent pc;
  pc.name = componentName;
  for (const auto type : taskTypes) {
    Task task;
    task.type = type;
    pc.tasks.push_back(task);
  }
  return pc;
}

std::vector<std::string>
PlannerFixture::stageTexts(const UpgradeGroupHolder& group) {
  std::vector<std::string> texts;
  for (const auto& stage : group.items) {
    texts.push_back(stage.text.value_or(""));
  }
  return texts;
}

void
PlannerFixture::recordCalls(Grouping& grouping) {
  auto calls = calls_;
  grouping.builderFactory = [calls](const Grouping&, bool) {
    return std::make_unique<RecordingStageWrapperBuilder>(calls);
  };
}
