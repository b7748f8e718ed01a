/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <folly/dynamic.h>
#include <folly/init/Init.h>
#include <folly/json.h>
#include <gflags/gflags.h>
#include <glog/logging.h>
#include <gtest/gtest.h>

#include "../SequenceBuilder.h"
#include "../UpgradePackJson.h"
#include "PlannerFixture.h"

using namespace stackupgrade;
using folly::dynamic;
using folly::parseJson;

namespace {

const char* kPackJson = R"({
  "name": "upgrade-2.6",
  "type": "rolling",
  "target": "HDP-2.6",
  "groups": [
    {
      "name": "PRE_CLUSTER",
      "title": "Prepare {{direction.text}}",
      "scope": "COMPLETE",
      "skippable": true,
      "supportsAutoSkipOnFailure": false,
      "services": [{"name": "HDFS", "components": ["NAMENODE"]}]
    },
    {
      "name": "ZOOKEEPER",
      "kind": "RESTART",
      "allowRetry": false,
      "performServiceCheck": false,
      "condition": {"requiresServices": ["ZOOKEEPER"]},
      "services": [{"name": "ZOOKEEPER", "components": ["ZOOKEEPER_SERVER"]}]
    }
  ],
  "downgradeGroups": [
    {"name": "ZOOKEEPER", "kind": "RESTART",
     "services": [{"name": "ZOOKEEPER", "components": ["ZOOKEEPER_SERVER"]}]}
  ],
  "processing": {
    "HDFS": {
      "NAMENODE": [
        {"type": "MANUAL", "summary": "Back up NameNode",
         "messages": ["Back up {{hosts.master}}"]},
        {"type": "RESTART"}
      ]
    },
    "ZOOKEEPER": {"ZOOKEEPER_SERVER": [{"type": "RESTART"}]}
  }
})";

} // namespace

class UpgradePackJsonTest : public PlannerFixture {};

TEST_F(UpgradePackJsonTest, ParseUpgradePack) {
  auto pack = UpgradePackJson::parseUpgradePack(parseJson(kPackJson));

  EXPECT_EQ("upgrade-2.6", pack->getName());
  EXPECT_EQ(UpgradeType::ROLLING, pack->getType());
  EXPECT_EQ("HDP-2.6", pack->getTargetStack());

  const auto& groups = pack->getGroups(Direction::UPGRADE);
  ASSERT_EQ(2, groups.size());
  EXPECT_EQ("PRE_CLUSTER", groups[0].name);
  EXPECT_EQ("Prepare {{direction.text}}", groups[0].title);
  EXPECT_EQ(GroupingKind::DEFAULT, groups[0].kind);
  EXPECT_EQ(UpgradeScope::COMPLETE, groups[0].scope);
  EXPECT_TRUE(groups[0].skippable);
  EXPECT_TRUE(groups[0].allowRetry);
  EXPECT_FALSE(groups[0].supportsAutoSkipOnFailure);
  EXPECT_FALSE(groups[0].condition.has_value());
  ASSERT_EQ(1, groups[0].services.size());
  EXPECT_EQ("HDFS", groups[0].services[0].serviceName);
  EXPECT_EQ(
      std::vector<std::string>({"NAMENODE"}), groups[0].services[0].components);

  // Title defaults to the name
  EXPECT_EQ("ZOOKEEPER", groups[1].title);
  EXPECT_EQ(GroupingKind::RESTART, groups[1].kind);
  EXPECT_EQ(UpgradeScope::ANY, groups[1].scope);
  EXPECT_FALSE(groups[1].allowRetry);
  EXPECT_FALSE(groups[1].performServiceCheck);
  ASSERT_TRUE(groups[1].condition.has_value());
  EXPECT_EQ("requires services [ZOOKEEPER]", groups[1].condition->description);

  EXPECT_EQ(1, pack->getGroups(Direction::DOWNGRADE).size());

  const auto* nameNode = pack->getProcessingComponent("HDFS", "NAMENODE");
  ASSERT_NE(nullptr, nameNode);
  ASSERT_EQ(2, nameNode->tasks.size());
  EXPECT_EQ(TaskType::MANUAL, nameNode->tasks[0].type);
  EXPECT_EQ("Back up NameNode", nameNode->tasks[0].summary);
  EXPECT_EQ(
      std::vector<std::string>({"Back up {{hosts.master}}"}),
      nameNode->tasks[0].messages);
  EXPECT_EQ(TaskType::RESTART, nameNode->tasks[1].type);
  EXPECT_TRUE(pack->hasServiceTasks("ZOOKEEPER"));
}

TEST_F(UpgradePackJsonTest, Conditions) {
  auto context = createContext(Direction::UPGRADE, UpgradeType::ROLLING);

  auto satisfied = UpgradePackJson::parseGrouping(parseJson(
      R"({"name": "g", "condition": {"requiresServices": ["HDFS", "TEZ"],)"
      R"( "nameNodeHA": true}})"));
  ASSERT_TRUE(satisfied.condition.has_value());
  EXPECT_EQ(
      "requires services [HDFS, TEZ] and requires NameNode HA on",
      satisfied.condition->description);
  EXPECT_TRUE(satisfied.condition->isSatisfied(context));

  auto missingService = UpgradePackJson::parseGrouping(parseJson(
      R"({"name": "g", "condition": {"requiresServices": ["KAFKA"]}})"));
  EXPECT_FALSE(missingService.condition->isSatisfied(context));

  auto noHA = UpgradePackJson::parseGrouping(
      parseJson(R"({"name": "g", "condition": {"nameNodeHA": false}})"));
  EXPECT_FALSE(noHA.condition->isSatisfied(context));
  cluster_->setNameNodeHA(false);
  EXPECT_TRUE(noHA.condition->isSatisfied(context));

  // An empty condition is no condition
  auto empty = UpgradePackJson::parseGrouping(
      parseJson(R"({"name": "g", "condition": {}})"));
  EXPECT_FALSE(empty.condition.has_value());
}

TEST_F(UpgradePackJsonTest, MalformedPacks) {
  EXPECT_THROW(
      UpgradePackJson::parseUpgradePack(dynamic::array()),
      std::invalid_argument);
  EXPECT_THROW(
      UpgradePackJson::parseUpgradePack(parseJson(R"({"type": "ROLLING"})")),
      std::invalid_argument);
  EXPECT_THROW(
      UpgradePackJson::parseUpgradePack(
          parseJson(R"({"name": "p", "type": "FAST"})")),
      std::invalid_argument);
  EXPECT_THROW(
      UpgradePackJson::parseUpgradePack(
          parseJson(R"({"name": "p", "type": "ROLLING", "groups": {}})")),
      std::invalid_argument);
  EXPECT_THROW(
      UpgradePackJson::parseGrouping(
          parseJson(R"({"name": "g", "kind": "SOMETIMES"})")),
      std::invalid_argument);
  EXPECT_THROW(
      UpgradePackJson::parseGrouping(
          parseJson(R"({"name": "g", "services": [{"components": []}]})")),
      std::invalid_argument);
  EXPECT_THROW(
      UpgradePackJson::parseTask(parseJson(R"({"summary": "no type"})")),
      std::invalid_argument);
  EXPECT_THROW(
      UpgradePackJson::parseTask(
          parseJson(R"({"type": "MANUAL", "messages": "not a list"})")),
      std::invalid_argument);
}

TEST_F(UpgradePackJsonTest, RenderPlan) {
  auto pack = UpgradePackJson::parseUpgradePack(parseJson(kPackJson));
  SequenceBuilder builder(*cluster_, *cluster_);
  PlanningNotes notes;
  auto groups = builder.createSequence(
      *pack, createContext(Direction::UPGRADE, UpgradeType::ROLLING), notes);

  auto plan = UpgradePackJson::planToDynamic(groups);
  ASSERT_EQ(2, plan.size());
  EXPECT_EQ("PRE_CLUSTER", plan[0]["name"].asString());
  EXPECT_EQ("Prepare upgrade", plan[0]["title"].asString());
  EXPECT_TRUE(plan[0]["skippable"].asBool());
  EXPECT_FALSE(plan[0]["supportsAutoSkipOnFailure"].asBool());

  // Manual task on the NameNodes (standby first), then a restart per host
  const auto& stages = plan[0]["stages"];
  ASSERT_EQ(4, stages.size());
  EXPECT_EQ("Back up NameNode", stages[0]["text"].asString());
  const auto& manual = stages[0]["tasks"][0];
  EXPECT_EQ("HDFS", manual["service"].asString());
  EXPECT_EQ("NAMENODE", manual["component"].asString());
  EXPECT_EQ(parseJson(R"(["h2", "h1"])"), manual["hosts"]);
  EXPECT_EQ(
      parseJson(R"([{"type": "MANUAL", "summary": "Back up NameNode", )"
                R"("messages": ["Back up h1"]}])"),
      manual["tasks"]);
  EXPECT_EQ("Restarting NAMENODE on h2", stages[1]["text"].asString());
  EXPECT_EQ("Service Check HDFS", stages[3]["text"].asString());

  // No service check when disabled
  EXPECT_EQ("RESTART", plan[1]["kind"].asString());
  EXPECT_FALSE(plan[1]["allowRetry"].asBool());
  EXPECT_EQ(3, plan[1]["stages"].size());
}

TEST_F(UpgradePackJsonTest, RenderNotes) {
  PlanningNotes notes;
  notes.addUnhealthy({"h9", "h8"});
  notes.recordSkip(SkipReason::EMPTY_GROUP, "g1");
  notes.recordSkip(SkipReason::NO_HOSTS, "g2", "HDFS", "JOURNALNODE");

  EXPECT_EQ(
      parseJson(
          R"({"unhealthyHosts": ["h8", "h9"], "skips": [)"
          R"({"reason": "EMPTY_GROUP", "group": "g1"}, )"
          R"({"reason": "NO_HOSTS", "group": "g2", "service": "HDFS", )"
          R"("component": "JOURNALNODE"}]})"),
      UpgradePackJson::notesToDynamic(notes));
}

int
main(int argc, char* argv[]) {
  folly::init(&argc, &argv);
  FLAGS_logtostderr = true;
  testing::InitGoogleTest(&argc, argv);

  return RUN_ALL_TESTS();
}
