/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <folly/init/Init.h>
#include <gflags/gflags.h>
#include <glog/logging.h>
#include <gtest/gtest.h>

#include "../UpgradeErrors.h"
#include "../UpgradeHelper.h"
#include "PlannerFixture.h"
#include "stackupgrade/common/Consts.h"

using namespace stackupgrade;

class UpgradeHelperTest : public PlannerFixture {
 public:
  void
  SetUp() override {
    PlannerFixture::SetUp();
    addPack("upgrade-2.6", UpgradeType::ROLLING, "HDP-2.6");
    addPack("nonrolling-upgrade-2.6", UpgradeType::NON_ROLLING, "HDP-2.6");
    addPack("upgrade-2.7", UpgradeType::ROLLING, "HDP-2.7");
    helper_ = std::make_unique<UpgradeHelper>(cluster_, cluster_);
  }

  void
  addPack(
      const std::string& name,
      UpgradeType type,
      const std::string& targetStack) {
    auto pack = std::make_shared<UpgradePack>(name, type, targetStack);
    pack->addGroup(
        Direction::UPGRADE,
        createGrouping(
            "ZOOKEEPER",
            GroupingKind::RESTART,
            {{"ZOOKEEPER", {"ZOOKEEPER_SERVER"}}}));
    pack->addProcessingComponent(
        "ZOOKEEPER",
        createProcessingComponent("ZOOKEEPER_SERVER", {TaskType::RESTART}));
    cluster_->addUpgradePack(sourceStack_, pack);
  }

  std::string
  suggest(UpgradeType type, const std::string& preferred = "") {
    return helper_
        ->suggestUpgradePack(
            *cluster_,
            std::nullopt,
            targetRepo_.version,
            Direction::UPGRADE,
            type,
            preferred)
        ->getName();
  }

  std::unique_ptr<UpgradeHelper> helper_;
};

TEST_F(UpgradeHelperTest, SuggestMatchingPack) {
  EXPECT_EQ("upgrade-2.6", suggest(UpgradeType::ROLLING));
  EXPECT_EQ("nonrolling-upgrade-2.6", suggest(UpgradeType::NON_ROLLING));
  EXPECT_THROW(suggest(UpgradeType::HOST_ORDERED), UpgradePlanningError);
}

TEST_F(UpgradeHelperTest, SuggestPreferredPack) {
  // The preferred pack wins even if its type differs
  EXPECT_EQ(
      "nonrolling-upgrade-2.6",
      suggest(UpgradeType::ROLLING, "nonrolling-upgrade-2.6"));

  // Unknown preferred packs are ignored
  EXPECT_EQ("upgrade-2.6", suggest(UpgradeType::ROLLING, "no-such-pack"));
}

TEST_F(UpgradeHelperTest, SuggestAmbiguousPack) {
  addPack("upgrade-2.6-alt", UpgradeType::ROLLING, "HDP-2.6");
  EXPECT_THROW(suggest(UpgradeType::ROLLING), UpgradePlanningError);
  EXPECT_EQ(
      "upgrade-2.6-alt", suggest(UpgradeType::ROLLING, "upgrade-2.6-alt"));
}

TEST_F(UpgradeHelperTest, SuggestUnknownVersion) {
  EXPECT_THROW(
      helper_->suggestUpgradePack(
          *cluster_,
          std::nullopt,
          "9.9.9.9-1",
          Direction::UPGRADE,
          UpgradeType::ROLLING,
          ""),
      UpgradePlanningError);
}

TEST_F(UpgradeHelperTest, SuggestDowngradePack) {
  // Downgrades look up the pack by the version being left
  auto pack = helper_->suggestUpgradePack(
      *cluster_,
      targetRepo_.version,
      sourceRepo_.version,
      Direction::DOWNGRADE,
      UpgradeType::ROLLING,
      "");
  EXPECT_EQ("upgrade-2.6", pack->getName());
}

TEST_F(UpgradeHelperTest, CreateSequence) {
  auto pack = helper_->suggestUpgradePack(
      *cluster_,
      std::nullopt,
      targetRepo_.version,
      Direction::UPGRADE,
      UpgradeType::NON_ROLLING,
      "");
  PlanningNotes notes;
  auto groups = helper_->createSequence(
      *pack,
      createContext(Direction::UPGRADE, UpgradeType::NON_ROLLING),
      notes);
  ASSERT_EQ(1, groups.size());
  EXPECT_EQ(1, groups[0].items.size());
}

TEST_F(UpgradeHelperTest, UpdateDesiredRepositoriesAndConfigs) {
  // Not part of HDP-2.6
  HostsType clients;
  clients.hosts = {"h2"};
  cluster_->addComponent(
      "ZOOKEEPER", "ZOOKEEPER_CLIENT", clients, sourceRepo_.version);

  helper_->updateDesiredRepositoriesAndConfigs(
      createContext(Direction::UPGRADE, UpgradeType::ROLLING));
  EXPECT_FALSE(cluster_->inTransaction());

  for (const auto& serviceName : {"HDFS", "ZOOKEEPER", "TEZ"}) {
    auto desired = cluster_->getServiceDesiredRepository(serviceName);
    ASSERT_TRUE(desired.has_value());
    EXPECT_EQ(targetStack_, desired->stackId);
    EXPECT_EQ(targetRepo_.version, desired->version);
  }
  auto componentDesired =
      cluster_->getComponentDesiredRepository("HDFS", "DATANODE");
  ASSERT_TRUE(componentDesired.has_value());
  EXPECT_EQ(targetRepo_.version, componentDesired->version);

  // Advertised versions
  auto dataNode = cluster_->getHostComponent("HDFS", "DATANODE", "h3");
  ASSERT_TRUE(dataNode.has_value());
  EXPECT_EQ(UpgradeState::IN_PROGRESS, dataNode->upgradeState);
  EXPECT_EQ(sourceRepo_.version, dataNode->version);

  // Not advertised on HDP-2.6
  auto tezClient = cluster_->getHostComponent("TEZ", "TEZ_CLIENT", "h1");
  ASSERT_TRUE(tezClient.has_value());
  EXPECT_EQ(UpgradeState::NONE, tezClient->upgradeState);
  EXPECT_EQ(UpgradeConsts::kUnknownVersion, tezClient->version);

  // Unknown to the catalog
  auto zkClient =
      cluster_->getHostComponent("ZOOKEEPER", "ZOOKEEPER_CLIENT", "h2");
  ASSERT_TRUE(zkClient.has_value());
  EXPECT_EQ(UpgradeState::NONE, zkClient->upgradeState);
  EXPECT_EQ(UpgradeConsts::kUnknownVersion, zkClient->version);

  // Configurations were reconciled in the same transaction
  const auto hdfsConfig = cluster_->getLiveConfig("HDFS");
  EXPECT_EQ("256m", hdfsConfig["hdfs-site"]["dfs.blocksize"].asString());
}

TEST_F(UpgradeHelperTest, UpdateRollsBackOnMergeFailure) {
  // KAFKA is deployed but not part of either stack
  cluster_->addService("KAFKA", false);
  auto context = createContext(Direction::UPGRADE, UpgradeType::ROLLING);
  context.addService("KAFKA", sourceRepo_, targetRepo_);

  EXPECT_THROW(
      helper_->updateDesiredRepositoriesAndConfigs(context), ConfigMergeError);
  EXPECT_FALSE(cluster_->inTransaction());

  // Repository changes were rolled back along with configurations
  EXPECT_FALSE(cluster_->getServiceDesiredRepository("HDFS").has_value());
  auto dataNode = cluster_->getHostComponent("HDFS", "DATANODE", "h1");
  ASSERT_TRUE(dataNode.has_value());
  EXPECT_EQ(UpgradeState::NONE, dataNode->upgradeState);
  EXPECT_EQ(1, cluster_->getRevisions("HDFS").size());
}

int
main(int argc, char* argv[]) {
  folly::init(&argc, &argv);
  FLAGS_logtostderr = true;
  testing::InitGoogleTest(&argc, argv);

  return RUN_ALL_TESTS();
}
