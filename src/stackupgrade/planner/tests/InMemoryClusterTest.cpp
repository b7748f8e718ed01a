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

#include "../InMemoryCluster.h"

using namespace stackupgrade;
using folly::parseJson;

namespace {

const char* kClusterJson = R"({
  "name": "c1",
  "currentStack": "HDP-2.5",
  "desiredStack": "HDP-2.6",
  "nameNodeHA": true,
  "repositoryVersions": [
    {"stack": "HDP-2.5", "version": "2.5.0.0-1"},
    {"stack": "HDP-2.6", "version": "2.6.0.0-1"}
  ],
  "stacks": [
    {
      "id": "HDP-2.6",
      "services": [
        {
          "name": "HDFS",
          "displayName": "HDFS",
          "defaults": {"hdfs-site": {"dfs.replication": "3"}},
          "components": [
            {"name": "NAMENODE", "displayName": "NameNode"},
            {"name": "HDFS_CLIENT", "versionAdvertised": false}
          ]
        }
      ]
    }
  ],
  "services": [
    {
      "name": "HDFS",
      "components": [
        {"name": "NAMENODE", "hosts": ["h1", "h2"], "master": "h1",
         "secondary": "h2", "unhealthy": ["h2"], "version": "2.5.0.0-1"}
      ],
      "configs": {"hdfs-site": {"dfs.replication": "2"}}
    },
    {"name": "TEZ", "clientOnly": true}
  ]
})";

} // namespace

TEST(InMemoryClusterTest, FromDynamic) {
  auto cluster = InMemoryCluster::fromDynamic(parseJson(kClusterJson));
  const StackId target("HDP-2.6");

  EXPECT_EQ("c1", cluster->getClusterName());
  EXPECT_EQ(StackId("HDP", "2.5"), cluster->getCurrentStackVersion());
  EXPECT_EQ(target, cluster->getDesiredStackVersion());
  EXPECT_TRUE(cluster->isNameNodeHA());
  EXPECT_FALSE(cluster->isClientOnlyService("HDFS"));
  EXPECT_TRUE(cluster->isClientOnlyService("TEZ"));
  EXPECT_EQ(
      std::vector<std::string>({"NAMENODE"}), cluster->getComponents("HDFS"));

  auto hostsType = cluster->resolve("HDFS", "NAMENODE");
  ASSERT_TRUE(hostsType.has_value());
  EXPECT_EQ(std::vector<std::string>({"h1", "h2"}), hostsType->hosts);
  EXPECT_EQ("h1", hostsType->master);
  EXPECT_EQ("h2", hostsType->secondary);
  EXPECT_EQ(std::set<std::string>({"h2"}), hostsType->unhealthy);
  EXPECT_FALSE(cluster->resolve("HDFS", "DATANODE").has_value());
  EXPECT_FALSE(cluster->resolve("KAFKA", "KAFKA_BROKER").has_value());

  auto states = cluster->getHostComponents("HDFS", "NAMENODE");
  ASSERT_EQ(2, states.size());
  EXPECT_EQ("h1", states[0].host);
  EXPECT_EQ(UpgradeState::NONE, states[0].upgradeState);
  EXPECT_EQ("2.5.0.0-1", states[0].version);

  EXPECT_EQ(
      "NameNode",
      cluster->getComponentDisplayName(target, "HDFS", "NAMENODE"));
  EXPECT_EQ(
      "HDFS_CLIENT",
      cluster->getComponentDisplayName(target, "HDFS", "HDFS_CLIENT"));
  EXPECT_TRUE(cluster->isVersionAdvertised(target, "HDFS", "NAMENODE"));
  EXPECT_FALSE(cluster->isVersionAdvertised(target, "HDFS", "HDFS_CLIENT"));
  EXPECT_THROW(
      cluster->isVersionAdvertised(target, "HDFS", "DATANODE"),
      std::runtime_error);
  EXPECT_THROW(cluster->getDisplayName(target, "TEZ"), std::runtime_error);

  auto repo = cluster->findRepositoryVersion("HDP", "2.6.0.0-1");
  ASSERT_TRUE(repo.has_value());
  EXPECT_EQ(target, repo->stackId);
  EXPECT_FALSE(cluster->findRepositoryVersion("HDP", "2.7.0.0-1").has_value());

  EXPECT_EQ(
      "2", cluster->getPlaceholderValue("c1", "{{hdfs-site/dfs.replication}}"));
  EXPECT_FALSE(
      cluster->getPlaceholderValue("c1", "{{hdfs-site/dfs.missing}}")
          .has_value());
  EXPECT_FALSE(
      cluster->getPlaceholderValue("c2", "{{hdfs-site/dfs.replication}}")
          .has_value());
  EXPECT_FALSE(cluster->getPlaceholderValue("c1", "{{version}}").has_value());
}

TEST(InMemoryClusterTest, MalformedDescriptions) {
  EXPECT_THROW(
      InMemoryCluster::fromDynamic(folly::dynamic::array()),
      std::invalid_argument);
  EXPECT_THROW(
      InMemoryCluster::fromDynamic(
          parseJson(R"({"name": "c1", "currentStack": "HDP"})")),
      std::invalid_argument);
  EXPECT_THROW(
      InMemoryCluster::fromDynamic(parseJson(
          R"({"name": "c1", "currentStack": "HDP-2.5", )"
          R"("services": [{"name": "HDFS", "components": [{"hosts": []}]}]})")),
      std::invalid_argument);
}

TEST(InMemoryClusterTest, ConfigRevisions) {
  auto cluster = InMemoryCluster::fromDynamic(parseJson(kClusterJson));
  const StackId source("HDP-2.5");
  const StackId target("HDP-2.6");

  cluster->createConfigTypes(
      "c1",
      target,
      parseJson(R"({"hdfs-site": {"dfs.replication": "3"}})"),
      "admin",
      "upgrade");
  EXPECT_EQ(
      parseJson(R"({"hdfs-site": {"dfs.replication": "3"}})"),
      cluster->getLiveConfig("HDFS"));
  auto revisions = cluster->getRevisions("HDFS");
  ASSERT_EQ(2, revisions.size());
  EXPECT_EQ(source, revisions[0].stackId);
  EXPECT_EQ(target, revisions[1].stackId);
  EXPECT_EQ("admin", revisions[1].userName);
  EXPECT_EQ("upgrade", revisions[1].comment);

  // Restore the older stack's latest revision
  cluster->applyLatestConfigurations(source, "HDFS");
  EXPECT_EQ(
      parseJson(R"({"hdfs-site": {"dfs.replication": "2"}})"),
      cluster->getLiveConfig("HDFS"));
  EXPECT_THROW(
      cluster->applyLatestConfigurations(StackId("HDP-2.4"), "HDFS"),
      std::runtime_error);

  // Unknown configuration types and clusters are rejected
  EXPECT_THROW(
      cluster->createConfigTypes(
          "c1", target, parseJson(R"({"core-site": {}})"), "admin", ""),
      std::runtime_error);
  EXPECT_THROW(
      cluster->createConfigTypes(
          "c2", target, parseJson(R"({"hdfs-site": {}})"), "admin", ""),
      std::runtime_error);
}

TEST(InMemoryClusterTest, Transactions) {
  auto cluster = InMemoryCluster::fromDynamic(parseJson(kClusterJson));
  const StackId target("HDP-2.6");

  EXPECT_THROW(cluster->commitTransaction(), std::runtime_error);
  EXPECT_THROW(cluster->rollbackTransaction(), std::runtime_error);

  // Rolled back changes disappear
  cluster->beginTransaction();
  EXPECT_TRUE(cluster->inTransaction());
  EXPECT_THROW(cluster->beginTransaction(), std::runtime_error);
  cluster->setUpgradeState("HDFS", "NAMENODE", "h1", UpgradeState::IN_PROGRESS);
  cluster->setServiceDesiredRepository(
      "HDFS", RepositoryVersion{target, "2.6.0.0-1"});
  cluster->rollbackTransaction();
  EXPECT_FALSE(cluster->inTransaction());
  EXPECT_EQ(
      UpgradeState::NONE,
      cluster->getHostComponent("HDFS", "NAMENODE", "h1")->upgradeState);
  EXPECT_FALSE(cluster->getServiceDesiredRepository("HDFS").has_value());

  // Committed changes stay, and scoped transactions roll back by default
  {
    ConfigTransaction transaction(*cluster);
    cluster->setVersion("HDFS", "NAMENODE", "h2", "2.6.0.0-1");
    transaction.commit();
  }
  {
    ConfigTransaction transaction(*cluster);
    cluster->setVersion("HDFS", "NAMENODE", "h1", "2.6.0.0-1");
  }
  EXPECT_FALSE(cluster->inTransaction());
  EXPECT_EQ(
      "2.6.0.0-1",
      cluster->getHostComponent("HDFS", "NAMENODE", "h2")->version);
  EXPECT_EQ(
      "2.5.0.0-1",
      cluster->getHostComponent("HDFS", "NAMENODE", "h1")->version);

  EXPECT_THROW(
      cluster->setUpgradeState("HDFS", "NAMENODE", "h9", UpgradeState::NONE),
      std::runtime_error);
}

int
main(int argc, char* argv[]) {
  folly::init(&argc, &argv);
  FLAGS_logtostderr = true;
  testing::InitGoogleTest(&argc, argv);

  return RUN_ALL_TESTS();
}
