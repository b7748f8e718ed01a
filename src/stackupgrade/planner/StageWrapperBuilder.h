/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "UpgradeTypes.h"

namespace stackupgrade {

class UpgradeContext;

/**
 * Turns the service components of one grouping into ordered stages.
 *
 * One builder instance is created per grouping and planning call. The
 * planner calls add() for every host group it resolves, then build() once.
 * The order of the returned stages is entirely up to the builder.
 */
class StageWrapperBuilder {
 public:
  virtual ~StageWrapperBuilder() {}

  /**
   * Add a component's tasks for a set of hosts.
   * @param context the upgrade context
   * @param hostsType the resolved hosts
   * @param serviceName the service name
   * @param isClientOnly whether the service only has client components
   * @param pc the component and its tasks
   * @param params extra parameters for every task, if any
   */
  virtual void add(
      const UpgradeContext& context,
      const HostsType& hostsType,
      const std::string& serviceName,
      bool isClientOnly,
      const ProcessingComponent& pc,
      const std::optional<std::map<std::string, std::string>>& params) = 0;

  /** Materialize the ordered stages. */
  virtual std::vector<StageWrapper> build(const UpgradeContext& context) = 0;
};

/**
 * Builder for ordinary groupings.
 *
 * Each task becomes its own stage. Under a rolling upgrade, stop/start/restart
 * tasks are split into one stage per host so that hosts are processed one at
 * a time; otherwise a stage covers every host. When service checks are
 * enabled, a final stage checks every non-client service that was restarted
 * or started.
 */
class DefaultStageWrapperBuilder final : public StageWrapperBuilder {
 public:
  /**
   * Constructor.
   * @param groupName the grouping name (for logging)
   * @param performServiceCheck whether to append service checks
   */
  DefaultStageWrapperBuilder(
      const std::string& groupName, bool performServiceCheck)
      : groupName_(groupName), performServiceCheck_(performServiceCheck) {}

  void add(
      const UpgradeContext& context,
      const HostsType& hostsType,
      const std::string& serviceName,
      bool isClientOnly,
      const ProcessingComponent& pc,
      const std::optional<std::map<std::string, std::string>>& params)
      override;

  std::vector<StageWrapper> build(const UpgradeContext& context) override;

 private:
  /** The grouping name. */
  std::string groupName_;
  /** Whether to append service checks. */
  bool performServiceCheck_;
  /** Stages added so far. */
  std::vector<StageWrapper> stages_;
  /** Services to check, in the order they were first added. */
  std::vector<std::string> servicesToCheck_;
};

/** Builder for service check groupings: one check stage per service. */
class ServiceCheckStageWrapperBuilder final : public StageWrapperBuilder {
 public:
  void add(
      const UpgradeContext& context,
      const HostsType& hostsType,
      const std::string& serviceName,
      bool isClientOnly,
      const ProcessingComponent& pc,
      const std::optional<std::map<std::string, std::string>>& params)
      override;

  std::vector<StageWrapper> build(const UpgradeContext& context) override;

 private:
  /** Services to check, in the order they were first added. */
  std::vector<std::string> services_;
};

} // namespace stackupgrade
