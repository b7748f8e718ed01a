/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <vector>

#include <folly/dynamic.h>

#include "ConfigStore.h"
#include "UpgradeContext.h"

namespace stackupgrade {

/**
 * Reconciles service configurations when an upgrade or downgrade crosses a
 * stack boundary.
 *
 * On upgrade, the new stack's defaults are merged with the live configuration
 * so that operator customizations survive while untouched properties pick up
 * the new defaults. On downgrade, the latest configurations of the older
 * stack are restored. Services whose source and target stacks are equal are
 * left alone.
 */
class ConfigMerger {
 public:
  /** How cross-stack downgrades of several services are handled. */
  enum class DowngradePolicy {
    /** Restore configurations of every cross-stack service. */
    REVERT_ALL_SERVICES,
    /**
     * Stop after restoring the first cross-stack service. Later services are
     * not reconciled at all.
     */
    REVERT_FIRST_SERVICE_ONLY,
  };

  /** Reconciliation options. */
  struct Options {
    /** The downgrade policy. */
    DowngradePolicy downgradePolicy{DowngradePolicy::REVERT_ALL_SERVICES};
  };

  /**
   * Constructor.
   * @param configStore the configuration store
   * @param options reconciliation options
   */
  ConfigMerger(ConfigStore& configStore, Options options)
      : configStore_(configStore), options_(options) {}

  /** Constructor using the default options. */
  explicit ConfigMerger(ConfigStore& configStore)
      : ConfigMerger(configStore, Options()) {}

  /**
   * Reconcile the configurations of every participating service inside a
   * single store transaction.
   *
   * Throws ConfigMergeError on any failure; the transaction is rolled back.
   */
  void reconcileConfigurations(const UpgradeContext& context);

  /**
   * Same as reconcileConfigurations(), but runs inside a transaction owned by
   * the caller.
   *
   * Throws ConfigMergeError on any failure.
   */
  void reconcileConfigurationsInTransaction(const UpgradeContext& context);

  /**
   * Three-way merge of one service's configurations.
   *
   * All arguments are objects keyed by configuration type, each holding an
   * object of property name to value.
   *
   * - Types without new defaults keep their live properties unchanged.
   * - Null new defaults are dropped.
   * - A live value replaces a differing new default only if it also differs
   *   from the old default (i.e. it was customized).
   * - Live properties unknown to the new defaults are kept.
   * - Properties with an old default that are absent from the live
   *   configuration are not reintroduced.
   * - Types that only exist in the new defaults are included.
   *
   * @param oldDefaults the defaults of the source stack
   * @param newDefaults the defaults of the target stack
   * @param liveConfigs the live configuration
   */
  static folly::dynamic mergeConfigurations(
      const folly::dynamic& oldDefaults,
      const folly::dynamic& newDefaults,
      const folly::dynamic& liveConfigs);

 private:
  /** A store write computed by the reconciliation. */
  struct PendingWrite {
    /** The service name. */
    std::string serviceName;
    /** The target stack. */
    StackId targetStack;
    /** True to restore the target stack's latest configurations. */
    bool revert;
    /** The configurations to create (when not reverting). */
    folly::dynamic configs;
  };

  /** Compute all writes for the context without touching the store. */
  std::vector<PendingWrite> computeWrites(const UpgradeContext& context) const;

  /** Apply computed writes to the store. */
  void applyWrites(
      const UpgradeContext& context, const std::vector<PendingWrite>& writes);

  ConfigStore& configStore_;
  Options options_;
};

} // namespace stackupgrade
