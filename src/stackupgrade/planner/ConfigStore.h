/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <string>

#include <folly/dynamic.h>

#include "UpgradeTypes.h"

namespace stackupgrade {

/**
 * Configuration persistence.
 *
 * Configuration sets are folly::dynamic objects keyed by configuration type,
 * each holding an object of property name to value. Default values may be
 * null when a stack declares a property without a default.
 *
 * Implementations throw std::runtime_error (or a subclass) on failure.
 */
class ConfigStore {
 public:
  virtual ~ConfigStore() {}

  /** Returns the default properties a stack ships for a service. */
  virtual folly::dynamic getDefaultProperties(
      const StackId& stackId, const std::string& serviceName) const = 0;

  /** Returns the live (desired) configuration of a service, by type. */
  virtual folly::dynamic getLiveConfig(
      const std::string& serviceName) const = 0;

  /**
   * Make the latest configurations created for the given stack the desired
   * configurations of a service.
   */
  virtual void applyLatestConfigurations(
      const StackId& stackId, const std::string& serviceName) = 0;

  /** Create a new configuration revision for a stack. */
  virtual void createConfigTypes(
      const std::string& clusterName,
      const StackId& stackId,
      const folly::dynamic& configsByType,
      const std::string& userName,
      const std::string& comment) = 0;

  /**
   * Look up a placeholder token (e.g. "{{hdfs-site/dfs.foo}}") in the
   * cluster's desired configurations.
   */
  virtual std::optional<std::string> getPlaceholderValue(
      const std::string& clusterName, const std::string& token) const = 0;

  /** \{ */
  /** Transaction control. Writes made inside a transaction are atomic. */
  virtual void beginTransaction() = 0;
  virtual void commitTransaction() = 0;
  virtual void rollbackTransaction() = 0;
  /** \} */
};

/**
 * Scoped ConfigStore transaction. Rolls back on destruction unless commit()
 * was called.
 */
class ConfigTransaction {
 public:
  explicit ConfigTransaction(ConfigStore& store) : store_(store) {
    store_.beginTransaction();
  }

  ~ConfigTransaction();

  ConfigTransaction(const ConfigTransaction&) = delete;
  ConfigTransaction& operator=(const ConfigTransaction&) = delete;

  /** Commit the transaction. */
  void commit();

 private:
  ConfigStore& store_;
  bool done_{false};
};

} // namespace stackupgrade
