/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace stackupgrade {

/**
 * Planning could not start or could not complete: no upgrade pack matches the
 * requested stack/type/version, several packs match ambiguously, or a
 * collaborator failed to provide cluster metadata.
 */
class UpgradePlanningError : public std::runtime_error {
 public:
  explicit UpgradePlanningError(const std::string& what)
      : std::runtime_error(what) {}
};

/**
 * Configuration reconciliation failed. No configuration revision created by
 * the failed call is left visible.
 */
class ConfigMergeError : public std::runtime_error {
 public:
  explicit ConfigMergeError(const std::string& what)
      : std::runtime_error(what) {}
};

} // namespace stackupgrade
