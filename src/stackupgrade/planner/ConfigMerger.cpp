/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "ConfigMerger.h"

#include <folly/Format.h>
#include <folly/String.h>
#include <glog/logging.h>

#include "UpgradeErrors.h"
#include "stackupgrade/common/Consts.h"

namespace {

// Copy a property object without its null values
folly::dynamic
withoutNullValues(const folly::dynamic& properties) {
  folly::dynamic result = folly::dynamic::object;
  for (const auto& pair : properties.items()) {
    if (!pair.second.isNull()) {
      result[pair.first] = pair.second;
    }
  }
  return result;
}

} // namespace

namespace stackupgrade {

folly::dynamic
ConfigMerger::mergeConfigurations(
    const folly::dynamic& oldDefaults,
    const folly::dynamic& newDefaults,
    const folly::dynamic& liveConfigs) {
  const folly::dynamic empty = folly::dynamic::object;

  // Start from the new stack's defaults; nulls are defaults that no longer
  // exist and must not be reintroduced
  folly::dynamic merged = folly::dynamic::object;
  if (newDefaults.isObject()) {
    for (const auto& typePair : newDefaults.items()) {
      if (typePair.second.isObject()) {
        merged[typePair.first] = withoutNullValues(typePair.second);
      }
    }
  }

  if (!liveConfigs.isObject()) {
    return merged;
  }

  for (const auto& typePair : liveConfigs.items()) {
    const std::string configType = typePair.first.asString();
    const folly::dynamic& liveProperties = typePair.second;

    const folly::dynamic* newProperties =
        newDefaults.isObject() ? newDefaults.get_ptr(configType) : nullptr;
    if (newProperties == nullptr || !newProperties->isObject()) {
      // The new stack doesn't know this type, carry it over unchanged
      merged[configType] = liveProperties;
      continue;
    }

    const folly::dynamic* oldPtr =
        oldDefaults.isObject() ? oldDefaults.get_ptr(configType) : nullptr;
    const folly::dynamic& oldProperties =
        (oldPtr != nullptr && oldPtr->isObject()) ? *oldPtr : empty;

    folly::dynamic& mergedProperties = merged[configType];
    for (const auto& propertyPair : liveProperties.items()) {
      const folly::dynamic& key = propertyPair.first;
      const folly::dynamic& liveValue = propertyPair.second;

      const folly::dynamic* newValue = mergedProperties.get_ptr(key);
      if (newValue == nullptr) {
        mergedProperties[key] = liveValue;
        continue;
      }
      if (*newValue == liveValue) {
        continue;
      }

      // The new default differs from the live value; keep the live value only
      // if it was customized away from the old default
      const folly::dynamic* oldValue = oldProperties.get_ptr(key);
      if (oldValue == nullptr || *oldValue != liveValue) {
        mergedProperties[key] = liveValue;
      }
    }

    // A property with an old default that isn't live was removed from this
    // cluster on purpose
    for (const auto& oldPair : oldProperties.items()) {
      const folly::dynamic& key = oldPair.first;
      if (liveProperties.get_ptr(key) == nullptr &&
          mergedProperties.get_ptr(key) != nullptr) {
        LOG(INFO) << folly::sformat(
            "The property {}/{} has a default in the source stack but is not "
            "part of the current configurations and will not be merged",
            configType,
            key.asString());
        mergedProperties.erase(key);
      }
    }
  }

  return merged;
}

void
ConfigMerger::reconcileConfigurations(const UpgradeContext& context) {
  try {
    ConfigTransaction transaction(configStore_);
    reconcileConfigurationsInTransaction(context);
    transaction.commit();
  } catch (const ConfigMergeError&) {
    throw;
  } catch (const std::exception& ex) {
    throw ConfigMergeError(folly::sformat(
        "Unable to reconcile configurations: {}", ex.what()));
  }
}

void
ConfigMerger::reconcileConfigurationsInTransaction(
    const UpgradeContext& context) {
  std::vector<PendingWrite> writes;
  try {
    writes = computeWrites(context);
  } catch (const std::exception& ex) {
    throw ConfigMergeError(folly::sformat(
        "Unable to compute configurations for the {}: {}",
        DirectionText::text(context.getDirection(), false),
        ex.what()));
  }

  try {
    applyWrites(context, writes);
  } catch (const std::exception& ex) {
    throw ConfigMergeError(folly::sformat(
        "Unable to store configurations for the {}: {}",
        DirectionText::text(context.getDirection(), false),
        ex.what()));
  }
}

std::vector<ConfigMerger::PendingWrite>
ConfigMerger::computeWrites(const UpgradeContext& context) const {
  const Direction direction = context.getDirection();
  std::vector<PendingWrite> writes;

  for (const auto& serviceName : context.getSupportedServices()) {
    const StackId sourceStack =
        context.getSourceRepositoryVersion(serviceName).stackId;
    const StackId targetStack =
        context.getTargetRepositoryVersion(serviceName).stackId;

    // Only work with configurations when crossing stacks
    if (sourceStack == targetStack) {
      LOG(INFO) << folly::sformat(
          "The {} {} {} will not change stack configurations for {} since the "
          "source and target are both {}",
          DirectionText::text(direction, false),
          DirectionText::preposition(direction),
          context.getRepositoryVersion().version,
          serviceName,
          targetStack.getStackId());
      continue;
    }

    // Downgrades restore the older stack's configurations
    if (direction == Direction::DOWNGRADE) {
      writes.push_back(
          PendingWrite{serviceName, targetStack, true, folly::dynamic()});
      if (options_.downgradePolicy ==
          DowngradePolicy::REVERT_FIRST_SERVICE_ONLY) {
        break;
      }
      continue;
    }

    const folly::dynamic oldDefaults =
        configStore_.getDefaultProperties(sourceStack, serviceName);
    const folly::dynamic newDefaults =
        configStore_.getDefaultProperties(targetStack, serviceName);
    const folly::dynamic liveConfigs = configStore_.getLiveConfig(serviceName);

    writes.push_back(PendingWrite{
        serviceName,
        targetStack,
        false,
        mergeConfigurations(oldDefaults, newDefaults, liveConfigs)});
  }

  return writes;
}

void
ConfigMerger::applyWrites(
    const UpgradeContext& context, const std::vector<PendingWrite>& writes) {
  const std::string clusterName = context.getCluster().getClusterName();

  for (const auto& write : writes) {
    if (write.revert) {
      LOG(INFO) << folly::sformat(
          "Restoring the latest {} configurations for {}",
          write.targetStack.getStackId(),
          write.serviceName);
      configStore_.applyLatestConfigurations(
          write.targetStack, write.serviceName);
      continue;
    }

    std::vector<std::string> configTypes;
    for (const auto& key : write.configs.keys()) {
      configTypes.push_back(key.asString());
    }
    LOG(INFO) << folly::sformat(
        "The upgrade will create the following configurations for stack {}: {}",
        write.targetStack.getStackId(),
        folly::join(",", configTypes));
    configStore_.createConfigTypes(
        clusterName,
        write.targetStack,
        write.configs,
        context.getUserName(),
        UpgradeConsts::kUpgradeConfigComment);
  }
}

} // namespace stackupgrade
