/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "UpgradeContext.h"

#include <algorithm>
#include <stdexcept>

#include <folly/Format.h>
#include <glog/logging.h>

namespace stackupgrade {

UpgradeContext::UpgradeContext(
    std::shared_ptr<ClusterStore> cluster,
    std::shared_ptr<HostResolver> resolver,
    Direction direction,
    UpgradeType type,
    const RepositoryVersion& repositoryVersion)
    : cluster_(std::move(cluster)),
      resolver_(std::move(resolver)),
      direction_(direction),
      type_(type),
      repositoryVersion_(repositoryVersion) {
  CHECK(cluster_) << "UpgradeContext requires a cluster";
  CHECK(resolver_) << "UpgradeContext requires a host resolver";
}

bool
UpgradeContext::isServiceSupported(const std::string& serviceName) const {
  return serviceRepositories_.count(serviceName) > 0;
}

const RepositoryVersion&
UpgradeContext::getSourceRepositoryVersion(
    const std::string& serviceName) const {
  auto iter = serviceRepositories_.find(serviceName);
  if (iter == serviceRepositories_.end()) {
    throw std::invalid_argument(folly::sformat(
        "Service {} is not part of this {}",
        serviceName,
        DirectionText::text(direction_, false)));
  }
  return iter->second.first;
}

const RepositoryVersion&
UpgradeContext::getTargetRepositoryVersion(
    const std::string& serviceName) const {
  auto iter = serviceRepositories_.find(serviceName);
  if (iter == serviceRepositories_.end()) {
    throw std::invalid_argument(folly::sformat(
        "Service {} is not part of this {}",
        serviceName,
        DirectionText::text(direction_, false)));
  }
  return iter->second.second;
}

bool
UpgradeContext::isScoped(UpgradeScope scope) const {
  return scope == UpgradeScope::ANY || scope == scope_;
}

void
UpgradeContext::addService(
    const std::string& serviceName,
    const RepositoryVersion& source,
    const RepositoryVersion& target) {
  if (!isServiceSupported(serviceName)) {
    supportedServices_.push_back(serviceName);
  }
  serviceRepositories_[serviceName] = std::make_pair(source, target);
}

} // namespace stackupgrade
