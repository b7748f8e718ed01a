/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "InMemoryCluster.h"

#include <stdexcept>

#include <folly/Format.h>
#include <glog/logging.h>

#include "stackupgrade/common/JsonUtils.h"

namespace stackupgrade {

InMemoryCluster::InMemoryCluster(
    const std::string& clusterName,
    const StackId& currentStack,
    const StackId& desiredStack)
    : clusterName_(clusterName),
      currentStack_(currentStack),
      desiredStack_(desiredStack) {}

std::shared_ptr<InMemoryCluster>
InMemoryCluster::fromDynamic(const folly::dynamic& description) {
  if (!description.isObject()) {
    throw std::invalid_argument("Cluster description must be an object");
  }

  const StackId currentStack(
      JsonUtils::getString(description, "currentStack"));
  const auto desiredStackStr =
      JsonUtils::getOptionalString(description, "desiredStack");
  auto cluster = std::make_shared<InMemoryCluster>(
      JsonUtils::getString(description, "name"),
      currentStack,
      desiredStackStr ? StackId(*desiredStackStr) : currentStack);
  cluster->setNameNodeHA(JsonUtils::getBool(description, "nameNodeHA", false));

  const folly::dynamic empty = folly::dynamic::array;
  const auto stacks = description.getDefault("stacks", empty);
  for (const auto& stack : stacks) {
    const StackId stackId(JsonUtils::getString(stack, "id"));
    for (const auto& service : stack.getDefault("services", empty)) {
      const auto serviceName = JsonUtils::getString(service, "name");
      cluster->addStackService(
          stackId,
          serviceName,
          JsonUtils::getOptionalString(service, "displayName")
              .value_or(serviceName),
          service.getDefault("defaults", folly::dynamic::object));
      for (const auto& component : service.getDefault("components", empty)) {
        const auto componentName = JsonUtils::getString(component, "name");
        cluster->addStackComponent(
            stackId,
            serviceName,
            componentName,
            JsonUtils::getOptionalString(component, "displayName")
                .value_or(componentName),
            JsonUtils::getBool(component, "versionAdvertised", true));
      }
    }
  }

  for (const auto& repo : description.getDefault("repositoryVersions", empty)) {
    cluster->addRepositoryVersion(RepositoryVersion{
        StackId(JsonUtils::getString(repo, "stack")),
        JsonUtils::getString(repo, "version")});
  }

  for (const auto& service : description.getDefault("services", empty)) {
    const auto serviceName = JsonUtils::getString(service, "name");
    cluster->addService(
        serviceName, JsonUtils::getBool(service, "clientOnly", false));
    for (const auto& component : service.getDefault("components", empty)) {
      HostsType hostsType;
      hostsType.hosts = JsonUtils::getStringList(component, "hosts");
      hostsType.master = JsonUtils::getOptionalString(component, "master");
      hostsType.secondary =
          JsonUtils::getOptionalString(component, "secondary");
      for (const auto& host :
           JsonUtils::getStringList(component, "unhealthy")) {
        hostsType.unhealthy.insert(host);
      }
      cluster->addComponent(
          serviceName,
          JsonUtils::getString(component, "name"),
          hostsType,
          JsonUtils::getOptionalString(component, "version").value_or(""));
    }
    cluster->setLiveConfig(
        serviceName, service.getDefault("configs", folly::dynamic::object));
  }

  return cluster;
}

// ---- Setup ----

void
InMemoryCluster::addService(const std::string& serviceName, bool clientOnly) {
  Service service;
  service.clientOnly = clientOnly;
  services_[serviceName] = std::move(service);
}

void
InMemoryCluster::addComponent(
    const std::string& serviceName,
    const std::string& componentName,
    const HostsType& hostsType,
    const std::string& version) {
  auto iter = services_.find(serviceName);
  if (iter == services_.end()) {
    throw std::invalid_argument(
        folly::sformat("Unknown service {}", serviceName));
  }
  Service& service = iter->second;

  Component component;
  component.hostsType = hostsType;
  for (const auto& host : hostsType.hosts) {
    component.hostStates[host] =
        HostComponentState{host, UpgradeState::NONE, version};
  }
  if (!service.components.count(componentName)) {
    service.componentOrder.push_back(componentName);
  }
  service.components[componentName] = std::move(component);
}

void
InMemoryCluster::setLiveConfig(
    const std::string& serviceName, const folly::dynamic& configsByType) {
  auto iter = services_.find(serviceName);
  if (iter == services_.end()) {
    throw std::invalid_argument(
        folly::sformat("Unknown service {}", serviceName));
  }
  iter->second.liveConfigs = configsByType;
  iter->second.revisions.push_back(
      ConfigRevision{currentStack_, configsByType, "", ""});
}

void
InMemoryCluster::addStackService(
    const StackId& stackId,
    const std::string& serviceName,
    const std::string& displayName,
    const folly::dynamic& defaults) {
  StackService service;
  service.displayName = displayName;
  service.defaults = defaults;
  stacks_[stackId.getStackId()][serviceName] = std::move(service);
}

void
InMemoryCluster::addStackComponent(
    const StackId& stackId,
    const std::string& serviceName,
    const std::string& componentName,
    const std::string& displayName,
    bool versionAdvertised) {
  auto stackIter = stacks_.find(stackId.getStackId());
  if (stackIter == stacks_.end() || !stackIter->second.count(serviceName)) {
    throw std::invalid_argument(folly::sformat(
        "Unknown service {} in stack {}", serviceName, stackId.getStackId()));
  }
  stackIter->second[serviceName].components[componentName] =
      StackComponent{displayName, versionAdvertised};
}

void
InMemoryCluster::addRepositoryVersion(const RepositoryVersion& version) {
  repositoryVersions_.push_back(version);
}

void
InMemoryCluster::addUpgradePack(
    const StackId& sourceStack, std::shared_ptr<const UpgradePack> pack) {
  const auto name = pack->getName();
  packs_[sourceStack.getStackId()][name] = std::move(pack);
}

// ---- Inspection ----

std::vector<InMemoryCluster::ConfigRevision>
InMemoryCluster::getRevisions(const std::string& serviceName) const {
  return getService(serviceName).revisions;
}

std::optional<ClusterStore::HostComponentState>
InMemoryCluster::getHostComponent(
    const std::string& serviceName,
    const std::string& componentName,
    const std::string& host) const {
  const Service& service = getService(serviceName);
  auto componentIter = service.components.find(componentName);
  if (componentIter == service.components.end()) {
    return std::nullopt;
  }
  auto hostIter = componentIter->second.hostStates.find(host);
  if (hostIter == componentIter->second.hostStates.end()) {
    return std::nullopt;
  }
  return hostIter->second;
}

std::optional<RepositoryVersion>
InMemoryCluster::getServiceDesiredRepository(
    const std::string& serviceName) const {
  return getService(serviceName).desiredRepository;
}

std::optional<RepositoryVersion>
InMemoryCluster::getComponentDesiredRepository(
    const std::string& serviceName, const std::string& componentName) const {
  const Service& service = getService(serviceName);
  auto iter = service.components.find(componentName);
  if (iter == service.components.end()) {
    return std::nullopt;
  }
  return iter->second.desiredRepository;
}

// ---- ClusterStore ----

std::string
InMemoryCluster::getClusterName() const {
  return clusterName_;
}

StackId
InMemoryCluster::getCurrentStackVersion() const {
  return currentStack_;
}

StackId
InMemoryCluster::getDesiredStackVersion() const {
  return desiredStack_;
}

bool
InMemoryCluster::isClientOnlyService(const std::string& serviceName) const {
  return getService(serviceName).clientOnly;
}

std::vector<std::string>
InMemoryCluster::getComponents(const std::string& serviceName) const {
  return getService(serviceName).componentOrder;
}

std::vector<ClusterStore::HostComponentState>
InMemoryCluster::getHostComponents(
    const std::string& serviceName, const std::string& componentName) const {
  const Service& service = getService(serviceName);
  auto iter = service.components.find(componentName);
  if (iter == service.components.end()) {
    throw std::runtime_error(folly::sformat(
        "Component {}/{} is not deployed", serviceName, componentName));
  }
  std::vector<HostComponentState> states;
  for (const auto& host : iter->second.hostsType.hosts) {
    states.push_back(iter->second.hostStates.at(host));
  }
  return states;
}

void
InMemoryCluster::setUpgradeState(
    const std::string& serviceName,
    const std::string& componentName,
    const std::string& host,
    UpgradeState state) {
  auto& hostStates = getComponent(serviceName, componentName).hostStates;
  auto iter = hostStates.find(host);
  if (iter == hostStates.end()) {
    throw std::runtime_error(folly::sformat(
        "Component {}/{} is not deployed on {}",
        serviceName,
        componentName,
        host));
  }
  iter->second.upgradeState = state;
}

void
InMemoryCluster::setVersion(
    const std::string& serviceName,
    const std::string& componentName,
    const std::string& host,
    const std::string& version) {
  auto& hostStates = getComponent(serviceName, componentName).hostStates;
  auto iter = hostStates.find(host);
  if (iter == hostStates.end()) {
    throw std::runtime_error(folly::sformat(
        "Component {}/{} is not deployed on {}",
        serviceName,
        componentName,
        host));
  }
  iter->second.version = version;
}

void
InMemoryCluster::setServiceDesiredRepository(
    const std::string& serviceName, const RepositoryVersion& version) {
  getService(serviceName).desiredRepository = version;
}

void
InMemoryCluster::setComponentDesiredRepository(
    const std::string& serviceName,
    const std::string& componentName,
    const RepositoryVersion& version) {
  getComponent(serviceName, componentName).desiredRepository = version;
}

// ---- ConfigStore ----

folly::dynamic
InMemoryCluster::getDefaultProperties(
    const StackId& stackId, const std::string& serviceName) const {
  return getStackService(stackId, serviceName).defaults;
}

folly::dynamic
InMemoryCluster::getLiveConfig(const std::string& serviceName) const {
  return getService(serviceName).liveConfigs;
}

void
InMemoryCluster::applyLatestConfigurations(
    const StackId& stackId, const std::string& serviceName) {
  Service& service = getService(serviceName);
  for (auto iter = service.revisions.rbegin(); iter != service.revisions.rend();
       ++iter) {
    if (iter->stackId == stackId) {
      service.liveConfigs = iter->configs;
      return;
    }
  }
  throw std::runtime_error(folly::sformat(
      "No configurations of {} exist for stack {}",
      serviceName,
      stackId.getStackId()));
}

void
InMemoryCluster::createConfigTypes(
    const std::string& clusterName,
    const StackId& stackId,
    const folly::dynamic& configsByType,
    const std::string& userName,
    const std::string& comment) {
  if (clusterName != clusterName_) {
    throw std::runtime_error(folly::sformat("Unknown cluster {}", clusterName));
  }

  // Split the configurations by owning service
  std::map<std::string, folly::dynamic> configsByService;
  for (const auto& pair : configsByType.items()) {
    const auto configType = pair.first.asString();
    auto serviceName = findServiceForConfigType(stackId, configType);
    if (!serviceName) {
      throw std::runtime_error(folly::sformat(
          "No service owns configuration type {} in stack {}",
          configType,
          stackId.getStackId()));
    }
    auto iter = configsByService.find(*serviceName);
    if (iter == configsByService.end()) {
      iter = configsByService
                 .emplace(*serviceName, folly::dynamic(folly::dynamic::object))
                 .first;
    }
    iter->second[configType] = pair.second;
  }

  for (const auto& entry : configsByService) {
    Service& service = getService(entry.first);
    // Whole property sets are replaced, other types stay live
    for (const auto& pair : entry.second.items()) {
      service.liveConfigs[pair.first] = pair.second;
    }
    service.revisions.push_back(
        ConfigRevision{stackId, service.liveConfigs, userName, comment});
    VLOG(2) << folly::sformat(
        "Created {} configurations of {} for stack {}",
        entry.second.size(),
        entry.first,
        stackId.getStackId());
  }
}

std::optional<std::string>
InMemoryCluster::getPlaceholderValue(
    const std::string& clusterName, const std::string& token) const {
  if (clusterName != clusterName_ || token.size() < 4) {
    return std::nullopt;
  }

  // "{{type/property}}"
  const std::string inner = token.substr(2, token.size() - 4);
  auto pos = inner.find('/');
  if (pos == std::string::npos) {
    return std::nullopt;
  }
  const std::string configType = inner.substr(0, pos);
  const std::string property = inner.substr(pos + 1);

  for (const auto& entry : services_) {
    auto properties = entry.second.liveConfigs.get_ptr(configType);
    if (properties == nullptr || !properties->isObject()) {
      continue;
    }
    auto value = properties->get_ptr(property);
    if (value != nullptr && value->isString()) {
      return value->getString();
    }
  }
  return std::nullopt;
}

void
InMemoryCluster::beginTransaction() {
  if (snapshot_) {
    throw std::runtime_error("A transaction is already open");
  }
  snapshot_ = services_;
}

void
InMemoryCluster::commitTransaction() {
  if (!snapshot_) {
    throw std::runtime_error("No transaction is open");
  }
  snapshot_.reset();
}

void
InMemoryCluster::rollbackTransaction() {
  if (!snapshot_) {
    throw std::runtime_error("No transaction is open");
  }
  services_ = std::move(*snapshot_);
  snapshot_.reset();
  LOG(INFO) << "Rolled back changes to cluster " << clusterName_;
}

// ---- HostResolver ----

std::optional<HostsType>
InMemoryCluster::resolve(
    const std::string& serviceName, const std::string& componentName) const {
  auto serviceIter = services_.find(serviceName);
  if (serviceIter == services_.end()) {
    return std::nullopt;
  }
  auto componentIter = serviceIter->second.components.find(componentName);
  if (componentIter == serviceIter->second.components.end()) {
    return std::nullopt;
  }
  return componentIter->second.hostsType;
}

bool
InMemoryCluster::isNameNodeHA() const {
  return nameNodeHA_;
}

// ---- MetadataCatalog ----

std::string
InMemoryCluster::getDisplayName(
    const StackId& stackId, const std::string& serviceName) const {
  return getStackService(stackId, serviceName).displayName;
}

std::string
InMemoryCluster::getComponentDisplayName(
    const StackId& stackId,
    const std::string& serviceName,
    const std::string& componentName) const {
  const auto& service = getStackService(stackId, serviceName);
  auto iter = service.components.find(componentName);
  if (iter == service.components.end()) {
    throw std::runtime_error(folly::sformat(
        "Component {}/{} is not part of stack {}",
        serviceName,
        componentName,
        stackId.getStackId()));
  }
  return iter->second.displayName;
}

bool
InMemoryCluster::isVersionAdvertised(
    const StackId& stackId,
    const std::string& serviceName,
    const std::string& componentName) const {
  const auto& service = getStackService(stackId, serviceName);
  auto iter = service.components.find(componentName);
  if (iter == service.components.end()) {
    throw std::runtime_error(folly::sformat(
        "Component {}/{} is not part of stack {}",
        serviceName,
        componentName,
        stackId.getStackId()));
  }
  return iter->second.versionAdvertised;
}

std::optional<RepositoryVersion>
InMemoryCluster::findRepositoryVersion(
    const std::string& stackName, const std::string& version) const {
  for (const auto& repo : repositoryVersions_) {
    if (repo.stackId.getStackName() == stackName && repo.version == version) {
      return repo;
    }
  }
  return std::nullopt;
}

std::map<std::string, std::shared_ptr<const UpgradePack>>
InMemoryCluster::getUpgradePacks(const StackId& stackId) const {
  auto iter = packs_.find(stackId.getStackId());
  if (iter == packs_.end()) {
    return {};
  }
  return iter->second;
}

// ---- Lookups ----

const InMemoryCluster::Service&
InMemoryCluster::getService(const std::string& serviceName) const {
  auto iter = services_.find(serviceName);
  if (iter == services_.end()) {
    throw std::runtime_error(folly::sformat(
        "Service {} is not deployed in cluster {}", serviceName, clusterName_));
  }
  return iter->second;
}

InMemoryCluster::Service&
InMemoryCluster::getService(const std::string& serviceName) {
  auto iter = services_.find(serviceName);
  if (iter == services_.end()) {
    throw std::runtime_error(folly::sformat(
        "Service {} is not deployed in cluster {}", serviceName, clusterName_));
  }
  return iter->second;
}

InMemoryCluster::Component&
InMemoryCluster::getComponent(
    const std::string& serviceName, const std::string& componentName) {
  Service& service = getService(serviceName);
  auto iter = service.components.find(componentName);
  if (iter == service.components.end()) {
    throw std::runtime_error(folly::sformat(
        "Component {}/{} is not deployed", serviceName, componentName));
  }
  return iter->second;
}

const InMemoryCluster::StackService&
InMemoryCluster::getStackService(
    const StackId& stackId, const std::string& serviceName) const {
  auto stackIter = stacks_.find(stackId.getStackId());
  if (stackIter == stacks_.end()) {
    throw std::runtime_error(
        folly::sformat("Unknown stack {}", stackId.getStackId()));
  }
  auto serviceIter = stackIter->second.find(serviceName);
  if (serviceIter == stackIter->second.end()) {
    throw std::runtime_error(folly::sformat(
        "Service {} is not part of stack {}",
        serviceName,
        stackId.getStackId()));
  }
  return serviceIter->second;
}

std::optional<std::string>
InMemoryCluster::findServiceForConfigType(
    const StackId& stackId, const std::string& configType) const {
  // Stack defaults first, then live configurations
  auto stackIter = stacks_.find(stackId.getStackId());
  if (stackIter != stacks_.end()) {
    for (const auto& entry : stackIter->second) {
      if (entry.second.defaults.isObject() &&
          entry.second.defaults.count(configType)) {
        return entry.first;
      }
    }
  }
  for (const auto& entry : services_) {
    if (entry.second.liveConfigs.count(configType)) {
      return entry.first;
    }
  }
  return std::nullopt;
}

} // namespace stackupgrade
