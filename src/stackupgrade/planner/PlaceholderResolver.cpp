/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "PlaceholderResolver.h"

#include <algorithm>
#include <regex>
#include <string>
#include <unordered_map>

#include <folly/MapUtil.h>
#include <folly/String.h>
#include <glog/logging.h>

namespace {
// Matches placeholder tokens such as {{hosts.all}} or {{hdfs-site/foo}}
const std::regex kPlaceholderRegex{"\\{\\{.*?\\}\\}"};

// In-place replacement of every occurrence; replaced text is not rescanned
void
replaceAll(
    std::string& s, const std::string& find, const std::string& replace) {
  size_t pos = 0;
  while ((pos = s.find(find, pos)) != std::string::npos) {
    s.replace(pos, find.length(), replace);
    pos += replace.length();
  }
}
} // namespace

namespace stackupgrade {

std::vector<std::string>
PlaceholderResolver::findTokens(const std::string& source) {
  std::vector<std::string> tokens;
  auto begin =
      std::sregex_iterator(source.begin(), source.end(), kPlaceholderRegex);
  for (auto iter = begin; iter != std::sregex_iterator(); ++iter) {
    auto token = iter->str();
    if (std::find(tokens.begin(), tokens.end(), token) == tokens.end()) {
      tokens.push_back(token);
    }
  }
  return tokens;
}

std::string
PlaceholderResolver::tokenReplace(
    const std::string& source,
    const std::optional<std::string>& serviceName,
    const std::optional<std::string>& componentName) const {
  std::string result = source;
  for (const auto& token : findTokens(source)) {
    auto value = resolveToken(token, serviceName, componentName);
    if (value) {
      replaceAll(result, token, *value);
    } else {
      VLOG(4) << "Leaving unresolved placeholder " << token;
    }
  }
  return result;
}

PlaceholderResolver::Placeholder
PlaceholderResolver::findPlaceholder(const std::string& token) {
  static const std::unordered_map<std::string, Placeholder> kPlaceholders{
      {"{{hosts.all}}", Placeholder::HOST_ALL},
      {"{{hosts.master}}", Placeholder::HOST_MASTER},
      {"{{version}}", Placeholder::VERSION},
      {"{{direction.text}}", Placeholder::DIRECTION_TEXT},
      {"{{direction.text.proper}}", Placeholder::DIRECTION_TEXT_PROPER},
      {"{{direction.past}}", Placeholder::DIRECTION_PAST},
      {"{{direction.past.proper}}", Placeholder::DIRECTION_PAST_PROPER},
      {"{{direction.plural}}", Placeholder::DIRECTION_PLURAL},
      {"{{direction.plural.proper}}", Placeholder::DIRECTION_PLURAL_PROPER},
      {"{{direction.verb}}", Placeholder::DIRECTION_VERB},
      {"{{direction.verb.proper}}", Placeholder::DIRECTION_VERB_PROPER},
  };
  return folly::get_default(kPlaceholders, token, Placeholder::OTHER);
}

std::optional<std::string>
PlaceholderResolver::resolveToken(
    const std::string& token,
    const std::optional<std::string>& serviceName,
    const std::optional<std::string>& componentName) const {
  const Placeholder p = findPlaceholder(token);
  const Direction direction = context_.getDirection();

  switch (p) {
    case Placeholder::HOST_ALL:
    case Placeholder::HOST_MASTER: {
      if (!serviceName || !componentName) {
        return std::nullopt;
      }
      auto hostsType =
          context_.getResolver().resolve(*serviceName, *componentName);
      if (!hostsType) {
        return std::nullopt;
      }
      if (p == Placeholder::HOST_ALL) {
        return folly::join(", ", hostsType->hosts);
      }
      return hostsType->master;
    }
    case Placeholder::VERSION:
      return context_.getRepositoryVersion().version;
    case Placeholder::DIRECTION_TEXT:
    case Placeholder::DIRECTION_TEXT_PROPER:
      return DirectionText::text(
          direction, p == Placeholder::DIRECTION_TEXT_PROPER);
    case Placeholder::DIRECTION_PAST:
    case Placeholder::DIRECTION_PAST_PROPER:
      return DirectionText::past(
          direction, p == Placeholder::DIRECTION_PAST_PROPER);
    case Placeholder::DIRECTION_PLURAL:
    case Placeholder::DIRECTION_PLURAL_PROPER:
      return DirectionText::plural(
          direction, p == Placeholder::DIRECTION_PLURAL_PROPER);
    case Placeholder::DIRECTION_VERB:
    case Placeholder::DIRECTION_VERB_PROPER:
      return DirectionText::verb(
          direction, p == Placeholder::DIRECTION_VERB_PROPER);
    case Placeholder::OTHER:
      break;
  }

  return configStore_.getPlaceholderValue(
      context_.getCluster().getClusterName(), token);
}

} // namespace stackupgrade
