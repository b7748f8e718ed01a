/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ConfigStore.h"
#include "UpgradeContext.h"

namespace stackupgrade {

/**
 * Resolves "{{...}}" placeholder tokens in text shown to operators.
 *
 * Recognized tokens:
 * - {{hosts.all}}: all hosts of the service component, joined by ", "
 * - {{hosts.master}}: the master host of the service component
 * - {{version}}: the repository version of the orchestration
 * - {{direction.text}}, {{direction.past}}, {{direction.plural}},
 *   {{direction.verb}}, and their ".proper" (capitalized) variants
 *
 * Any other token is looked up in the cluster's desired configurations.
 * Tokens that can't be resolved are left in place.
 */
class PlaceholderResolver {
 public:
  /**
   * Constructor.
   * @param context the upgrade context
   * @param configStore the store used for configuration placeholders
   */
  PlaceholderResolver(
      const UpgradeContext& context, const ConfigStore& configStore)
      : context_(context), configStore_(configStore) {}

  /**
   * Replace every resolvable token in a string.
   *
   * The host tokens need both a service and a component; without them they
   * are left unresolved.
   */
  std::string tokenReplace(
      const std::string& source,
      const std::optional<std::string>& serviceName,
      const std::optional<std::string>& componentName) const;

  /** Returns the distinct tokens in a string, in order of appearance. */
  static std::vector<std::string> findTokens(const std::string& source);

 private:
  /** Recognized placeholders. */
  enum class Placeholder {
    OTHER,
    HOST_ALL,
    HOST_MASTER,
    VERSION,
    DIRECTION_TEXT,
    DIRECTION_TEXT_PROPER,
    DIRECTION_PAST,
    DIRECTION_PAST_PROPER,
    DIRECTION_PLURAL,
    DIRECTION_PLURAL_PROPER,
    DIRECTION_VERB,
    DIRECTION_VERB_PROPER,
  };

  /** Map a token to a recognized placeholder (OTHER if unrecognized). */
  static Placeholder findPlaceholder(const std::string& token);

  /** Returns the value of a token, or std::nullopt if unresolvable. */
  std::optional<std::string> resolveToken(
      const std::string& token,
      const std::optional<std::string>& serviceName,
      const std::optional<std::string>& componentName) const;

  const UpgradeContext& context_;
  const ConfigStore& configStore_;
};

} // namespace stackupgrade
