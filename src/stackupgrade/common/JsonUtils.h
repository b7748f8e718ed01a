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

#include <folly/dynamic.h>
#include <folly/json.h>

namespace stackupgrade {

/**
 * JSON-related utilities.
 */
class JsonUtils {
 public:
  /**
   * Sort and pretty-print a folly::dynamic object.
   *
   * Throws std::invalid_argument if unable to serialize the input object.
   */
  static std::string toSortedPrettyJson(const folly::dynamic& object);

  /**
   * Read a JSON file and parse its content into a folly::dynamic object.
   *
   * Throws std::invalid_argument if unable to read the file or parse its
   * content.
   */
  static folly::dynamic readJsonFile2DynamicObject(const std::string& fileName);

  /**
   * Write a folly::dynamic object to a file as JSON.
   *
   * Throws std::invalid_argument if unable to write to the file or serialize
   * the object.
   */
  static void writeDynamicObject2JsonFile(
      const folly::dynamic& object, const std::string& fileName);

  /** Merge items from a folly::dynamic object "b" into "a". */
  static void dynamicObjectMerge(folly::dynamic& a, const folly::dynamic& b);

  /**
   * Returns the string stored under "key" in a folly::dynamic object.
   *
   * Throws std::invalid_argument if the key is missing or not a string.
   */
  static std::string getString(
      const folly::dynamic& obj, const std::string& key);

  /**
   * Returns the string stored under "key" in a folly::dynamic object, or
   * std::nullopt if the key is missing or null.
   *
   * Throws std::invalid_argument if the value is present but not a string.
   */
  static std::optional<std::string> getOptionalString(
      const folly::dynamic& obj, const std::string& key);

  /**
   * Returns the boolean stored under "key", or "defaultValue" if missing.
   *
   * Throws std::invalid_argument if the value is present but not a boolean.
   */
  static bool getBool(
      const folly::dynamic& obj, const std::string& key, bool defaultValue);

  /**
   * Returns the array of strings stored under "key", or an empty vector if
   * the key is missing.
   *
   * Throws std::invalid_argument if the value is not an array of strings.
   */
  static std::vector<std::string> getStringList(
      const folly::dynamic& obj, const std::string& key);
};

} // namespace stackupgrade
