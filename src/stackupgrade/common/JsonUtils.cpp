/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "JsonUtils.h"

#include <stdexcept>

#include <folly/FileUtil.h>
#include <folly/Format.h>

namespace stackupgrade {

std::string
JsonUtils::toSortedPrettyJson(const folly::dynamic& object) {
  std::string formattedJson;
  folly::json::serialization_opts opts;
  opts.sort_keys = true;
  opts.pretty_formatting = true;

  try {
    formattedJson = folly::json::serialize(object, opts);
  } catch (const std::exception& ex) {
    throw std::invalid_argument("Could not serialize dynamic object");
  }

  return formattedJson;
}

folly::dynamic
JsonUtils::readJsonFile2DynamicObject(const std::string& fileName) {
  std::string contents;
  if (!folly::readFile(fileName.c_str(), contents)) {
    throw std::invalid_argument(
        folly::sformat("Could not read file {}", fileName));
  }

  folly::dynamic object;
  try {
    object = folly::parseJson(contents);
  } catch (const std::exception& ex) {
    throw std::invalid_argument(
        folly::sformat("Could not parse file {}: {}", fileName, ex.what()));
  }
  return object;
}

void
JsonUtils::writeDynamicObject2JsonFile(
    const folly::dynamic& object, const std::string& fileName) {
  if (!folly::writeFile(toSortedPrettyJson(object), fileName.c_str())) {
    throw std::invalid_argument(
        folly::sformat("Could not write to file {}", fileName));
  }
}

void
JsonUtils::dynamicObjectMerge(folly::dynamic& a, const folly::dynamic& b) {
  if (!a.isObject() || !b.isObject()) {
    return;
  }
  for (const auto& bPair : b.items()) {
    auto aPair = a.find(bPair.first);
    if (aPair != a.items().end() && aPair->second.isObject()) {
      dynamicObjectMerge(aPair->second, bPair.second);
    } else {
      a[bPair.first] = bPair.second;
    }
  }
}

std::string
JsonUtils::getString(const folly::dynamic& obj, const std::string& key) {
  auto value = getOptionalString(obj, key);
  if (!value) {
    throw std::invalid_argument(
        folly::sformat("Missing required string field '{}'", key));
  }
  return *value;
}

std::optional<std::string>
JsonUtils::getOptionalString(
    const folly::dynamic& obj, const std::string& key) {
  if (!obj.isObject()) {
    throw std::invalid_argument(
        folly::sformat("Expected an object while reading '{}'", key));
  }
  auto value = obj.get_ptr(key);
  if (value == nullptr || value->isNull()) {
    return std::nullopt;
  }
  if (!value->isString()) {
    throw std::invalid_argument(
        folly::sformat("Field '{}' is not a string", key));
  }
  return value->getString();
}

bool
JsonUtils::getBool(
    const folly::dynamic& obj, const std::string& key, bool defaultValue) {
  auto value = obj.get_ptr(key);
  if (value == nullptr || value->isNull()) {
    return defaultValue;
  }
  if (!value->isBool()) {
    throw std::invalid_argument(
        folly::sformat("Field '{}' is not a boolean", key));
  }
  return value->getBool();
}

std::vector<std::string>
JsonUtils::getStringList(const folly::dynamic& obj, const std::string& key) {
  std::vector<std::string> result;
  auto value = obj.get_ptr(key);
  if (value == nullptr || value->isNull()) {
    return result;
  }
  if (!value->isArray()) {
    throw std::invalid_argument(
        folly::sformat("Field '{}' is not an array", key));
  }
  for (const auto& item : *value) {
    if (!item.isString()) {
      throw std::invalid_argument(
          folly::sformat("Field '{}' contains a non-string element", key));
    }
    result.push_back(item.getString());
  }
  return result;
}

} // namespace stackupgrade
