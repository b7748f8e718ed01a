/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "ConfigStore.h"

#include <glog/logging.h>

namespace stackupgrade {

ConfigTransaction::~ConfigTransaction() {
  if (done_) {
    return;
  }
  try {
    store_.rollbackTransaction();
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Failed to roll back configuration transaction: "
               << ex.what();
  }
}

void
ConfigTransaction::commit() {
  store_.commitTransaction();
  done_ = true;
}

} // namespace stackupgrade
