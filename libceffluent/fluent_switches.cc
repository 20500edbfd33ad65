// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include "include/ceffluent/fluent_switches.h"

namespace ceffluent::switches {

// Only switches specific to ceffluent are listed here. CEF and Chromium
// switches are passed through to the browser unchanged.

const char kDownloadFolder[] = "download-folder";
const char kDownloadPrompt[] = "download-prompt";
const char kUrl[] = "url";

}  // namespace ceffluent::switches
