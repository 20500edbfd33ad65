// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

// Defines the command line switches used to configure ceffluent handlers.

#ifndef CEFFLUENT_INCLUDE_CEFFLUENT_FLUENT_SWITCHES_H_
#define CEFFLUENT_INCLUDE_CEFFLUENT_FLUENT_SWITCHES_H_
#pragma once

namespace ceffluent::switches {

extern const char kDownloadFolder[];
extern const char kDownloadPrompt[];
extern const char kUrl[];

}  // namespace ceffluent::switches

#endif  // CEFFLUENT_INCLUDE_CEFFLUENT_FLUENT_SWITCHES_H_
