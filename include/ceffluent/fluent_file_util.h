// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#ifndef CEFFLUENT_INCLUDE_CEFFLUENT_FLUENT_FILE_UTIL_H_
#define CEFFLUENT_INCLUDE_CEFFLUENT_FLUENT_FILE_UTIL_H_
#pragma once

#include <string>

namespace ceffluent::file_util {

// Platform-specific path separator.
extern const char kPathSep;

// Combines |path1| and |path2| with the correct platform-specific path
// separator. Returns whichever component is non-empty if the other is empty.
std::string JoinPath(const std::string& path1, const std::string& path2);

}  // namespace ceffluent::file_util

#endif  // CEFFLUENT_INCLUDE_CEFFLUENT_FLUENT_FILE_UTIL_H_
