// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include "include/ceffluent/fluent_file_util.h"

#include "include/base/cef_build.h"

namespace ceffluent::file_util {

#if defined(OS_WIN)
const char kPathSep = '\\';
#else
const char kPathSep = '/';
#endif

std::string JoinPath(const std::string& path1, const std::string& path2) {
  if (path1.empty()) {
    return path2;
  }
  if (path2.empty()) {
    return path1;
  }

  std::string result = path1;
  if (result.back() != kPathSep) {
    result += kPathSep;
  }
  if (path2.front() == kPathSep) {
    result.append(path2, 1, std::string::npos);
  } else {
    result += path2;
  }
  return result;
}

}  // namespace ceffluent::file_util
