// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#ifndef CEFFLUENT_INCLUDE_CEFFLUENT_FLUENT_COMMAND_LINE_H_
#define CEFFLUENT_INCLUDE_CEFFLUENT_FLUENT_COMMAND_LINE_H_
#pragma once

#include "include/cef_command_line.h"
#include "include/ceffluent/fluent_download_handler.h"

namespace ceffluent {

///
/// Returns a download handler configured from |command_line|:
///  --download-prompt          AskUser(), takes precedence over a folder.
///  --download-folder=<path>   UseFolder(<path>).
/// Without either switch CEF's default handling is used. In all cases
/// |on_download_updated| is registered for download updates. A null
/// |command_line| is treated as an empty one.
///
CefRefPtr<CefDownloadHandler> CreateDownloadHandlerFromCommandLine(
    CefRefPtr<CefCommandLine> command_line,
    OnDownloadUpdatedCallback on_download_updated =
        OnDownloadUpdatedCallback());

}  // namespace ceffluent

#endif  // CEFFLUENT_INCLUDE_CEFFLUENT_FLUENT_COMMAND_LINE_H_
