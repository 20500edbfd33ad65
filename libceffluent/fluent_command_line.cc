// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include "include/ceffluent/fluent_command_line.h"

#include <string>
#include <utility>

#include "include/base/cef_logging.h"
#include "include/ceffluent/fluent_switches.h"

namespace ceffluent {

CefRefPtr<CefDownloadHandler> CreateDownloadHandlerFromCommandLine(
    CefRefPtr<CefCommandLine> command_line,
    OnDownloadUpdatedCallback on_download_updated) {
  std::string folder;
  bool prompt = false;
  if (command_line) {
    folder = command_line->GetSwitchValue(switches::kDownloadFolder);
    prompt = command_line->HasSwitch(switches::kDownloadPrompt);
  }

  if (prompt) {
    if (!folder.empty()) {
      LOG(WARNING) << "Ignoring --" << switches::kDownloadFolder
                   << " because --" << switches::kDownloadPrompt
                   << " was specified";
    }
    LOG(INFO) << "Downloads will prompt for a save location";
    return DownloadHandler::AskUser(std::move(on_download_updated));
  }

  if (!folder.empty()) {
    LOG(INFO) << "Downloads will be saved to " << folder;
    return DownloadHandler::UseFolder(folder, std::move(on_download_updated));
  }

  LOG(INFO) << "Downloads will use the default handling";
  return DownloadHandler::Create()
      .OnDownloadUpdated(std::move(on_download_updated))
      .Build();
}

}  // namespace ceffluent
