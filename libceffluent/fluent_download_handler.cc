// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include "include/ceffluent/fluent_download_handler.h"

#include <utility>

#include "include/base/cef_logging.h"
#include "include/ceffluent/fluent_file_util.h"

namespace ceffluent {

namespace {

// Continues the download into |folder| without showing a dialog.
bool ContinueInFolder(const std::string& folder,
                      CefRefPtr<CefBrowser> browser,
                      CefRefPtr<CefDownloadItem> download_item,
                      const CefString& suggested_name,
                      CefRefPtr<CefBeforeDownloadCallback> callback) {
  if (!callback) {
    LOG(ERROR) << "OnBeforeDownload called without a callback";
    return false;
  }

  const std::string& path =
      file_util::JoinPath(folder, suggested_name.ToString());
  VLOG(1) << "Saving download to " << path;

  callback->Continue(path, /*show_dialog=*/false);
  return true;
}

// Continues the download and lets the user pick the location.
bool ContinueWithDialog(CefRefPtr<CefBrowser> browser,
                        CefRefPtr<CefDownloadItem> download_item,
                        const CefString& suggested_name,
                        CefRefPtr<CefBeforeDownloadCallback> callback) {
  if (!callback) {
    LOG(ERROR) << "OnBeforeDownload called without a callback";
    return false;
  }

  callback->Continue(CefString(), /*show_dialog=*/true);
  return true;
}

}  // namespace

// static
DownloadHandlerBuilder DownloadHandler::Create() {
  return DownloadHandlerBuilder();
}

// static
CefRefPtr<CefDownloadHandler> DownloadHandler::UseFolder(
    const std::string& folder,
    OnDownloadUpdatedCallback on_download_updated) {
  if (folder.empty()) {
    LOG(WARNING) << "Empty download folder; files will be saved relative to "
                    "the current working directory";
  }

  return Create()
      .OnBeforeDownload(base::BindRepeating(&ContinueInFolder, folder))
      .OnDownloadUpdated(std::move(on_download_updated))
      .Build();
}

// static
CefRefPtr<CefDownloadHandler> DownloadHandler::AskUser(
    OnDownloadUpdatedCallback on_download_updated) {
  return Create()
      .OnBeforeDownload(base::BindRepeating(&ContinueWithDialog))
      .OnDownloadUpdated(std::move(on_download_updated))
      .Build();
}

DownloadHandler::DownloadHandler(const Config& config) : config_(config) {}

bool DownloadHandler::CanDownload(CefRefPtr<CefBrowser> browser,
                                  const CefString& url,
                                  const CefString& request_method) {
  if (config_.can_download.is_null()) {
    return true;
  }
  return config_.can_download.Run(browser, url, request_method);
}

bool DownloadHandler::OnBeforeDownload(
    CefRefPtr<CefBrowser> browser,
    CefRefPtr<CefDownloadItem> download_item,
    const CefString& suggested_name,
    CefRefPtr<CefBeforeDownloadCallback> callback) {
  if (config_.on_before_download.is_null()) {
    return false;
  }
  return config_.on_before_download.Run(browser, download_item, suggested_name,
                                        callback);
}

void DownloadHandler::OnDownloadUpdated(
    CefRefPtr<CefBrowser> browser,
    CefRefPtr<CefDownloadItem> download_item,
    CefRefPtr<CefDownloadItemCallback> callback) {
  if (config_.on_download_updated.is_null()) {
    return;
  }
  config_.on_download_updated.Run(browser, download_item, callback);
}

DownloadHandlerBuilder::DownloadHandlerBuilder() = default;

DownloadHandlerBuilder& DownloadHandlerBuilder::CanDownload(
    CanDownloadCallback callback) {
  config_.can_download = std::move(callback);
  return *this;
}

DownloadHandlerBuilder& DownloadHandlerBuilder::OnBeforeDownload(
    OnBeforeDownloadCallback callback) {
  config_.on_before_download = std::move(callback);
  return *this;
}

DownloadHandlerBuilder& DownloadHandlerBuilder::OnDownloadUpdated(
    OnDownloadUpdatedCallback callback) {
  config_.on_download_updated = std::move(callback);
  return *this;
}

CefRefPtr<CefDownloadHandler> DownloadHandlerBuilder::Build() const {
  return new DownloadHandler(config_);
}

}  // namespace ceffluent
