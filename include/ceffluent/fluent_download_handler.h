// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#ifndef CEFFLUENT_INCLUDE_CEFFLUENT_FLUENT_DOWNLOAD_HANDLER_H_
#define CEFFLUENT_INCLUDE_CEFFLUENT_FLUENT_DOWNLOAD_HANDLER_H_
#pragma once

#include <string>

#include "include/base/cef_callback.h"
#include "include/base/cef_macros.h"
#include "include/cef_browser.h"
#include "include/cef_download_handler.h"
#include "include/cef_download_item.h"

namespace ceffluent {

///
/// Called before a download begins in response to a user-initiated action
/// (e.g. alt + link click or link click that returns a `Content-Disposition:
/// attachment` response from the server). |url| is the target download URL
/// and |request_method| is the target method (GET, POST, etc). Return true to
/// proceed with the download or false to cancel the download.
///
using CanDownloadCallback =
    base::RepeatingCallback<bool(CefRefPtr<CefBrowser> browser,
                                 const CefString& url,
                                 const CefString& request_method)>;

///
/// Called before a download begins. |suggested_name| is the suggested name for
/// the download file. Return true and execute |callback| either
/// asynchronously or in this method to continue or cancel the download.
/// Return false to proceed with default handling (cancel with Alloy style,
/// download shelf with Chrome style).
///
using OnBeforeDownloadCallback = base::RepeatingCallback<bool(
    CefRefPtr<CefBrowser> browser,
    CefRefPtr<CefDownloadItem> download_item,
    const CefString& suggested_name,
    CefRefPtr<CefBeforeDownloadCallback> callback)>;

///
/// Called when a download's status or progress information has been updated.
/// This may be called multiple times before and after OnBeforeDownload.
/// Execute |callback| either asynchronously or in this method to cancel,
/// pause or resume the download.
///
using OnDownloadUpdatedCallback = base::RepeatingCallback<void(
    CefRefPtr<CefBrowser> browser,
    CefRefPtr<CefDownloadItem> download_item,
    CefRefPtr<CefDownloadItemCallback> callback)>;

class DownloadHandlerBuilder;

///
/// CefDownloadHandler implementation that forwards each method to an optional
/// callback. Methods without a callback use the default behavior documented
/// on the method. Instances are immutable once created; use
/// DownloadHandlerBuilder (via Create()) to configure them.
///
class DownloadHandler : public CefDownloadHandler {
 public:
  struct Config {
    CanDownloadCallback can_download;
    OnBeforeDownloadCallback on_before_download;
    OnDownloadUpdatedCallback on_download_updated;
  };

  ///
  /// Returns a new builder with no callbacks registered.
  ///
  static DownloadHandlerBuilder Create();

  ///
  /// Returns a handler that saves every download to |folder| using the
  /// suggested file name. No dialog is displayed to the user.
  /// |on_download_updated| is optional and may be used to track progress and
  /// completion.
  ///
  static CefRefPtr<CefDownloadHandler> UseFolder(
      const std::string& folder,
      OnDownloadUpdatedCallback on_download_updated =
          OnDownloadUpdatedCallback());

  ///
  /// Returns a handler that displays the default "Save As" dialog for every
  /// download. |on_download_updated| is optional.
  ///
  static CefRefPtr<CefDownloadHandler> AskUser(
      OnDownloadUpdatedCallback on_download_updated =
          OnDownloadUpdatedCallback());

  explicit DownloadHandler(const Config& config);

  // CefDownloadHandler methods:

  // Returns true (allow) if no callback is registered.
  bool CanDownload(CefRefPtr<CefBrowser> browser,
                   const CefString& url,
                   const CefString& request_method) override;

  // Returns false (default handling) if no callback is registered.
  bool OnBeforeDownload(CefRefPtr<CefBrowser> browser,
                        CefRefPtr<CefDownloadItem> download_item,
                        const CefString& suggested_name,
                        CefRefPtr<CefBeforeDownloadCallback> callback) override;

  // Does nothing if no callback is registered.
  void OnDownloadUpdated(CefRefPtr<CefBrowser> browser,
                         CefRefPtr<CefDownloadItem> download_item,
                         CefRefPtr<CefDownloadItemCallback> callback) override;

 private:
  const Config config_;

  IMPLEMENT_REFCOUNTING(DownloadHandler);
  DISALLOW_COPY_AND_ASSIGN(DownloadHandler);
};

///
/// Fluent builder for DownloadHandler. Each method replaces any callback
/// previously registered for the same method; pass a null callback to restore
/// the default behavior. Build() may be called multiple times and each
/// returned handler keeps the callbacks registered at the time of the call.
///
class DownloadHandlerBuilder {
 public:
  DownloadHandlerBuilder();

  DownloadHandlerBuilder& CanDownload(CanDownloadCallback callback);
  DownloadHandlerBuilder& OnBeforeDownload(OnBeforeDownloadCallback callback);
  DownloadHandlerBuilder& OnDownloadUpdated(OnDownloadUpdatedCallback callback);

  CefRefPtr<CefDownloadHandler> Build() const;

 private:
  DownloadHandler::Config config_;
};

}  // namespace ceffluent

#endif  // CEFFLUENT_INCLUDE_CEFFLUENT_FLUENT_DOWNLOAD_HANDLER_H_
