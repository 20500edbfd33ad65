// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include "include/ceffluent/fluent_request_event_handler.h"

#include "include/base/cef_logging.h"

namespace ceffluent {

RequestEventHandler::RequestEventHandler(const Config& config)
    : config_(config) {}

bool RequestEventHandler::OnBeforeBrowse(CefRefPtr<CefBrowser> browser,
                                         CefRefPtr<CefFrame> frame,
                                         CefRefPtr<CefRequest> request,
                                         bool user_gesture,
                                         bool is_redirect) {
  if (config_.on_before_browse.is_null()) {
    return false;
  }

  OnBeforeBrowseEventArgs args(browser, frame, request, user_gesture,
                               is_redirect);
  config_.on_before_browse.Run(&args);
  return args.cancel_navigation();
}

bool RequestEventHandler::OnOpenURLFromTab(
    CefRefPtr<CefBrowser> browser,
    CefRefPtr<CefFrame> frame,
    const CefString& target_url,
    WindowOpenDisposition target_disposition,
    bool user_gesture) {
  if (config_.on_open_url_from_tab.is_null()) {
    return false;
  }

  OnOpenUrlFromTabEventArgs args(browser, frame, target_url,
                                 target_disposition, user_gesture);
  config_.on_open_url_from_tab.Run(&args);
  return args.cancel_navigation();
}

void RequestEventHandler::OnDocumentAvailableInMainFrame(
    CefRefPtr<CefBrowser> browser) {
  if (config_.on_document_available.is_null()) {
    return;
  }

  config_.on_document_available.Run(OnDocumentAvailableEventArgs(browser));
}

void RequestEventHandler::OnRenderProcessTerminated(
    CefRefPtr<CefBrowser> browser,
    TerminationStatus status,
    int error_code,
    const CefString& error_string) {
  LOG(ERROR) << "Render process terminated with status "
             << GetTerminationStatusString(status) << " ("
             << error_string.ToString() << ")";

  if (config_.on_render_process_terminated.is_null()) {
    return;
  }

  config_.on_render_process_terminated.Run(OnRenderProcessTerminatedEventArgs(
      browser, status, error_code, error_string));
}

}  // namespace ceffluent
