// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#ifndef CEFFLUENT_INCLUDE_CEFFLUENT_FLUENT_REQUEST_EVENT_HANDLER_H_
#define CEFFLUENT_INCLUDE_CEFFLUENT_FLUENT_REQUEST_EVENT_HANDLER_H_
#pragma once

#include "include/base/cef_callback.h"
#include "include/base/cef_macros.h"
#include "include/cef_request_handler.h"
#include "include/ceffluent/fluent_request_event_args.h"

namespace ceffluent {

///
/// CefRequestHandler implementation that raises an event args object for each
/// supported event that has a callback registered in its Config. Navigation
/// events are allowed and notifications ignored when no callback is
/// registered. Render process termination is always logged.
///
class RequestEventHandler : public CefRequestHandler {
 public:
  using OnBeforeBrowseCallback =
      base::RepeatingCallback<void(OnBeforeBrowseEventArgs* args)>;
  using OnOpenUrlFromTabCallback =
      base::RepeatingCallback<void(OnOpenUrlFromTabEventArgs* args)>;
  using OnDocumentAvailableCallback =
      base::RepeatingCallback<void(const OnDocumentAvailableEventArgs& args)>;
  using OnRenderProcessTerminatedCallback = base::RepeatingCallback<void(
      const OnRenderProcessTerminatedEventArgs& args)>;

  struct Config {
    OnBeforeBrowseCallback on_before_browse;
    OnOpenUrlFromTabCallback on_open_url_from_tab;
    OnDocumentAvailableCallback on_document_available;
    OnRenderProcessTerminatedCallback on_render_process_terminated;
  };

  explicit RequestEventHandler(const Config& config);

  // CefRequestHandler methods:
  bool OnBeforeBrowse(CefRefPtr<CefBrowser> browser,
                      CefRefPtr<CefFrame> frame,
                      CefRefPtr<CefRequest> request,
                      bool user_gesture,
                      bool is_redirect) override;
  bool OnOpenURLFromTab(CefRefPtr<CefBrowser> browser,
                        CefRefPtr<CefFrame> frame,
                        const CefString& target_url,
                        WindowOpenDisposition target_disposition,
                        bool user_gesture) override;
  void OnDocumentAvailableInMainFrame(CefRefPtr<CefBrowser> browser) override;
  void OnRenderProcessTerminated(CefRefPtr<CefBrowser> browser,
                                 TerminationStatus status,
                                 int error_code,
                                 const CefString& error_string) override;

 private:
  const Config config_;

  IMPLEMENT_REFCOUNTING(RequestEventHandler);
  DISALLOW_COPY_AND_ASSIGN(RequestEventHandler);
};

}  // namespace ceffluent

#endif  // CEFFLUENT_INCLUDE_CEFFLUENT_FLUENT_REQUEST_EVENT_HANDLER_H_
