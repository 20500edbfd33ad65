// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include "include/ceffluent/fluent_request_event_args.h"

#include <sstream>

#include "include/base/cef_build.h"

namespace ceffluent {

std::string GetTerminationStatusString(cef_termination_status_t status) {
#define CASE(status) \
  case status:       \
    return #status

  switch (status) {
    CASE(TS_ABNORMAL_TERMINATION);
    CASE(TS_PROCESS_WAS_KILLED);
    CASE(TS_PROCESS_CRASHED);
    CASE(TS_PROCESS_OOM);
    CASE(TS_LAUNCH_FAILED);
#if defined(OS_WIN)
    CASE(TS_INTEGRITY_FAILURE);
#endif
    default:
      break;
  }

#undef CASE

  std::stringstream ss;
  ss << "UNKNOWN (" << static_cast<int>(status) << ")";
  return ss.str();
}

BaseRequestEventArgs::BaseRequestEventArgs(CefRefPtr<CefBrowser> browser)
    : browser_(browser) {}

BaseRequestEventArgs::~BaseRequestEventArgs() = default;

OnBeforeBrowseEventArgs::OnBeforeBrowseEventArgs(CefRefPtr<CefBrowser> browser,
                                                 CefRefPtr<CefFrame> frame,
                                                 CefRefPtr<CefRequest> request,
                                                 bool user_gesture,
                                                 bool is_redirect)
    : BaseRequestEventArgs(browser),
      frame_(frame),
      request_(request),
      user_gesture_(user_gesture),
      is_redirect_(is_redirect) {}

OnOpenUrlFromTabEventArgs::OnOpenUrlFromTabEventArgs(
    CefRefPtr<CefBrowser> browser,
    CefRefPtr<CefFrame> frame,
    const CefString& target_url,
    cef_window_open_disposition_t target_disposition,
    bool user_gesture)
    : BaseRequestEventArgs(browser),
      frame_(frame),
      target_url_(target_url),
      target_disposition_(target_disposition),
      user_gesture_(user_gesture) {}

OnDocumentAvailableEventArgs::OnDocumentAvailableEventArgs(
    CefRefPtr<CefBrowser> browser)
    : BaseRequestEventArgs(browser) {}

OnRenderProcessTerminatedEventArgs::OnRenderProcessTerminatedEventArgs(
    CefRefPtr<CefBrowser> browser,
    cef_termination_status_t status,
    int error_code,
    const CefString& error_string)
    : BaseRequestEventArgs(browser),
      status_(status),
      error_code_(error_code),
      error_string_(error_string) {}

}  // namespace ceffluent
