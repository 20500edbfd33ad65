// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#ifndef CEFFLUENT_INCLUDE_CEFFLUENT_FLUENT_REQUEST_EVENT_ARGS_H_
#define CEFFLUENT_INCLUDE_CEFFLUENT_FLUENT_REQUEST_EVENT_ARGS_H_
#pragma once

#include <string>

#include "include/cef_browser.h"
#include "include/cef_frame.h"
#include "include/cef_request.h"
#include "include/cef_request_handler.h"

namespace ceffluent {

// Returns a human-readable name for |status|.
std::string GetTerminationStatusString(cef_termination_status_t status);

///
/// Arguments shared by all request handler events.
///
class BaseRequestEventArgs {
 public:
  explicit BaseRequestEventArgs(CefRefPtr<CefBrowser> browser);
  virtual ~BaseRequestEventArgs();

  CefRefPtr<CefBrowser> browser() const { return browser_; }

 private:
  const CefRefPtr<CefBrowser> browser_;
};

///
/// Arguments for CefRequestHandler::OnBeforeBrowse. Set |cancel_navigation|
/// to true to cancel the navigation.
///
class OnBeforeBrowseEventArgs : public BaseRequestEventArgs {
 public:
  OnBeforeBrowseEventArgs(CefRefPtr<CefBrowser> browser,
                          CefRefPtr<CefFrame> frame,
                          CefRefPtr<CefRequest> request,
                          bool user_gesture,
                          bool is_redirect);

  CefRefPtr<CefFrame> frame() const { return frame_; }
  CefRefPtr<CefRequest> request() const { return request_; }
  bool user_gesture() const { return user_gesture_; }
  bool is_redirect() const { return is_redirect_; }

  bool cancel_navigation() const { return cancel_navigation_; }
  void set_cancel_navigation(bool cancel) { cancel_navigation_ = cancel; }

 private:
  const CefRefPtr<CefFrame> frame_;
  const CefRefPtr<CefRequest> request_;
  const bool user_gesture_;
  const bool is_redirect_;
  bool cancel_navigation_ = false;
};

///
/// Arguments for CefRequestHandler::OnOpenURLFromTab. Set |cancel_navigation|
/// to true to cancel the navigation.
///
class OnOpenUrlFromTabEventArgs : public BaseRequestEventArgs {
 public:
  OnOpenUrlFromTabEventArgs(
      CefRefPtr<CefBrowser> browser,
      CefRefPtr<CefFrame> frame,
      const CefString& target_url,
      cef_window_open_disposition_t target_disposition,
      bool user_gesture);

  CefRefPtr<CefFrame> frame() const { return frame_; }
  const CefString& target_url() const { return target_url_; }
  cef_window_open_disposition_t target_disposition() const {
    return target_disposition_;
  }
  bool user_gesture() const { return user_gesture_; }

  bool cancel_navigation() const { return cancel_navigation_; }
  void set_cancel_navigation(bool cancel) { cancel_navigation_ = cancel; }

 private:
  const CefRefPtr<CefFrame> frame_;
  const CefString target_url_;
  const cef_window_open_disposition_t target_disposition_;
  const bool user_gesture_;
  bool cancel_navigation_ = false;
};

///
/// Arguments for CefRequestHandler::OnDocumentAvailableInMainFrame.
///
class OnDocumentAvailableEventArgs : public BaseRequestEventArgs {
 public:
  explicit OnDocumentAvailableEventArgs(CefRefPtr<CefBrowser> browser);
};

///
/// Arguments for CefRequestHandler::OnRenderProcessTerminated. |error_code|
/// and |error_string| describe the platform error, if any.
///
class OnRenderProcessTerminatedEventArgs : public BaseRequestEventArgs {
 public:
  OnRenderProcessTerminatedEventArgs(CefRefPtr<CefBrowser> browser,
                                     cef_termination_status_t status,
                                     int error_code,
                                     const CefString& error_string);

  cef_termination_status_t status() const { return status_; }
  int error_code() const { return error_code_; }
  const CefString& error_string() const { return error_string_; }

 private:
  const cef_termination_status_t status_;
  const int error_code_;
  const CefString error_string_;
};

}  // namespace ceffluent

#endif  // CEFFLUENT_INCLUDE_CEFFLUENT_FLUENT_REQUEST_EVENT_ARGS_H_
