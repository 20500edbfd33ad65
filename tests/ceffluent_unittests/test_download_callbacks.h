// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#ifndef CEFFLUENT_TESTS_CEFFLUENT_UNITTESTS_TEST_DOWNLOAD_CALLBACKS_H_
#define CEFFLUENT_TESTS_CEFFLUENT_UNITTESTS_TEST_DOWNLOAD_CALLBACKS_H_
#pragma once

#include <string>

#include "include/base/cef_macros.h"
#include "include/cef_download_handler.h"
#include "tests/ceffluent_unittests/track_callback.h"

// Stands in for the CefBeforeDownloadCallback that CEF passes to
// OnBeforeDownload. Records the arguments passed to Continue().
class TestBeforeDownloadCallback : public CefBeforeDownloadCallback {
 public:
  TestBeforeDownloadCallback() = default;

  void Continue(const CefString& download_path, bool show_dialog) override {
    got_continue_.yes();
    download_path_ = download_path.ToString();
    show_dialog_ = show_dialog;
  }

  const TrackCallback& got_continue() const { return got_continue_; }
  const std::string& download_path() const { return download_path_; }
  bool show_dialog() const { return show_dialog_; }

 private:
  TrackCallback got_continue_;
  std::string download_path_;
  bool show_dialog_ = false;

  IMPLEMENT_REFCOUNTING(TestBeforeDownloadCallback);
  DISALLOW_COPY_AND_ASSIGN(TestBeforeDownloadCallback);
};

// Stands in for the CefDownloadItemCallback that CEF passes to
// OnDownloadUpdated.
class TestDownloadItemCallback : public CefDownloadItemCallback {
 public:
  TestDownloadItemCallback() = default;

  void Cancel() override { got_cancel_.yes(); }
  void Pause() override { got_pause_.yes(); }
  void Resume() override { got_resume_.yes(); }

  const TrackCallback& got_cancel() const { return got_cancel_; }
  const TrackCallback& got_pause() const { return got_pause_; }
  const TrackCallback& got_resume() const { return got_resume_; }

 private:
  TrackCallback got_cancel_;
  TrackCallback got_pause_;
  TrackCallback got_resume_;

  IMPLEMENT_REFCOUNTING(TestDownloadItemCallback);
  DISALLOW_COPY_AND_ASSIGN(TestDownloadItemCallback);
};

#endif  // CEFFLUENT_TESTS_CEFFLUENT_UNITTESTS_TEST_DOWNLOAD_CALLBACKS_H_
