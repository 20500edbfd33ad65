// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include <string>

#include "gtest/gtest.h"
#include "tests/ceffluent_sample/sample_util.h"

TEST(SampleUtilTest, AsciiStrToLower) {
  EXPECT_STREQ("https://example.com/",
               AsciiStrToLower("HTTPS://Example.COM/").c_str());
  EXPECT_STREQ("", AsciiStrToLower(std::string()).c_str());
}

TEST(SampleUtilTest, NoReloadWithoutStartupUrl) {
  EXPECT_FALSE(ShouldReloadAfterTermination("", "https://example.com/"));
  EXPECT_FALSE(
      ShouldReloadAfterTermination("chrome://crash", "https://example.com/"));
}

TEST(SampleUtilTest, NoReloadBeforeFirstLoad) {
  EXPECT_FALSE(ShouldReloadAfterTermination("https://example.com", ""));
}

TEST(SampleUtilTest, NoReloadOfStartupUrl) {
  EXPECT_FALSE(ShouldReloadAfterTermination("https://example.com",
                                            "https://example.com/"));
  EXPECT_FALSE(ShouldReloadAfterTermination("https://example.com",
                                            "https://example.com/page.html"));
}

TEST(SampleUtilTest, NoReloadOfStartupUrlIgnoringCase) {
  // The frame reports a lowercase scheme and host.
  EXPECT_FALSE(ShouldReloadAfterTermination("HTTPS://Example.com",
                                            "https://example.com/"));
  EXPECT_FALSE(ShouldReloadAfterTermination("https://example.com",
                                            "HTTPS://EXAMPLE.COM/"));
}

TEST(SampleUtilTest, ReloadAfterNavigatingAway) {
  EXPECT_TRUE(ShouldReloadAfterTermination("https://example.com",
                                           "https://other.example.org/"));
}
