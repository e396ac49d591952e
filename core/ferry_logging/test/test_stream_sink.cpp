// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_stream_sink.cpp
 * @brief Text records written to a captured stream
 */

#include <boost/log/core.hpp>
#include <boost/make_shared.hpp>
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#define FERRY_LOG_COMPONENT "sink_test"
#include "ferry_log_macros.hpp"
#include "ferry_log_sinks.hpp"

using namespace ferry::logging;

namespace {

size_t count_of(const std::string& haystack, const std::string& needle) {
  size_t count = 0;
  for (size_t pos = haystack.find(needle); pos != std::string::npos;
       pos = haystack.find(needle, pos + needle.size())) {
    ++count;
  }
  return count;
}

}  // namespace

class StreamSinkTest : public ::testing::Test {
protected:
  void attach(severity_level level, bool colors) {
    out_ = boost::make_shared<std::ostringstream>();
    sink_ = make_stream_sink(out_, level, colors);
    boost::log::core::get()->add_sink(sink_);
  }

  std::string drain() {
    sink_->flush();
    return out_->str();
  }

  void TearDown() override {
    if (sink_) {
      boost::log::core::get()->remove_sink(sink_);
      sink_->stop();
      sink_.reset();
    }
  }

  boost::shared_ptr<std::ostringstream> out_;
  boost::shared_ptr<stream_sink_t> sink_;
};

TEST_F(StreamSinkTest, RecordCarriesLevelAndComponent) {
  attach(severity_level::info, false);
  FERRY_LOG_INFO("Claimed batch" << kv("count", 3));

  std::string text = drain();
  EXPECT_NE(text.find("[INFO] [sink_test] Claimed batch count=3"), std::string::npos);
  EXPECT_EQ(text.find(" | "), std::string::npos);
}

TEST_F(StreamSinkTest, ScopedItemTagsRecordsUntilScopeEnds) {
  attach(severity_level::debug, false);
  {
    FERRY_LOG_SCOPED_ITEM("q-123", "ATTACH01");
    FERRY_LOG_INFO("Uploading" << kv("bytes", 1024));
  }
  FERRY_LOG_INFO("After item");

  std::string text = drain();
  EXPECT_NE(
    text.find("Uploading bytes=1024 | queue_id=q-123 attachment_key=ATTACH01"), std::string::npos
  );
  size_t after = text.find("After item");
  ASSERT_NE(after, std::string::npos);
  EXPECT_EQ(text.find("queue_id=", after), std::string::npos);
}

TEST_F(StreamSinkTest, ScopedItemsInSiblingScopes) {
  attach(severity_level::debug, false);
  for (int i = 0; i < 2; ++i) {
    FERRY_LOG_SCOPED_ITEM("q-" + std::to_string(i), "KEY" + std::to_string(i));
    FERRY_LOG_WARN("item");
  }

  std::string text = drain();
  EXPECT_NE(text.find("queue_id=q-0 attachment_key=KEY0"), std::string::npos);
  EXPECT_NE(text.find("queue_id=q-1 attachment_key=KEY1"), std::string::npos);
}

TEST_F(StreamSinkTest, LevelFilter) {
  attach(severity_level::warn, false);
  FERRY_LOG_INFO("quiet");
  FERRY_LOG_ERROR("loud");

  std::string text = drain();
  EXPECT_EQ(text.find("quiet"), std::string::npos);
  EXPECT_NE(text.find("[ERROR] [sink_test] loud"), std::string::npos);
}

TEST_F(StreamSinkTest, ColoredLevelTag) {
  attach(severity_level::info, true);
  FERRY_LOG_ERROR("red");

  std::string text = drain();
  EXPECT_NE(text.find("\033[31m[ERROR]\033[0m [sink_test] red"), std::string::npos);
}

TEST_F(StreamSinkTest, ThrottledCallSiteLogsOnce) {
  attach(severity_level::info, false);
  for (int i = 0; i < 5; ++i) {
    FERRY_LOG_WARN_THROTTLE(60.0, "Queue busy" << kv("round", i));
  }

  std::string text = drain();
  EXPECT_EQ(count_of(text, "Queue busy"), 1u);
  EXPECT_NE(text.find("round=0"), std::string::npos);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
