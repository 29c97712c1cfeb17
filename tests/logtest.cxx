#include <string>
#include <stdexcept>

#include <cxxtest/TestSuite.h>

#include <bsplab/logger/logger.hpp>
#include <bsplab/logger/assertions.hpp>

void test_basic_assertions() {
  int i = 1;
  int j = 2;
  ASSERT_LT(i, j);
  ASSERT_LE(i, j);
  ASSERT_NE(i, j);
  std::string a = "abc";
  ASSERT_EQ(a, a);
  ASSERT_TRUE(i < j);
  ASSERT_MSG(i < j, "%d not less than %d", i, j);
}

void failing_check() {
  int i = 1;
  int j = 2;
  ASSERT_GT(i, j);
}

void failing_message() {
  ASSERT_MSG(false, "test format strings: %d %s %f", 1, "123", 99.5);
}

class LogTestSuite: public CxxTest::TestSuite {
 public:
  void test_log() {
    global_logger().set_log_level(LOG_INFO);
    global_logger().set_log_file("logtest.logger");
    global_logger().set_log_to_console(false);
    logger(LOG_INFO, "this should only be in the file");

    global_logger().set_log_to_console(true);
    logger(LOG_WARNING, "you should see this both the console and file");
    logstream(LOG_INFO) << "log info again! but with the stream" << std::endl;

    global_logger().set_log_file("");
    logger(LOG_ERROR, "this is only in the console");
    logstream(LOG_DEBUG) << "below the log level" << std::endl;
    test_basic_assertions();
  }

  void test_fatal_throws() {
    TS_ASSERT_THROWS(logger(LOG_FATAL, "test format strings: %d %s %f", 1, "123", 99.5),
                     std::runtime_error);
    TS_ASSERT_THROWS(logstream(LOG_FATAL) << "fatal stream" << std::endl,
                     std::runtime_error);
    TS_ASSERT_THROWS(failing_check(), std::runtime_error);
    TS_ASSERT_THROWS(failing_message(), std::runtime_error);
  }

  void test_parse_log_level() {
    TS_ASSERT_EQUALS(parse_log_level("debug"), LOG_DEBUG);
    TS_ASSERT_EQUALS(parse_log_level("INFO"), LOG_INFO);
    TS_ASSERT_EQUALS(parse_log_level("Warning"), LOG_WARNING);
    TS_ASSERT_EQUALS(parse_log_level("error"), LOG_ERROR);
    TS_ASSERT_EQUALS(parse_log_level("none"), LOG_NONE);
    TS_ASSERT_EQUALS(parse_log_level("verbose"), -1);
  }

  void test_level_filter() {
    global_logger().set_log_level(LOG_ERROR);
    TS_ASSERT_EQUALS(global_logger().get_log_level(), LOG_ERROR);
    logstream(LOG_INFO) << "filtered" << std::endl;
    global_logger().set_log_level(LOG_INFO);
  }
};
