#include <string>
#include <cxxtest/TestSuite.h>
#include <bsplab/options/options_map.hpp>
#include <bsplab/options/pregel_options.hpp>
#include <bsplab/options/command_line_options.hpp>
#include <bsplab/util/error_types.hpp>

using namespace bsplab;

class OptionsTestSuite : public CxxTest::TestSuite {
public:
  void test_options_map(void) {
    options_map opts("max_iterations=10 tolerance=0.5 is_asynchronous=Yes name=pr");
    size_t iters = 0;
    TS_ASSERT(opts.get_option("max_iterations", iters));
    TS_ASSERT_EQUALS(iters, (size_t)10);
    double tol = 0;
    TS_ASSERT(opts.get_option("tolerance", tol));
    TS_ASSERT_DELTA(tol, 0.5, 1e-12);
    bool async = false;
    TS_ASSERT(opts.get_option("is_asynchronous", async));
    TS_ASSERT(async);
    std::string name;
    TS_ASSERT(opts.get_option("name", name));
    TS_ASSERT_EQUALS(name, "pr");
    TS_ASSERT(!opts.get_option("missing", name));
  }

  void test_parse_string(void) {
    options_map opts;
    std::string fn = opts.parse_string("sssp(source=3,max_iterations=7)");
    TS_ASSERT_EQUALS(fn, "sssp");
    TS_ASSERT(opts.is_set("source"));
    size_t source = 0;
    opts.get_option("source", source);
    TS_ASSERT_EQUALS(source, (size_t)3);
  }

  void test_defaults(void) {
    pregel_options opts;
    TS_ASSERT_EQUALS(opts.get_concurrency(), (size_t)4);
    TS_ASSERT_EQUALS(opts.get_max_iterations(), (size_t)20);
    TS_ASSERT(!opts.get_tolerance());
    TS_ASSERT(!opts.get_is_asynchronous());
    TS_ASSERT_EQUALS(opts.get_partitioning(), partitioning::RANGE);
    TS_ASSERT(!opts.get_track_sender());
    opts.validate();
  }

  void test_validate(void) {
    pregel_options opts;
    opts.set_concurrency(0);
    TS_ASSERT_THROWS(opts.validate(), config_error);
    opts.set_concurrency(2).set_max_iterations(0);
    TS_ASSERT_THROWS(opts.validate(), config_error);
    opts.set_max_iterations(5).set_tolerance(-1.0);
    TS_ASSERT_THROWS(opts.validate(), config_error);
    opts.set_tolerance(0.0);
    TS_ASSERT_THROWS(opts.validate(), config_error);
    opts.set_tolerance(1e-6);
    opts.validate();
    opts.clear_tolerance();
    opts.validate();
    // config_error is an invalid_argument
    opts.set_concurrency(0);
    TS_ASSERT_THROWS(opts.validate(), std::invalid_argument);
  }

  void test_parse(void) {
    pregel_options opts =
      pregel_options::parse("concurrency=8 max_iterations=10 partitioning=degree");
    TS_ASSERT_EQUALS(opts.get_concurrency(), (size_t)8);
    TS_ASSERT_EQUALS(opts.get_max_iterations(), (size_t)10);
    TS_ASSERT_EQUALS(opts.get_partitioning(), partitioning::DEGREE);

    opts = pregel_options::parse("tolerance=0.01 is_asynchronous=true track_sender=1 "
                                 "partitioning=Auto");
    TS_ASSERT(opts.get_tolerance());
    TS_ASSERT_DELTA(*opts.get_tolerance(), 0.01, 1e-12);
    TS_ASSERT(opts.get_is_asynchronous());
    TS_ASSERT(opts.get_track_sender());
    TS_ASSERT_EQUALS(opts.get_partitioning(), partitioning::AUTO);

    TS_ASSERT_THROWS(pregel_options::parse("concurrency=0"), config_error);
    TS_ASSERT_THROWS(pregel_options::parse("concurrency=-2"), config_error);
    TS_ASSERT_THROWS(pregel_options::parse("max_iterations=ten"), config_error);
    TS_ASSERT_THROWS(pregel_options::parse("tolerance=-0.5"), config_error);
    TS_ASSERT_THROWS(pregel_options::parse("partitioning=random"), config_error);
  }

  void test_parse_booleans(void) {
    pregel_options opts = pregel_options::parse("is_asynchronous=YES track_sender=0");
    TS_ASSERT(opts.get_is_asynchronous());
    TS_ASSERT(!opts.get_track_sender());
    opts = pregel_options::parse("is_asynchronous=no track_sender=True");
    TS_ASSERT(!opts.get_is_asynchronous());
    TS_ASSERT(opts.get_track_sender());

    TS_ASSERT_THROWS(pregel_options::parse("is_asynchronous=ture"), config_error);
    TS_ASSERT_THROWS(pregel_options::parse("track_sender=yes-please"), config_error);
    TS_ASSERT_THROWS(pregel_options::parse("is_asynchronous=true track_sender=2"),
                     config_error);
  }

  void test_to_string_parses_back(void) {
    pregel_options opts;
    opts.set_concurrency(3).set_tolerance(0.25).set_partitioning(partitioning::AUTO);
    pregel_options back = pregel_options::parse(opts.to_string());
    TS_ASSERT_EQUALS(back.get_concurrency(), (size_t)3);
    TS_ASSERT_EQUALS(back.get_partitioning(), partitioning::AUTO);
    TS_ASSERT_DELTA(*back.get_tolerance(), 0.25, 1e-12);
  }

  void test_partitioning_names(void) {
    TS_ASSERT_EQUALS(partitioning::parse("range"), partitioning::RANGE);
    TS_ASSERT_EQUALS(partitioning::parse("DEGREE"), partitioning::DEGREE);
    TS_ASSERT_EQUALS(partitioning::parse("aUtO"), partitioning::AUTO);
    TS_ASSERT_EQUALS(partitioning::to_string(partitioning::DEGREE), "DEGREE");
    TS_ASSERT_THROWS(partitioning::parse(""), config_error);
  }

  void test_command_line(void) {
    command_line_options clopts("test");
    size_t source = 0;
    clopts.attach_option("source", &source, source, "source vertex");
    const char* argv[] = {"prog", "--concurrency=2", "--max_iterations=7",
                          "--partitioning=auto", "--tolerance=0.1",
                          "--source=5", "--log_level=warning"};
    TS_ASSERT(clopts.parse(7, argv));
    const pregel_options& opts = clopts.get_pregel_options();
    TS_ASSERT_EQUALS(opts.get_concurrency(), (size_t)2);
    TS_ASSERT_EQUALS(opts.get_max_iterations(), (size_t)7);
    TS_ASSERT_EQUALS(opts.get_partitioning(), partitioning::AUTO);
    TS_ASSERT_DELTA(*opts.get_tolerance(), 0.1, 1e-12);
    TS_ASSERT_EQUALS(source, (size_t)5);
    TS_ASSERT(clopts.is_set("source"));
    TS_ASSERT_EQUALS(global_logger().get_log_level(), LOG_WARNING);
    global_logger().set_log_level(LOG_INFO);
  }

  void test_command_line_rejects(void) {
    command_line_options clopts("test");
    const char* argv[] = {"prog", "--concurrency=0"};
    TS_ASSERT(!clopts.parse(2, argv));

    command_line_options clopts2("test");
    const char* argv2[] = {"prog", "--partitioning=zigzag"};
    TS_ASSERT(!clopts2.parse(2, argv2));
  }
};
