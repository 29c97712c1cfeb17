#include <iostream>
#include <stdexcept>
#include <cxxtest/TestSuite.h>

#include <bsplab/parallel/pthread_tools.hpp>
#include <bsplab/parallel/thread_pool.hpp>
#include <bsplab/parallel/fork_join_pool.hpp>
#include <bsplab/parallel/atomic.hpp>
#include <bsplab/logger/assertions.hpp>
#include <bsplab/util/timer.hpp>
#include <boost/bind.hpp>

using namespace bsplab;

atomic<int> testval;

void test_inc() {
  usleep(10000);
  testval.inc();
}

void test_dec() {
  usleep(10000);
  testval.dec();
}

void thread_assert_false() {
  ASSERT_TRUE(false);
}

// sums [lo, hi) by recursive splitting on the pool
void fork_join_sum(fork_join_pool* pool, size_t lo, size_t hi, atomic<size_t>* sum) {
  if (hi - lo <= 16) {
    size_t local = 0;
    for (size_t i = lo; i < hi; ++i) local += i;
    sum->inc(local);
    return;
  }
  const size_t mid = lo + (hi - lo) / 2;
  pool->join(boost::bind(fork_join_sum, pool, lo, mid, sum),
             boost::bind(fork_join_sum, pool, mid, hi, sum));
}

void fork_join_throw_at(fork_join_pool* pool, size_t lo, size_t hi, size_t bad) {
  if (hi - lo == 1) {
    if (lo == bad) throw std::runtime_error("bad leaf");
    return;
  }
  const size_t mid = lo + (hi - lo) / 2;
  pool->join(boost::bind(fork_join_throw_at, pool, lo, mid, bad),
             boost::bind(fork_join_throw_at, pool, mid, hi, bad));
}


class ThreadToolsTestSuite : public CxxTest::TestSuite {
public:
  void test_thread_group_exception(void) {
    std::cout << "\n";
    std::cout << "----------------------------------------------------------------\n";
    std::cout << "This test will print a large number of assertion failures\n";
    std::cout << "and back traces. This is intentional as we are testing the\n" ;
    std::cout << "exception forwarding scheme\n";
    std::cout << "----------------------------------------------------------------\n";
    std::cout << std::endl;

    thread_group group;
    for (size_t i = 0;i < 10; ++i) {
      group.launch(thread_assert_false);
    }

    size_t numcaught = 0;
    while (group.running_threads() > 0) {
      try {
        group.join();
      }
      catch (const std::runtime_error&){
        numcaught++;
      }
    }
    std::cout << "Caught " << numcaught << " exceptions!" << std::endl;
    TS_ASSERT_EQUALS(numcaught, (size_t)10);
  }

  void test_thread_pool(void) {
    testval.value = 0;
    thread_pool pool(4);
    for (size_t j = 0;j < 10; ++j) {
      for (size_t i = 0;i < 10; ++i) {
        pool.launch(test_inc);
      }
      for (size_t i = 0;i < 10; ++i) {
        pool.launch(test_dec);
      }
    }
    pool.join();
    TS_ASSERT_EQUALS(testval.value, 0);
  }

  void test_thread_pool_exception(void) {
    thread_pool pool(4);
    for (size_t i = 0;i < 10; ++i) {
      pool.launch(thread_assert_false);
    }
    // the first failure is rethrown once every task finished
    TS_ASSERT_THROWS(pool.join(), std::runtime_error);
    // the pool stays usable
    testval.value = 0;
    pool.launch(test_inc);
    pool.join();
    TS_ASSERT_EQUALS(testval.value, 1);
  }

  void test_fork_join_sum(void) {
    fork_join_pool pool(4);
    TS_ASSERT_EQUALS(pool.size(), (size_t)4);
    for (size_t rep = 0; rep < 5; ++rep) {
      atomic<size_t> sum(0);
      pool.invoke(boost::bind(fork_join_sum, &pool, 0, 100000, &sum));
      TS_ASSERT_EQUALS(sum.value, (size_t)100000 * 99999 / 2);
    }
  }

  void test_fork_join_from_outside(void) {
    fork_join_pool pool(2);
    TS_ASSERT(!pool.is_worker_thread());
    atomic<size_t> sum(0);
    // join outside of the pool behaves like invoke
    pool.join(boost::bind(fork_join_sum, &pool, 0, 500, &sum),
              boost::bind(fork_join_sum, &pool, 500, 1000, &sum));
    TS_ASSERT_EQUALS(sum.value, (size_t)1000 * 999 / 2);
  }

  void test_fork_join_exception(void) {
    fork_join_pool pool(4);
    TS_ASSERT_THROWS(pool.invoke(boost::bind(fork_join_throw_at, &pool, 0, 4096, 3000)),
                     std::runtime_error);
    // the pool stays usable
    atomic<size_t> sum(0);
    pool.invoke(boost::bind(fork_join_sum, &pool, 0, 1000, &sum));
    TS_ASSERT_EQUALS(sum.value, (size_t)1000 * 999 / 2);
  }

  void test_single_worker(void) {
    fork_join_pool pool(1);
    atomic<size_t> sum(0);
    pool.invoke(boost::bind(fork_join_sum, &pool, 0, 10000, &sum));
    TS_ASSERT_EQUALS(sum.value, (size_t)10000 * 9999 / 2);
  }
};
