#include <cfloat>
#include <limits>
#include <vector>
#include <algorithm>
#include <boost/bind.hpp>
#include <cxxtest/TestSuite.h>
#include <bsplab/messaging/sync_queue_messenger.hpp>
#include <bsplab/messaging/reducing_messenger.hpp>
#include <bsplab/messaging/async_queue_messenger.hpp>
#include <bsplab/messaging/messenger_factory.hpp>
#include <bsplab/messaging/message_reducer.hpp>
#include <bsplab/parallel/thread_pool.hpp>
#include <bsplab/util/error_types.hpp>

using namespace bsplab;

std::vector<double> read_all(imessenger& m, vertex_id_type node, bool first = false) {
  boost::shared_ptr<imessage_iterator> iter = m.message_iterator();
  m.init_message_iterator(*iter, node, first);
  messages msgs(iter.get());
  std::vector<double> ret;
  double v;
  while (msgs.next(v)) ret.push_back(v);
  return ret;
}

void send_many(imessenger* m, vertex_id_type source, vertex_id_type target,
               size_t count) {
  for (size_t i = 0; i < count; ++i) m->send_to(source, target, 1.0);
}


class MessengerTestSuite : public CxxTest::TestSuite {
public:
  // a message sent in superstep k is read in k+1, not in k
  void check_message_delay(imessenger& m) {
    m.init_iteration(0);
    m.send_to(0, 1, 5.0);
    TS_ASSERT(read_all(m, 1).empty());
    m.init_iteration(1);
    std::vector<double> got = read_all(m, 1);
    TS_ASSERT_EQUALS(got.size(), (size_t)1);
    TS_ASSERT_EQUALS(got[0], 5.0);
    m.send_to(0, 2, 6.0);
    TS_ASSERT(read_all(m, 2).empty());
    m.init_iteration(2);
    // the previous generation is gone
    TS_ASSERT(read_all(m, 1).empty());
    TS_ASSERT_EQUALS(read_all(m, 2).size(), (size_t)1);
  }

  void test_sync_delay(void) {
    sync_queue_messenger m(4, false);
    check_message_delay(m);
  }

  void test_reducing_delay(void) {
    reducing_messenger m(4, reducer_type::create(reducer_type::SUM), false);
    check_message_delay(m);
  }

  void test_sync_queue(void) {
    sync_queue_messenger m(3, true);
    m.init_iteration(0);
    m.send_to(0, 2, 1.0);
    m.send_to(1, 2, 2.0);
    m.init_iteration(1);
    // the first iteration never sees messages
    TS_ASSERT(read_all(m, 2, true).empty());
    std::vector<double> got = read_all(m, 2);
    std::sort(got.begin(), got.end());
    TS_ASSERT_EQUALS(got.size(), (size_t)2);
    TS_ASSERT_EQUALS(got[0], 1.0);
    TS_ASSERT_EQUALS(got[1], 2.0);
    TS_ASSERT(m.sender(2));
    TS_ASSERT_EQUALS(*m.sender(2), (vertex_id_type)1);
    TS_ASSERT(!m.sender(0));

    // reset replays the messages
    boost::shared_ptr<imessage_iterator> iter = m.message_iterator();
    m.init_message_iterator(*iter, 2, false);
    double v;
    while (iter->next(v)) { }
    TS_ASSERT(!iter->next(v));
    iter->reset();
    TS_ASSERT(iter->next(v));
    TS_ASSERT_EQUALS(*iter->sender(), (vertex_id_type)1);
  }

  void test_sync_without_sender(void) {
    sync_queue_messenger m(2, false);
    m.init_iteration(0);
    m.send_to(0, 1, 1.0);
    m.init_iteration(1);
    TS_ASSERT(!m.sender(1));
  }

  void test_concurrent_send(void) {
    sync_queue_messenger m(2, false);
    m.init_iteration(0);
    thread_pool pool(4);
    for (size_t i = 0; i < 4; ++i) {
      pool.launch(boost::bind(send_many, &m, 0, 1, 1000));
    }
    pool.join();
    m.init_iteration(1);
    TS_ASSERT_EQUALS(read_all(m, 1).size(), (size_t)4000);
  }

  void test_reducing(void) {
    reducing_messenger m(3, reducer_type::create(reducer_type::MIN), true);
    m.init_iteration(0);
    m.send_to(0, 2, 4.0);
    m.send_to(1, 2, 3.0);
    m.send_to(0, 2, 8.0);
    m.init_iteration(1);
    std::vector<double> got = read_all(m, 2);
    TS_ASSERT_EQUALS(got.size(), (size_t)1);
    TS_ASSERT_EQUALS(got[0], 3.0);
    // the sender of the last change of the minimum
    TS_ASSERT_EQUALS(*m.sender(2), (vertex_id_type)1);
    TS_ASSERT(read_all(m, 0).empty());
    TS_ASSERT(!m.sender(0));
  }

  void test_reducing_identity_value_is_delivered(void) {
    reducing_messenger m(2, reducer_type::create(reducer_type::SUM), false);
    m.init_iteration(0);
    m.send_to(0, 1, 0.0);
    m.init_iteration(1);
    std::vector<double> got = read_all(m, 1);
    TS_ASSERT_EQUALS(got.size(), (size_t)1);
    TS_ASSERT_EQUALS(got[0], 0.0);
  }

  void test_reducing_concurrent(void) {
    reducing_messenger m(2, reducer_type::create(reducer_type::SUM), false);
    m.init_iteration(0);
    thread_pool pool(4);
    for (size_t i = 0; i < 4; ++i) {
      pool.launch(boost::bind(send_many, &m, 0, 1, 1000));
    }
    pool.join();
    m.init_iteration(1);
    TS_ASSERT_EQUALS(read_all(m, 1)[0], 4000.0);
  }

  void test_async(void) {
    async_queue_messenger m(3, true);
    m.init_iteration(0);
    m.send_to(0, 1, 1.0);
    // superstep 0 never reads, so the message waits
    TS_ASSERT(read_all(m, 1, true).empty());
    m.init_iteration(1);
    m.send_to(2, 1, 2.0);
    // both pending messages, including the one of this superstep
    std::vector<double> got = read_all(m, 1);
    TS_ASSERT_EQUALS(got.size(), (size_t)2);
    TS_ASSERT_EQUALS(*m.sender(1), (vertex_id_type)2);
    // reading consumes
    TS_ASSERT(read_all(m, 1).empty());
    m.send_to(0, 1, 3.0);
    m.init_iteration(2);
    TS_ASSERT_EQUALS(read_all(m, 1).size(), (size_t)1);
  }

  void test_async_rejects_nan(void) {
    async_queue_messenger m(2, false);
    m.init_iteration(0);
    TS_ASSERT_THROWS(m.send_to(0, 1, std::numeric_limits<double>::quiet_NaN()),
                     invalid_message);
    m.init_iteration(1);
    TS_ASSERT(read_all(m, 1).empty());
  }

  void test_empty_messages(void) {
    messages& empty = messages::empty_messages();
    TS_ASSERT(empty.empty());
    double v;
    TS_ASSERT(!empty.next(v));
    TS_ASSERT(!empty.sender());
    TS_ASSERT_EQUALS(&empty, &messages::empty_messages());
  }

  void test_reducer_identity(void) {
    const double samples[] = {-3.5, 0.0, 1.0, 1e9, -DBL_MAX / 2};
    const reducer_type::reducer_type_enum types[] =
      {reducer_type::SUM, reducer_type::MIN, reducer_type::MAX};
    for (size_t t = 0; t < 3; ++t) {
      boost::shared_ptr<imessage_reducer> r = reducer_type::create(types[t]);
      for (size_t i = 0; i < 5; ++i) {
        TS_ASSERT_EQUALS(r->reduce(r->identity(), samples[i]), samples[i]);
      }
    }
    boost::shared_ptr<imessage_reducer> count = reducer_type::create(reducer_type::COUNT);
    TS_ASSERT_EQUALS(count->identity(), 0.0);
    TS_ASSERT_EQUALS(count->reduce(count->reduce(count->identity(), 7.0), -2.0), 2.0);
    TS_ASSERT_EQUALS(reducer_type::create(reducer_type::MIN)->identity(), DBL_MAX);
    TS_ASSERT_EQUALS(reducer_type::create(reducer_type::MAX)->identity(), -DBL_MAX);
  }

  void test_reducer_order_independence(void) {
    double values[] = {4.0, -1.0, 2.5, 8.0, 0.5};
    const reducer_type::reducer_type_enum types[] =
      {reducer_type::SUM, reducer_type::MIN, reducer_type::MAX, reducer_type::COUNT};
    for (size_t t = 0; t < 4; ++t) {
      boost::shared_ptr<imessage_reducer> r = reducer_type::create(types[t]);
      std::sort(values, values + 5);
      double expected = r->identity();
      for (size_t i = 0; i < 5; ++i) expected = r->reduce(expected, values[i]);
      while (std::next_permutation(values, values + 5)) {
        double acc = r->identity();
        for (size_t i = 0; i < 5; ++i) acc = r->reduce(acc, values[i]);
        TS_ASSERT_EQUALS(acc, expected);
      }
    }
  }

  void test_reducer_names(void) {
    TS_ASSERT_EQUALS(reducer_type::parse("sum"), reducer_type::SUM);
    TS_ASSERT_EQUALS(reducer_type::parse("Min"), reducer_type::MIN);
    TS_ASSERT_EQUALS(reducer_type::parse("MAX"), reducer_type::MAX);
    TS_ASSERT_EQUALS(reducer_type::parse("count"), reducer_type::COUNT);
    TS_ASSERT_EQUALS(reducer_type::to_string(reducer_type::COUNT), "COUNT");
    TS_ASSERT_THROWS(reducer_type::parse("avg"), config_error);
  }

  void test_factory(void) {
    pregel_options opts;
    boost::shared_ptr<imessage_reducer> none;
    boost::shared_ptr<imessenger> m = messenger_factory::create(opts, 4, none);
    TS_ASSERT(dynamic_cast<sync_queue_messenger*>(m.get()) != NULL);

    opts.set_is_asynchronous(true);
    m = messenger_factory::create(opts, 4, none);
    TS_ASSERT(dynamic_cast<async_queue_messenger*>(m.get()) != NULL);

    m = messenger_factory::create(opts, 4, reducer_type::create(reducer_type::SUM));
    TS_ASSERT(dynamic_cast<reducing_messenger*>(m.get()) != NULL);
  }
};
