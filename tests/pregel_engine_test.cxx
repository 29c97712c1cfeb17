#include <algorithm>
#include <limits>
#include <stdexcept>
#include <vector>
#include <cxxtest/TestSuite.h>
#include <bsplab/engine/pregel_engine.hpp>
#include <bsplab/graph/csr_graph.hpp>
#include <bsplab/util/error_types.hpp>

using namespace bsplab;

// relaxes "dist" along the out-edges, starting at vertex 0
class path_distance : public ipregel_computation {
  bool use_reducer;
public:
  explicit path_distance(bool use_reducer = false) : use_reducer(use_reducer) { }

  pregel_schema schema(const pregel_options&) const {
    return pregel_schema::builder().add_public("dist", value_type::DOUBLE).build();
  }

  void init(init_context& ctx) {
    ctx.set_double_node_value("dist", ctx.node_id() == 0 ?
                              0.0 : std::numeric_limits<double>::infinity());
  }

  void compute(compute_context& ctx, messages& msgs) {
    if (ctx.is_initial_superstep()) {
      if (ctx.node_id() == 0) ctx.send_to_neighbors(ctx.double_node_value("dist"));
      else ctx.vote_to_halt();
      return;
    }
    if (msgs.empty()) {
      ctx.vote_to_halt();
      return;
    }
    double best = std::numeric_limits<double>::infinity(), m;
    while (msgs.next(m)) best = std::min(best, m);
    if (best + 1 < ctx.double_node_value("dist")) {
      ctx.set_double_node_value("dist", best + 1);
      ctx.send_to_neighbors(best + 1);
    } else {
      ctx.vote_to_halt();
    }
  }

  boost::shared_ptr<imessage_reducer> reducer() const {
    if (!use_reducer) return boost::shared_ptr<imessage_reducer>();
    return reducer_type::create(reducer_type::MIN);
  }
};


// counts the compute calls of every vertex
class call_counter : public ipregel_computation {
public:
  std::vector<bool> halted_after_superstep1;

  pregel_schema schema(const pregel_options&) const {
    return pregel_schema::builder()
      .add_public("calls", value_type::LONG)
      .add("received", value_type::LONG, visibility::PRIVATE)
      .build();
  }

  void compute(compute_context& ctx, messages& msgs) {
    ctx.set_long_node_value("calls", ctx.long_node_value("calls") + 1);
    if (!msgs.empty()) ctx.set_long_node_value("received", ctx.long_node_value("received") + 1);
    if (ctx.is_initial_superstep()) {
      if (ctx.node_id() == 0) ctx.send_to(1, 1.0);
      ctx.vote_to_halt();
    } else if (ctx.superstep() >= 2) {
      ctx.vote_to_halt();
    }
  }

  bool master_compute(master_compute_context& ctx) {
    if (ctx.superstep() == 1) {
      for (vertex_id_type v = 0; v < ctx.node_count(); ++v) {
        halted_after_superstep1.push_back(ctx.is_halted(v));
      }
    }
    return false;
  }
};


// minimum label propagation over undirected edges
class min_label : public ipregel_computation {
  bool use_reducer;
public:
  explicit min_label(bool use_reducer) : use_reducer(use_reducer) { }

  pregel_schema schema(const pregel_options&) const {
    return pregel_schema::builder().add_public("label", value_type::LONG).build();
  }

  void init(init_context& ctx) {
    ctx.set_long_node_value("label", ctx.node_id());
  }

  void compute(compute_context& ctx, messages& msgs) {
    int64_t label = ctx.long_node_value("label");
    if (ctx.is_initial_superstep()) {
      ctx.send_to_neighbors(double(label));
    } else {
      double m;
      int64_t best = label;
      while (msgs.next(m)) best = std::min(best, int64_t(m));
      if (best < label) {
        ctx.set_long_node_value("label", best);
        ctx.send_to_neighbors(double(best));
      }
    }
    ctx.vote_to_halt();
  }

  boost::shared_ptr<imessage_reducer> reducer() const {
    if (!use_reducer) return boost::shared_ptr<imessage_reducer>();
    return reducer_type::create(reducer_type::MIN);
  }
};


// never halts
class ping_self : public ipregel_computation {
public:
  pregel_schema schema(const pregel_options&) const {
    return pregel_schema::builder().add_public("count", value_type::LONG).build();
  }
  void compute(compute_context& ctx, messages&) {
    ctx.set_long_node_value("count", ctx.long_node_value("count") + 1);
    ctx.send_to(ctx.node_id(), 1.0);
  }
};


class failing : public ipregel_computation {
public:
  bool closed;
  size_t fail_superstep;
  failing(size_t fail_superstep) : closed(false), fail_superstep(fail_superstep) { }
  pregel_schema schema(const pregel_options&) const {
    return pregel_schema::builder().add_public("x", value_type::LONG).build();
  }
  void compute(compute_context& ctx, messages&) {
    if (ctx.superstep() == fail_superstep && ctx.node_id() == 1500) {
      throw std::runtime_error("compute failed");
    }
    ctx.set_long_node_value("x", ctx.superstep());
  }
  void close() { closed = true; }
};


class terminating : public ipregel_computation {
public:
  termination_flag* flag;
  terminating() : flag(NULL) { }
  pregel_schema schema(const pregel_options&) const {
    return pregel_schema::builder().add_public("x", value_type::LONG).build();
  }
  void compute(compute_context& ctx, messages&) {
    if (ctx.superstep() == 2 && ctx.node_id() == 0) flag->terminate();
  }
};


// stops from master compute and keeps a running total on vertex 0
class master_stop : public ipregel_computation {
public:
  pregel_schema schema(const pregel_options&) const {
    return pregel_schema::builder()
      .add_public("value", value_type::DOUBLE)
      .add_with_default("total", runtime_value::of_double(0.0), visibility::PRIVATE)
      .build();
  }
  void compute(compute_context& ctx, messages&) {
    ctx.set_double_node_value("value", 1.0);
  }
  bool master_compute(master_compute_context& ctx) {
    double sum = 0;
    for (vertex_id_type v = 0; v < ctx.node_count(); ++v) {
      sum += ctx.double_node_value(v, "value");
    }
    ctx.set_double_node_value(0, "total", ctx.double_node_value(0, "total") + sum);
    return ctx.superstep() == 3;
  }
};


// copies its seed from the graph
class seeded : public ipregel_computation {
  value_type::value_type_enum seed_type;
public:
  explicit seeded(value_type::value_type_enum t) : seed_type(t) { }
  pregel_schema schema(const pregel_options&) const {
    return pregel_schema::builder()
      .add_with_property_source("value", seed_type, "seed")
      .add("direct", value_type::DOUBLE)
      .build();
  }
  void compute(compute_context& ctx, messages&) {
    boost::optional<runtime_value> v = ctx.node_property_value("seed");
    ctx.set_double_node_value("direct", v ? v->convert_to(value_type::DOUBLE).as_double() : -1.0);
    ctx.vote_to_halt();
  }
};


csr_graph make_path(size_t n) {
  std::vector<csr_graph::edge_type> edges;
  for (size_t v = 0; v + 1 < n; ++v) edges.push_back(csr_graph::edge_type(v, v + 1));
  return csr_graph(n, edges);
}

// two binary trees with edges in both directions, rooted at 0 and 2500
csr_graph make_forest() {
  std::vector<csr_graph::edge_type> edges;
  for (size_t v = 1; v < 2500; ++v) {
    edges.push_back(csr_graph::edge_type(v, v / 2));
    edges.push_back(csr_graph::edge_type(v / 2, v));
  }
  for (size_t v = 2501; v < 5000; ++v) {
    const size_t parent = 2500 + (v - 2500) / 2;
    edges.push_back(csr_graph::edge_type(v, parent));
    edges.push_back(csr_graph::edge_type(parent, v));
  }
  return csr_graph(5000, edges);
}

void construct_engine(const csr_graph& graph, const pregel_options& opts,
                      ipregel_computation& computation) {
  pregel_engine engine(graph, opts, computation);
}

pregel_options options_for(partitioning::partitioning_enum p) {
  pregel_options opts;
  opts.set_concurrency(4).set_partitioning(p);
  return opts;
}


class PregelEngineTestSuite : public CxxTest::TestSuite {
public:
  void check_path_result(const pregel_result& result) {
    TS_ASSERT_EQUALS(result.get_status(), execution_status::EXEC_CONVERGED);
    TS_ASSERT(result.did_converge());
    TS_ASSERT_EQUALS(result.last_iteration(), (size_t)4);
    TS_ASSERT_EQUALS(result.ran_iterations(), (size_t)5);
    for (vertex_id_type v = 0; v < 4; ++v) {
      TS_ASSERT_EQUALS(result.node_values().double_value("dist", v), double(v));
    }
  }

  void test_path(void) {
    csr_graph graph = make_path(4);
    const partitioning::partitioning_enum strategies[] =
      {partitioning::RANGE, partitioning::DEGREE, partitioning::AUTO};
    for (size_t s = 0; s < 3; ++s) {
      path_distance computation;
      pregel_engine engine(graph, options_for(strategies[s]), computation);
      check_path_result(engine.run());
    }
  }

  void test_path_with_reducer(void) {
    csr_graph graph = make_path(4);
    path_distance computation(true);
    pregel_engine engine(graph, options_for(partitioning::RANGE), computation);
    check_path_result(engine.run());
  }

  void test_path_async(void) {
    csr_graph graph = make_path(4);
    path_distance computation;
    pregel_options opts = options_for(partitioning::RANGE);
    opts.set_is_asynchronous(true);
    pregel_engine engine(graph, opts, computation);
    pregel_result result = engine.run();
    // one partition: 1, 2 and 3 relax in superstep 1 and all halt in 2
    TS_ASSERT_EQUALS(engine.partitions().size(), (size_t)1);
    TS_ASSERT(result.did_converge());
    TS_ASSERT_EQUALS(result.last_iteration(), (size_t)2);
    TS_ASSERT_EQUALS(result.ran_iterations(), (size_t)3);
    for (vertex_id_type v = 0; v < 4; ++v) {
      TS_ASSERT_EQUALS(result.node_values().double_value("dist", v), double(v));
    }
  }

  void test_halt_and_reactivation(void) {
    std::vector<csr_graph::edge_type> edges;
    edges.push_back(csr_graph::edge_type(0, 1));
    csr_graph graph(3, edges);
    call_counter computation;
    pregel_engine engine(graph, options_for(partitioning::RANGE), computation);
    pregel_result result = engine.run();
    TS_ASSERT(result.did_converge());
    TS_ASSERT_EQUALS(result.last_iteration(), (size_t)2);
    const node_value& values = result.node_values();
    // halted without messages: only superstep 0
    TS_ASSERT_EQUALS(values.long_value("calls", 0), 1);
    TS_ASSERT_EQUALS(values.long_value("calls", 2), 1);
    // woken up by the message in superstep 1, halts in superstep 2
    TS_ASSERT_EQUALS(values.long_value("calls", 1), 3);
    TS_ASSERT_EQUALS(values.long_value("received", 1), 1);
    TS_ASSERT_EQUALS(values.long_value("received", 0), 0);
    TS_ASSERT_EQUALS(computation.halted_after_superstep1.size(), (size_t)3);
    TS_ASSERT(computation.halted_after_superstep1[0]);
    TS_ASSERT(!computation.halted_after_superstep1[1]);
    TS_ASSERT(computation.halted_after_superstep1[2]);
  }

  void test_same_result_for_every_strategy(void) {
    csr_graph graph = make_forest();
    const partitioning::partitioning_enum strategies[] =
      {partitioning::RANGE, partitioning::DEGREE, partitioning::AUTO};
    for (size_t r = 0; r < 2; ++r) {
      std::vector<int64_t> reference;
      execution_status::status_enum reference_status = execution_status::EXEC_UNSET;
      for (size_t s = 0; s < 3; ++s) {
        min_label computation(r == 1);
        pregel_options opts = options_for(strategies[s]);
        opts.set_max_iterations(100);
        pregel_engine engine(graph, opts, computation);
        pregel_result result = engine.run();
        std::vector<int64_t> labels;
        for (vertex_id_type v = 0; v < graph.num_vertices(); ++v) {
          labels.push_back(result.node_values().long_value("label", v));
        }
        if (s == 0) {
          reference = labels;
          reference_status = result.get_status();
          TS_ASSERT_EQUALS(reference_status, execution_status::EXEC_CONVERGED);
          TS_ASSERT_EQUALS(labels[2499], 0);
          TS_ASSERT_EQUALS(labels[4999], 2500);
        } else {
          TS_ASSERT_EQUALS(result.get_status(), reference_status);
          TS_ASSERT(labels == reference);
        }
      }
    }
  }

  void test_iteration_limit(void) {
    csr_graph graph = make_path(20);
    ping_self computation;
    pregel_options opts = options_for(partitioning::AUTO);
    opts.set_max_iterations(3);
    pregel_engine engine(graph, opts, computation);
    pregel_result result = engine.run();
    TS_ASSERT_EQUALS(result.get_status(), execution_status::EXEC_ITERATION_LIMIT);
    TS_ASSERT(!result.did_converge());
    TS_ASSERT_EQUALS(result.ran_iterations(), (size_t)3);
    TS_ASSERT_EQUALS(result.last_iteration(), (size_t)2);
    TS_ASSERT_EQUALS(result.node_values().long_value("count", 7), 3);
  }

  void test_compute_exception(void) {
    csr_graph graph = make_path(3000);
    const partitioning::partitioning_enum strategies[] =
      {partitioning::RANGE, partitioning::DEGREE, partitioning::AUTO};
    for (size_t s = 0; s < 3; ++s) {
      failing computation(1);
      pregel_engine engine(graph, options_for(strategies[s]), computation);
      TS_ASSERT_THROWS(engine.run(), std::runtime_error);
      TS_ASSERT(computation.closed);
    }
  }

  void test_termination(void) {
    csr_graph graph = make_path(50);
    terminating computation;
    pregel_engine engine(graph, options_for(partitioning::RANGE), computation);
    computation.flag = &engine.get_termination_flag();
    pregel_result result = engine.run();
    TS_ASSERT_EQUALS(result.get_status(), execution_status::EXEC_TERMINATED);
    TS_ASSERT_EQUALS(result.ran_iterations(), (size_t)3);
  }

  void test_global_termination(void) {
    csr_graph graph = make_path(10);
    ping_self computation;
    pregel_engine engine(graph, options_for(partitioning::AUTO), computation);
    termination_flag::global().terminate();
    pregel_result result = engine.run();
    termination_flag::global().reset();
    TS_ASSERT_EQUALS(result.get_status(), execution_status::EXEC_TERMINATED);
    TS_ASSERT_EQUALS(result.ran_iterations(), (size_t)0);
    TS_ASSERT_EQUALS(result.node_values().long_value("count", 0), 0);
  }

  void test_master_compute(void) {
    csr_graph graph = make_path(10);
    master_stop computation;
    pregel_engine engine(graph, options_for(partitioning::RANGE), computation);
    pregel_result result = engine.run();
    TS_ASSERT(result.did_converge());
    TS_ASSERT_EQUALS(result.last_iteration(), (size_t)3);
    TS_ASSERT_EQUALS(result.node_values().double_value("total", 0), 40.0);
    std::vector<std::string> keys = result.node_values().public_keys();
    TS_ASSERT_EQUALS(keys.size(), (size_t)1);
    TS_ASSERT_EQUALS(keys[0], "value");
  }

  void test_property_source(void) {
    csr_graph graph = make_path(4);
    std::vector<double> seeds(4, 2.5);
    seeds[2] = std::numeric_limits<double>::quiet_NaN();
    graph.add_node_properties("seed", boost::shared_ptr<inode_property_values>
                              (new array_property_values(seeds)));
    seeded computation(value_type::DOUBLE);
    pregel_engine engine(graph, options_for(partitioning::RANGE), computation);
    pregel_result result = engine.run();
    const node_value& values = result.node_values();
    TS_ASSERT_EQUALS(values.double_value("value", 0), 2.5);
    // no value in the column: the default stays
    TS_ASSERT_EQUALS(values.double_value("value", 2), 0.0);
    TS_ASSERT_EQUALS(values.double_value("direct", 3), 2.5);
    TS_ASSERT_EQUALS(values.double_value("direct", 2), -1.0);
  }

  void test_property_source_widening(void) {
    csr_graph graph = make_path(3);
    std::vector<int64_t> seeds(3, 7);
    graph.add_node_properties("seed", boost::shared_ptr<inode_property_values>
                              (new array_property_values(seeds)));
    seeded computation(value_type::DOUBLE);
    pregel_engine engine(graph, options_for(partitioning::RANGE), computation);
    TS_ASSERT_EQUALS(engine.run().node_values().double_value("value", 1), 7.0);

    seeded mismatch(value_type::LONG_ARRAY);
    pregel_engine engine2(graph, options_for(partitioning::RANGE), mismatch);
    TS_ASSERT_THROWS(engine2.run(), type_mismatch);
  }

  void test_property_source_missing_column(void) {
    csr_graph graph = make_path(3);
    seeded computation(value_type::LONG);
    pregel_engine engine(graph, options_for(partitioning::RANGE), computation);
    pregel_result result = engine.run();
    TS_ASSERT(result.did_converge());
    TS_ASSERT_EQUALS(result.node_values().long_value("value", 0), 0);
  }

  void test_invalid_config(void) {
    csr_graph graph = make_path(3);
    ping_self computation;
    pregel_options opts;
    opts.set_concurrency(0);
    TS_ASSERT_THROWS(construct_engine(graph, opts, computation), config_error);
  }

  void test_empty_graph(void) {
    csr_graph graph;
    ping_self computation;
    pregel_engine engine(graph, options_for(partitioning::AUTO), computation);
    pregel_result result = engine.run();
    TS_ASSERT(result.did_converge());
    TS_ASSERT_EQUALS(result.ran_iterations(), (size_t)1);
  }
};
