/**  
 * Copyright (c) 2009 Carnegie Mellon University. 
 *     All rights reserved.
 *
 *  Licensed under the Apache License, Version 2.0 (the "License");
 *  you may not use this file except in compliance with the License.
 *  You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 *  Unless required by applicable law or agreed to in writing,
 *  software distributed under the License is distributed on an "AS
 *  IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either
 *  express or implied.  See the License for the specific language
 *  governing permissions and limitations under the License.
 *
 * For more about this software visit:
 *
 *      http://www.graphlab.ml.cmu.edu
 *
 */


#include <boost/bind.hpp>
#include <boost/lexical_cast.hpp>
#include <bsplab/engine/pregel_engine.hpp>
#include <bsplab/engine/compute_step.hpp>
#include <bsplab/messaging/messenger_factory.hpp>
#include <bsplab/util/timer.hpp>
#include <bsplab/logger/assertions.hpp>

#include <bsplab/macros_def.hpp>
namespace bsplab {

  pregel_engine::pregel_engine(const igraph& graph, const pregel_options& cfg,
                               ipregel_computation& computation,
                               iprogress_tracker* tracker)
    : graph(graph), config(cfg), computation(computation),
      tracker(tracker != NULL ? tracker : &null_tracker), has_run(false) {
    config.validate();
    const size_t n = graph.num_vertices();
    values.reset(new node_value(computation.schema(config), n));
    messenger = messenger_factory::create(config, n, computation.reducer());
    vote_bits.resize(n);
    vote_bits.clear();

    state.graph = &graph;
    state.config = &config;
    state.values = values.get();
    state.messenger = messenger.get();
    state.vote_bits = &vote_bits;
    state.engine_flag = &flag;

    switch(config.get_partitioning()) {
    case partitioning::AUTO:
      fj_pool.reset(new fork_join_pool(config.get_concurrency()));
      break;
    case partitioning::RANGE:
      parts = partition::range_partition(config.get_concurrency(), n);
      static_pool.reset(new thread_pool(config.get_concurrency()));
      break;
    case partitioning::DEGREE:
      parts = partition::degree_partition(graph, config.get_concurrency());
      static_pool.reset(new thread_pool(config.get_concurrency()));
      break;
    };
    logstream(LOG_INFO) << "Pregel engine: " << n << " vertices, "
                        << graph.num_edges() << " edges, schema "
                        << values->schema() << ", " << config << std::endl;
  } // end of pregel_engine


  void pregel_engine::init_from_property_sources() {
    const size_t n = graph.num_vertices();
    foreach(const pregel_schema_element& elem, values->schema().elements()) {
      if (!elem.property_source) continue;
      const inode_property_values* column = graph.node_properties(*elem.property_source);
      if (column == NULL) {
        logstream(LOG_WARNING) << "Node property '" << *elem.property_source
                               << "' does not exist. '" << elem.property_key
                               << "' keeps its default value." << std::endl;
        continue;
      }
      // fail before the first row if the column cannot be converted
      runtime_value::default_of(column->type()).convert_to(elem.type);
      for (vertex_id_type v = 0; v < n; ++v) {
        boost::optional<runtime_value> val = runtime_value::from_property(*column, v);
        if (val) values->set_value(elem.property_key, v, *val);
      }
    }
  } // end of init_from_property_sources


  void pregel_engine::run_superstep() {
    const compute_step::init_function_type init_fn =
      boost::bind(&ipregel_computation::init, &computation, _1);
    const compute_step::compute_function_type compute_fn =
      boost::bind(&ipregel_computation::compute, &computation, _1, _2);

    if (fj_pool) {
      compute_step root(state, init_fn, compute_fn,
                        partition(0, graph.num_vertices()), fj_pool.get(), *tracker);
      fj_pool->invoke(boost::bind(&compute_step::compute, &root));
      return;
    }
    std::vector<boost::shared_ptr<compute_step> > steps;
    foreach(const partition& part, parts) {
      steps.push_back(boost::shared_ptr<compute_step>
                      (new compute_step(state, init_fn, compute_fn, part, NULL, *tracker)));
      static_pool->launch(boost::bind(&compute_step::compute, steps.back().get()));
    }
    // waits for all steps, then rethrows the first failure
    static_pool->join();
  } // end of run_superstep


  void pregel_engine::release() {
    messenger->release();
    computation.close();
  }


  pregel_result pregel_engine::run() {
    ASSERT_MSG(!has_run, "a pregel_engine can only run once");
    has_run = true;
    execution_status::status_enum status = execution_status::EXEC_UNSET;
    size_t ran = 0;
    timer ti;
    ti.start();
    try {
      init_from_property_sources();
      const size_t max_iterations = config.get_max_iterations();
      for (size_t iteration = 0; iteration < max_iterations; ++iteration) {
        if (state.terminated()) {
          status = execution_status::EXEC_TERMINATED;
          break;
        }
        state.superstep = iteration;
        state.message_sent = false;
        __sync_synchronize();
        messenger->init_iteration(iteration);

        logstream(LOG_DEBUG) << "Starting superstep " << iteration << std::endl;
        tracker->begin_task("Superstep " + boost::lexical_cast<std::string>(iteration),
                            graph.num_vertices());
        run_superstep();
        tracker->end_task();
        ++ran;

        if (state.terminated()) {
          status = execution_status::EXEC_TERMINATED;
          break;
        }
        master_compute_context master_ctx(state);
        const bool master_stop = computation.master_compute(master_ctx);
        __sync_synchronize();
        const bool all_halted = vote_bits.all_set();
        logstream(LOG_DEBUG) << "Superstep " << iteration << ": "
                             << vote_bits.popcount() << " halted, messages "
                             << (state.message_sent ? "sent" : "not sent") << std::endl;
        if (master_stop || (all_halted && !state.message_sent)) {
          status = execution_status::EXEC_CONVERGED;
          break;
        }
        if (iteration + 1 == max_iterations) {
          status = execution_status::EXEC_ITERATION_LIMIT;
        }
      }
    } catch (std::exception& e) {
      logstream(LOG_ERROR) << "Pregel computation failed in superstep "
                           << state.superstep << ": " << e.what() << std::endl;
      release();
      throw;
    } catch (...) {
      logstream(LOG_ERROR) << "Pregel computation failed in superstep "
                           << state.superstep << std::endl;
      release();
      throw;
    }
    release();
    logstream(LOG_INFO) << "Pregel run finished: " << execution_status::to_string(status)
                        << " after " << ran << " supersteps in "
                        << ti.current_time() << "s" << std::endl;
    return pregel_result(values, status, ran);
  } // end of run

} // end of namespace bsplab
#include <bsplab/macros_undef.hpp>
