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


/**
 * \file
 *
 * The views of a run that the engine hands to user code: init_context
 * for the first touch of a vertex, compute_context for every superstep
 * and master_compute_context for the single threaded step after each
 * superstep.
 */
#ifndef BSPLAB_PREGEL_CONTEXT_HPP
#define BSPLAB_PREGEL_CONTEXT_HPP

#include <string>
#include <vector>
#include <boost/function.hpp>
#include <boost/optional.hpp>
#include <bsplab/engine/pregel_state.hpp>
#include <bsplab/schema/runtime_value.hpp>

namespace bsplab {

  /**
   * \brief The part of a context bound to one vertex.
   *
   * The row accessors read and write the Value Store row of node_id()
   * and throw schema_key_not_found or type_mismatch like node_value.
   */
  class node_context {
  public:
    explicit node_context(pregel_state& state) : state(&state), nid(0) { }

    vertex_id_type node_id() const { return nid; }
    size_t node_count() const { return state->graph->num_vertices(); }
    size_t relationship_count() const { return state->graph->num_edges(); }
    const pregel_options& config() const { return *state->config; }

    int64_t long_node_value(const std::string& key) const {
      return state->values->long_value(key, nid);
    }
    double double_node_value(const std::string& key) const {
      return state->values->double_value(key, nid);
    }
    const std::vector<int64_t>& long_array_node_value(const std::string& key) const {
      return state->values->long_array_value(key, nid);
    }
    const std::vector<double>& double_array_node_value(const std::string& key) const {
      return state->values->double_array_value(key, nid);
    }

    void set_long_node_value(const std::string& key, int64_t value) {
      state->values->set_long_value(key, nid, value);
    }
    void set_double_node_value(const std::string& key, double value) {
      state->values->set_double_value(key, nid, value);
    }
    void set_long_array_node_value(const std::string& key,
                                   const std::vector<int64_t>& value) {
      state->values->set_long_array_value(key, nid, value);
    }
    void set_double_array_node_value(const std::string& key,
                                     const std::vector<double>& value) {
      state->values->set_double_array_value(key, nid, value);
    }

    /**
     * The value of this vertex in the graph's node property column key.
     * Empty if the graph has no such column or the vertex has no value.
     */
    boost::optional<runtime_value> node_property_value(const std::string& key) const;

    /// \internal Moves the context to another vertex
    void set_node_id(vertex_id_type node_id) { nid = node_id; }

  protected:
    pregel_state* state;
    vertex_id_type nid;
  };


  /// The context of ipregel_computation::init()
  class init_context : public node_context {
  public:
    explicit init_context(pregel_state& state) : node_context(state) { }
  };


  /// The context of ipregel_computation::compute()
  class compute_context : public node_context {
  public:
    typedef boost::function<void (vertex_id_type)> neighbor_function_type;

    explicit compute_context(pregel_state& state) : node_context(state) { }

    size_t superstep() const { return state->superstep; }
    bool is_initial_superstep() const { return state->superstep == 0; }

    /// The out-degree of this vertex
    size_t degree() const { return state->graph->out_degree(nid); }

    /// Calls fn with every out-neighbor of this vertex
    void for_each_neighbor(const neighbor_function_type& fn) const;

    /// Sends value to target. It is delivered in the next superstep.
    void send_to(vertex_id_type target, double value);

    /// Sends value to every out-neighbor
    void send_to_neighbors(double value);

    /**
     * Deactivates this vertex. It is not computed again until it
     * receives a message.
     */
    void vote_to_halt() { state->vote_bits->set_bit(nid); }

  private:
    void mark_sent() {
      if (!state->message_sent) state->message_sent = true;
    }
  };


  /**
   * \brief The context of ipregel_computation::master_compute().
   *
   * Runs on the engine thread after all compute steps of a superstep
   * finished and has access to every row of the Value Store.
   */
  class master_compute_context {
  public:
    explicit master_compute_context(pregel_state& state) : state(&state) { }

    size_t superstep() const { return state->superstep; }
    bool is_initial_superstep() const { return state->superstep == 0; }
    size_t node_count() const { return state->graph->num_vertices(); }
    size_t relationship_count() const { return state->graph->num_edges(); }
    const pregel_options& config() const { return *state->config; }

    node_value& node_values() { return *state->values; }
    const node_value& node_values() const { return *state->values; }

    double double_node_value(vertex_id_type node_id, const std::string& key) const {
      return state->values->double_value(key, node_id);
    }
    int64_t long_node_value(vertex_id_type node_id, const std::string& key) const {
      return state->values->long_value(key, node_id);
    }
    void set_double_node_value(vertex_id_type node_id, const std::string& key,
                               double value) {
      state->values->set_double_value(key, node_id, value);
    }
    void set_long_node_value(vertex_id_type node_id, const std::string& key,
                             int64_t value) {
      state->values->set_long_value(key, node_id, value);
    }

    /// True if a vertex voted to halt and has not been reactivated
    bool is_halted(vertex_id_type node_id) const {
      return state->vote_bits->get(node_id);
    }

  private:
    pregel_state* state;
  };

} // end of namespace bsplab
#endif
