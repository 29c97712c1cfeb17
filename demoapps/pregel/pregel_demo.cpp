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


#include <algorithm>
#include <cfloat>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <bsplab.hpp>

using namespace bsplab;

/**
 * Single source shortest path with unit edge weights. Every vertex
 * votes to halt after each superstep and only wakes up when a shorter
 * distance arrives.
 */
class shortest_path : public ipregel_computation {
  vertex_id_type source;
  bool use_reducer;

public:
  shortest_path(vertex_id_type source, bool use_reducer)
    : source(source), use_reducer(use_reducer) { }

  pregel_schema schema(const pregel_options&) const {
    return pregel_schema::builder()
      .add_public("distance", value_type::DOUBLE)
      .build();
  }

  void init(init_context& context) {
    context.set_double_node_value("distance",
                                  context.node_id() == source ? 0.0 : DBL_MAX);
  }

  void compute(compute_context& context, messages& msgs) {
    if (context.is_initial_superstep()) {
      if (context.node_id() == source) context.send_to_neighbors(1.0);
      context.vote_to_halt();
      return;
    }
    double best = context.double_node_value("distance");
    double msg;
    while (msgs.next(msg)) best = std::min(best, msg);
    if (best < context.double_node_value("distance")) {
      context.set_double_node_value("distance", best);
      context.send_to_neighbors(best + 1.0);
    }
    context.vote_to_halt();
  }

  boost::shared_ptr<imessage_reducer> reducer() const {
    if (!use_reducer) return boost::shared_ptr<imessage_reducer>();
    return reducer_type::create(reducer_type::MIN);
  }
};


/**
 * PageRank. Rank flows along the out-edges, the run stops when the
 * summed change of all ranks drops below the tolerance.
 */
class pagerank : public ipregel_computation {
  double damping;

public:
  explicit pagerank(double damping) : damping(damping) { }

  pregel_schema schema(const pregel_options&) const {
    return pregel_schema::builder()
      .add_public("rank", value_type::DOUBLE)
      .add("delta", value_type::DOUBLE, visibility::PRIVATE)
      .build();
  }

  void init(init_context& context) {
    context.set_double_node_value("rank", 1.0 / context.node_count());
  }

  void compute(compute_context& context, messages& msgs) {
    if (!context.is_initial_superstep()) {
      double sum = 0, msg;
      while (msgs.next(msg)) sum += msg;
      const double rank = (1.0 - damping) / context.node_count() + damping * sum;
      context.set_double_node_value("delta",
                                    std::fabs(rank - context.double_node_value("rank")));
      context.set_double_node_value("rank", rank);
    }
    if (context.degree() > 0) {
      context.send_to_neighbors(context.double_node_value("rank") / context.degree());
    }
  }

  bool master_compute(master_compute_context& context) {
    if (context.is_initial_superstep() || !context.config().get_tolerance()) return false;
    double total_delta = 0;
    for (vertex_id_type v = 0; v < context.node_count(); ++v) {
      total_delta += context.double_node_value(v, "delta");
    }
    logstream(LOG_INFO) << "Superstep " << context.superstep()
                        << ": total change " << total_delta << std::endl;
    return total_delta < *context.config().get_tolerance();
  }

  boost::shared_ptr<imessage_reducer> reducer() const {
    return reducer_type::create(reducer_type::SUM);
  }
};


// A ring with one chord per vertex
csr_graph make_synthetic_graph(size_t nverts) {
  std::vector<csr_graph::edge_type> edges;
  for (size_t v = 0; v < nverts; ++v) {
    edges.push_back(csr_graph::edge_type(v, (v + 1) % nverts));
    edges.push_back(csr_graph::edge_type(v, (7 * v + 3) % nverts));
  }
  return csr_graph(nverts, edges);
}


void save_result(const pregel_result& result, const std::string& key,
                 const std::string& output) {
  std::ofstream fout(output.c_str());
  if (!fout.good()) {
    logstream(LOG_ERROR) << "Unable to open " << output << std::endl;
    return;
  }
  node_value::property_cursor cursor = result.node_values().properties(key);
  vertex_id_type id;
  runtime_value value;
  while (cursor.next(id, value)) fout << id << "\t" << value << "\n";
}


int main(int argc, char** argv) {
  global_logger().set_log_level(LOG_INFO);

  // Parse command line options -----------------------------------------------
  command_line_options clopts("Pregel demo: shortest paths and PageRank.");
  std::string graph_file;
  std::string algorithm("sssp");
  std::string output;
  size_t nverts = 10000;
  size_t source = 0;
  double damping = 0.85;
  bool use_reducer = false;
  clopts.attach_option("graph", &graph_file,
                       "An edge list file. A synthetic graph is used if not set.");
  clopts.add_positional("graph");
  clopts.attach_option("algorithm", &algorithm, algorithm, "Options are {sssp, pagerank}");
  clopts.attach_option("nverts", &nverts, nverts, "Vertices of the synthetic graph.");
  clopts.attach_option("source", &source, source, "The source vertex of sssp.");
  clopts.attach_option("damping", &damping, damping, "The PageRank damping factor.");
  clopts.attach_option("use_reducer", &use_reducer, use_reducer,
                       "Fold sssp messages with the MIN reducer.");
  clopts.attach_option("output", &output, "Write id/value pairs to this file.");
  if(!clopts.parse(argc, argv)) {
    std::cout << "Error in parsing command line arguments." << std::endl;
    return EXIT_FAILURE;
  }

  // Build the graph ----------------------------------------------------------
  csr_graph graph;
  if (graph_file.empty()) {
    graph = make_synthetic_graph(nverts);
  } else {
    std::ifstream fin(graph_file.c_str());
    if (!fin.good()) {
      logstream(LOG_ERROR) << "Unable to open " << graph_file << std::endl;
      return EXIT_FAILURE;
    }
    graph = csr_graph::load_edge_list(fin);
  }
  std::cout << "#vertices: " << graph.num_vertices()
            << " #edges:" << graph.num_edges() << std::endl;

  // Running The Engine -------------------------------------------------------
  shortest_path sssp(source, use_reducer);
  pagerank pr(damping);
  ipregel_computation* computation = NULL;
  std::string key;
  if (algorithm == "sssp") {
    if (source >= graph.num_vertices()) {
      logstream(LOG_ERROR) << "Source " << source << " is not a vertex" << std::endl;
      return EXIT_FAILURE;
    }
    computation = &sssp;
    key = "distance";
  } else if (algorithm == "pagerank") {
    computation = &pr;
    key = "rank";
  } else {
    logstream(LOG_ERROR) << "Unknown algorithm " << algorithm << std::endl;
    return EXIT_FAILURE;
  }

  logging_progress_tracker tracker;
  pregel_engine engine(graph, clopts.get_pregel_options(), *computation, &tracker);
  const pregel_result result = engine.run();
  std::cout << "Finished: " << execution_status::to_string(result.get_status())
            << " after " << result.ran_iterations() << " supersteps" << std::endl;

  if (!output.empty()) save_result(result, key, output);
  return EXIT_SUCCESS;
} // End of main
