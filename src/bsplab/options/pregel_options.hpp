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


#ifndef BSPLAB_PREGEL_OPTIONS_HPP
#define BSPLAB_PREGEL_OPTIONS_HPP

#include <string>
#include <ostream>
#include <boost/optional.hpp>
#include <bsplab/options/options_map.hpp>

namespace bsplab {

  /**
   * \brief How the vertex range is cut into compute steps.
   *
   * The string form is the upper case name. parse() is case-insensitive.
   */
  struct partitioning {
    enum partitioning_enum {
      RANGE,   /**< contiguous ranges of about node_count / concurrency */
      DEGREE,  /**< contiguous ranges balanced by summed out-degree */
      AUTO     /**< one root range split recursively on the fork-join pool */
    };

    static std::string to_string(partitioning_enum p);

    /// Throws config_error on an unknown name.
    static partitioning_enum parse(const std::string& str);
  };

  /**
   * The options of one Pregel run:
   <ul>
   <li> size_t concurrency: The number of worker threads. At least 1. </li>
   <li> size_t max_iterations: The superstep limit. At least 1,
   default 20. </li>
   <li> optional double tolerance: A convergence delta for the user
   compute function. Positive when set. </li>
   <li> bool is_asynchronous: Let a vertex observe messages sent to it
   in the same superstep. </li>
   <li> partitioning: {RANGE, DEGREE, AUTO}, default RANGE. </li>
   <li> bool track_sender: Remember the sender of delivered messages. </li>
   </ul>
   *
   * Values are checked by validate(), which the engine calls before a
   * run. The string parsers validate immediately.
   */
  class pregel_options {
  public:
    static const size_t DEFAULT_CONCURRENCY = 4;
    static const size_t DEFAULT_MAX_ITERATIONS = 20;

    pregel_options();

    size_t get_concurrency() const { return concurrency; }
    pregel_options& set_concurrency(size_t n) { concurrency = n; return *this; }

    size_t get_max_iterations() const { return max_iterations; }
    pregel_options& set_max_iterations(size_t n) { max_iterations = n; return *this; }

    const boost::optional<double>& get_tolerance() const { return tolerance; }
    pregel_options& set_tolerance(double t) { tolerance = t; return *this; }
    pregel_options& clear_tolerance() { tolerance = boost::none; return *this; }

    bool get_is_asynchronous() const { return is_asynchronous; }
    pregel_options& set_is_asynchronous(bool b) { is_asynchronous = b; return *this; }

    partitioning::partitioning_enum get_partitioning() const { return partitioning_type; }
    pregel_options& set_partitioning(partitioning::partitioning_enum p) {
      partitioning_type = p; return *this;
    }

    bool get_track_sender() const { return track_sender; }
    pregel_options& set_track_sender(bool b) { track_sender = b; return *this; }

    /// Throws config_error if any option is out of range.
    void validate() const;

    /**
     * Reads the recognized keys (concurrency, max_iterations, tolerance,
     * is_asynchronous, partitioning, track_sender) from opts on top of
     * the defaults and validates the result.
     */
    static pregel_options from_options_map(const options_map& opts);

    /// Same as from_options_map() on "key=value key=value ..."
    static pregel_options parse(const std::string& str);

    /// Writes the options as an options_map string
    std::string to_string() const;

  private:
    size_t concurrency;
    size_t max_iterations;
    boost::optional<double> tolerance;
    bool is_asynchronous;
    partitioning::partitioning_enum partitioning_type;
    bool track_sender;
  };

  std::ostream& operator<<(std::ostream& out, const pregel_options& opts);

} // end of namespace bsplab

#endif
