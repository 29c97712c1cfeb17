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


#include <sstream>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <bsplab/options/pregel_options.hpp>
#include <bsplab/util/error_types.hpp>

namespace bsplab {

  std::string partitioning::to_string(partitioning_enum p) {
    switch(p) {
    case RANGE: return "RANGE";
    case DEGREE: return "DEGREE";
    case AUTO: return "AUTO";
    };
    return "UNKNOWN";
  }

  partitioning::partitioning_enum partitioning::parse(const std::string& str) {
    const std::string upper =
      boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(str));
    if (upper == "RANGE") return RANGE;
    if (upper == "DEGREE") return DEGREE;
    if (upper == "AUTO") return AUTO;
    throw config_error("Unknown partitioning '" + str +
                       "'. Expected one of RANGE, DEGREE, AUTO");
  }


  const size_t pregel_options::DEFAULT_CONCURRENCY;
  const size_t pregel_options::DEFAULT_MAX_ITERATIONS;


  pregel_options::pregel_options() :
    concurrency(DEFAULT_CONCURRENCY),
    max_iterations(DEFAULT_MAX_ITERATIONS),
    is_asynchronous(false),
    partitioning_type(partitioning::RANGE),
    track_sender(false) { }


  void pregel_options::validate() const {
    if (concurrency < 1) {
      throw config_error("concurrency must be at least 1");
    }
    if (max_iterations < 1) {
      throw config_error("max_iterations must be at least 1");
    }
    // the negated test also rejects NaN
    if (tolerance && !(*tolerance > 0.0)) {
      std::stringstream strm;
      strm << "tolerance must be positive, got " << *tolerance;
      throw config_error(strm.str());
    }
  }


  namespace {
    size_t read_positive(const options_map& opts, const std::string& key,
                         size_t current) {
      if (!opts.is_set(key)) return current;
      std::string strval;
      opts.get_option(key, strval);
      long long value = 0;
      try {
        value = boost::lexical_cast<long long>(strval);
      } catch (boost::bad_lexical_cast&) {
        throw config_error(key + " must be an integer, got '" + strval + "'");
      }
      if (value < 1) {
        throw config_error(key + " must be at least 1, got '" + strval + "'");
      }
      return size_t(value);
    }

    bool read_bool(const options_map& opts, const std::string& key, bool current) {
      std::string strval;
      if (!opts.get_option(key, strval)) return current;
      const std::string lval = boost::algorithm::to_lower_copy(strval);
      if (lval == "true" || lval == "yes" || lval == "1") return true;
      if (lval == "false" || lval == "no" || lval == "0") return false;
      throw config_error(key + " must be true or false, got '" + strval + "'");
    }
  }


  pregel_options pregel_options::from_options_map(const options_map& opts) {
    pregel_options ret;
    ret.concurrency = read_positive(opts, "concurrency", ret.concurrency);
    ret.max_iterations = read_positive(opts, "max_iterations", ret.max_iterations);
    if (opts.is_set("tolerance")) {
      std::string strval;
      opts.get_option("tolerance", strval);
      try {
        ret.tolerance = boost::lexical_cast<double>(strval);
      } catch (boost::bad_lexical_cast&) {
        throw config_error("tolerance must be a number, got '" + strval + "'");
      }
    }
    ret.is_asynchronous = read_bool(opts, "is_asynchronous", ret.is_asynchronous);
    ret.track_sender = read_bool(opts, "track_sender", ret.track_sender);
    std::string partition_str;
    if (opts.get_option("partitioning", partition_str)) {
      ret.partitioning_type = partitioning::parse(partition_str);
    }
    ret.validate();
    return ret;
  }


  pregel_options pregel_options::parse(const std::string& str) {
    return from_options_map(options_map(str));
  }


  std::string pregel_options::to_string() const {
    std::stringstream strm;
    strm << "concurrency=" << concurrency
         << " max_iterations=" << max_iterations;
    if (tolerance) strm << " tolerance=" << *tolerance;
    strm << " is_asynchronous=" << (is_asynchronous ? "true" : "false")
         << " partitioning=" << partitioning::to_string(partitioning_type)
         << " track_sender=" << (track_sender ? "true" : "false");
    return strm.str();
  }


  std::ostream& operator<<(std::ostream& out, const pregel_options& opts) {
    return out << opts.to_string();
  }

} // end of namespace bsplab
