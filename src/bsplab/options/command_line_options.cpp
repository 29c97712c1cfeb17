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


#include <iterator>
#include <vector>
#include <bsplab/options/command_line_options.hpp>
#include <bsplab/util/error_types.hpp>

namespace bsplab {

  bool command_line_options::parse(int argc, const char* const* argv) {
    namespace boost_po = boost::program_options;
    size_t concurrency(popts.get_concurrency());
    size_t max_iterations(popts.get_max_iterations());
    double tolerance(0);
    bool async(popts.get_is_asynchronous());
    std::string partition_str(partitioning::to_string(popts.get_partitioning()));
    bool track_sender(popts.get_track_sender());
    std::string log_level("info");
    std::string log_file;

    desc.add_options()
      ("concurrency",
       boost_po::value<size_t>(&concurrency)->default_value(concurrency),
       "Number of worker threads.")
      ("max_iterations",
       boost_po::value<size_t>(&max_iterations)->default_value(max_iterations),
       "Maximum number of supersteps.")
      ("tolerance",
       boost_po::value<double>(&tolerance),
       "Convergence tolerance handed to the compute function.")
      ("async",
       boost_po::value<bool>(&async)->default_value(async),
       "Deliver messages within the superstep they are sent in.")
      ("partitioning",
       boost_po::value<std::string>(&partition_str)->default_value(partition_str),
       "Options are {RANGE, DEGREE, AUTO}")
      ("track_sender",
       boost_po::value<bool>(&track_sender)->default_value(track_sender),
       "Remember the sender of delivered messages.")
      ("log_level",
       boost_po::value<std::string>(&log_level)->default_value(log_level),
       "Options are {debug, info, emph, warning, error, fatal, none}")
      ("log_file",
       boost_po::value<std::string>(&log_file),
       "Also write the log to this file.");

    // Parse the arguments
    try{
      std::vector<std::string> arguments;
      if (argc > 1) {
        std::copy(argv + 1, argv + argc, std::back_inserter(arguments));
      }
      boost_po::store(boost_po::command_line_parser(arguments).
                      options(desc).positional(pos_opts).run(), vm);
      boost_po::notify(vm);
    } catch( const boost_po::error& error) {
      std::cout << "Invalid syntax:\n"
                << "\t" << error.what()
                << "\n\n" << std::endl
                << "Description:"
                << std::endl;
      print_description();
      return false;
    }
    if(vm.count("help")) {
      print_description();
      return false;
    }

    const int level = parse_log_level(log_level);
    if (level < 0) {
      std::cout << "Unknown log level: " << log_level << std::endl;
      return false;
    }
    global_logger().set_log_level(level);
    if (!log_file.empty() && !global_logger().set_log_file(log_file)) {
      std::cout << "Unable to open log file: " << log_file << std::endl;
      return false;
    }

    try {
      popts.set_concurrency(concurrency)
        .set_max_iterations(max_iterations)
        .set_is_asynchronous(async)
        .set_partitioning(partitioning::parse(partition_str))
        .set_track_sender(track_sender);
      if (vm.count("tolerance")) popts.set_tolerance(tolerance);
      popts.validate();
    } catch (const config_error& error) {
      std::cout << "Invalid option: " << error.what() << std::endl;
      print_description();
      return false;
    }
    return true;
  } // end of parse


  bool command_line_options::is_set(const std::string& option) {
    return vm.count(option) > 0;
  }


  void command_line_options::add_positional(const std::string& str) {
    pos_opts.add(str.c_str(), 1);
  }

} // end namespace bsplab
