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


#ifndef BSPLAB_COMMAND_LINE_OPTIONS_HPP
#define BSPLAB_COMMAND_LINE_OPTIONS_HPP

#include <string>
#include <iostream>
#include <boost/program_options.hpp>
#include <bsplab/options/pregel_options.hpp>
#include <bsplab/logger/assertions.hpp>

namespace bsplab {

  /**
  The command_line_options data-structure wraps the
  boost::program_options library. It adds the Pregel run options and
  the logging options to every program and lets the program attach its
  own options.

  \code
  int main(int argc, char** argv) {
    std::string graph_file;
    size_t source = 0;
    bsplab::command_line_options clopts("Single source shortest path.");
    clopts.attach_option("graph", &graph_file, "The edge list file");
    clopts.add_positional("graph");
    clopts.attach_option("source", &source, source, "The source vertex");
    if(!clopts.parse(argc, argv)) return EXIT_FAILURE;
    bsplab::pregel_options opts = clopts.get_pregel_options();
  }
  \endcode
  */
  class command_line_options {
    boost::program_options::options_description desc;
    boost::program_options::positional_options_description pos_opts;
    boost::program_options::variables_map vm;
    pregel_options popts;

  public:

    explicit command_line_options(const std::string& desc_str = "bsplab program.")
      : desc(desc_str) {
      desc.add_options()("help", "Print this help message.");
    }

    /// Print the same message that is printed when --help is provided.
    inline void print_description() const { std::cout << desc << std::endl; }

    /**
    \brief Reads the command line and fills in the attached variables
    and the pregel options. On a syntax error or an invalid option value
    the error and the description are printed and false is returned.
    --help also returns false.
    */
    bool parse(int argc, const char* const* argv);

    /** Test if the user provided the option. */
    bool is_set(const std::string& option);

    /** The validated pregel options. Only meaningful after parse(). */
    const pregel_options& get_pregel_options() const { return popts; }

    /**
    \brief attach a user defined option to the command line options
    parser.
    \param option The name of the command line flag for that option.
    \param ret_cont A pointer to a value that must outlive parse().
    \param description Used to describe the option when --help is called.
    */
    template<typename T>
    void attach_option(const std::string& option,
                       T* ret_cont,
                       const std::string& description) {
      namespace boost_po = boost::program_options;
      ASSERT_TRUE(ret_cont != NULL);
      desc.add_options()
        (option.c_str(),
         boost_po::value<T>(ret_cont),
         description.c_str());
    }

    /**
    \brief attach a user defined option with a default value.
    */
    template<typename T>
    void attach_option(const std::string& option,
                       T* ret_cont,
                       const T& default_value,
                       const std::string& description) {
      namespace boost_po = boost::program_options;
      ASSERT_TRUE(ret_cont != NULL);
      desc.add_options()
        (option.c_str(),
         boost_po::value<T>(ret_cont)->default_value(default_value),
         description.c_str());
    }

    /** This function adds the option as a positional argument. Each
    add_positional call adds to the next position. */
    void add_positional(const std::string& str);
  }; // end class command line options

} // end namespace bsplab

#endif
