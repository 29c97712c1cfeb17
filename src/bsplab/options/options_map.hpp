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


#ifndef BSPLAB_OPTIONS_MAP_HPP
#define BSPLAB_OPTIONS_MAP_HPP

#include <map>
#include <string>
#include <sstream>
#include <ostream>
#include <istream>
#include <boost/lexical_cast.hpp>

namespace bsplab {

  /**
     options data structure.  Defines a collection of key->value pairs
     where the key is a string, and the value is an arbitrary data
     type.  The options_map class will invisibly cast between string,
     integer, double and boolean data types.

     \code
       options_map opts("max_iterations=10 partitioning=degree");
       size_t iters = 0;
       opts.get_option("max_iterations", iters);
     \endcode
  */
  class options_map {
  public:

    options_map() {};

    explicit options_map(const std::string &s) {
      parse_options(s);
    };

    /**
     * Add an option -> value pair where value is a string.
     * The integer, double and boolean views are derived from it.
     */
    void add_option_str(const std::string &opt, const std::string &val);

    /**
     * Test if the option has been created
     */
    inline bool is_set(const std::string& opt) const {
      return options.find(opt) != options.end();
    }

    /**
     * Reads a string option
     */
    inline bool get_option(const std::string& opt, std::string& val) const {
      std::map<std::string, option_values>::const_iterator i = options.find(opt);
      if (i == options.end()) return false;
      val = i->second.strval;
      return true;
    }

    /**
     * Reads a bool option
     */
    inline bool get_option(const std::string& opt, bool& val) const {
      std::map<std::string, option_values>::const_iterator i = options.find(opt);
      if (i == options.end()) return false;
      val = i->second.boolval;
      return true;
    }

    /**
     * Reads a integer option
     */
    template <typename IntType>
    inline bool get_option(const std::string& opt, IntType& val) const {
      std::map<std::string, option_values>::const_iterator i = options.find(opt);
      if (i == options.end()) return false;
      val = IntType(i->second.intval);
      return true;
    }

    /**
     * Reads a double option
     */
    inline bool get_option(const std::string& opt, double& val) const {
      std::map<std::string, option_values>::const_iterator i = options.find(opt);
      if (i == options.end()) return false;
      val = i->second.dblval;
      return true;
    }

    /**
     * Parses an option stream  of the form "a=b c=d ..."
     */
    inline void parse_options(const std::string& s) {
      std::stringstream strm(s);
      parse_options(strm);
    }

    /**
     * Parses an option stream  of the form "a=b c=d ..."
     */
    void parse_options(std::istream& s);

    /**
     * Parses "name(key1=value1,key2=value2)". The arguments are added to
     * the map and "name" is returned.
     */
    std::string parse_string(const std::string& options_raw);

    /// The internal storage of the options
    struct option_values{
      std::string strval;
      long long intval;
      double dblval;
      bool boolval;
      option_values () : intval(0), dblval(0), boolval(false) { }
    };

    std::map<std::string, option_values> options;
  };

  std::ostream& operator<<(std::ostream& out,
                           const bsplab::options_map& opts);

} // end of bsplab namespace

#endif
