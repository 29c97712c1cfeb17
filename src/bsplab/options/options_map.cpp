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
#include <iomanip>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/case_conv.hpp>
#include <bsplab/options/options_map.hpp>

namespace bsplab {

  void options_map::add_option_str(const std::string &opt,
                                   const std::string &val) {
    option_values& entry = options[opt];
    entry = option_values();
    entry.strval = val;
    try {
      entry.intval = boost::lexical_cast<long long>(val);
    } catch(boost::bad_lexical_cast&) { entry.intval = 0; }
    try {
      entry.dblval = boost::lexical_cast<double>(val);
    } catch(boost::bad_lexical_cast&) { entry.dblval = 0.0; }
    const std::string lval = boost::algorithm::to_lower_copy(val);
    entry.boolval = (lval == "true" || lval == "yes" || lval == "1");
  }


  void options_map::parse_options(std::istream& s) {
    std::string opt, value;
    // read till the equal
    while(s.good()) {
      getline(s, opt, '=');
      if (s.bad() || s.eof()) break;
      getline(s, value, ' ');
      if (s.bad()) break;
      boost::algorithm::trim(opt);
      boost::algorithm::trim(value);
      if (!opt.empty()) add_option_str(opt, value);
    }
  }


  std::string options_map::parse_string(const std::string& options_raw) {
    // Break the string appart
    size_t first_paren = options_raw.find_first_of('(');
    size_t last_paren = options_raw.find_last_of(')');
    std::string fun_name = options_raw.substr(0, first_paren);
    boost::algorithm::trim(fun_name);
    std::string arguments;
    // Fill in the arguments if such are possibe
    if(first_paren != std::string::npos &&
       last_paren != std::string::npos &&
       last_paren > first_paren) {
      arguments = options_raw.substr(first_paren + 1,
                                     last_paren - first_paren - 1 );
    }
    if(!arguments.empty()) {
      std::replace(arguments.begin(), arguments.end(), ',', ' ');
      std::replace(arguments.begin(), arguments.end(), ';', ' ');
      std::stringstream arg_strm(arguments);
      parse_options(arg_strm);
    }
    return fun_name;
  }


  std::ostream& operator<<(std::ostream& out,
                           const bsplab::options_map& opts) {
    // save the format flags
    std::ios_base::fmtflags fmt = out.flags();
    std::map<std::string,
             bsplab::options_map::option_values>::const_iterator
      i = opts.options.begin();
    while(i != opts.options.end()) {
      out << std::setw(18) << std::left << i->first;
      out << std::setw(2) << "= ";
      out << i->second.strval;
      out << std::endl;
      ++i;
    }
    // reset the format flags
    out.flags(fmt);
    return out;
  }

} // end of namespace bsplab
