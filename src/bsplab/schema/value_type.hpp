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


#ifndef BSPLAB_VALUE_TYPE_HPP
#define BSPLAB_VALUE_TYPE_HPP

#include <string>

namespace bsplab {

  /**
   * \brief The storage type of a schema element or a property column.
   */
  struct value_type {
    enum value_type_enum {
      LONG,          /**< int64_t */
      DOUBLE,        /**< double */
      LONG_ARRAY,    /**< std::vector<int64_t> */
      DOUBLE_ARRAY   /**< std::vector<double> */
    };

    static std::string to_string(value_type_enum t) {
      switch(t) {
      case LONG: return "LONG";
      case DOUBLE: return "DOUBLE";
      case LONG_ARRAY: return "LONG_ARRAY";
      case DOUBLE_ARRAY: return "DOUBLE_ARRAY";
      };
      return "UNKNOWN";
    }

    static bool is_array(value_type_enum t) {
      return t == LONG_ARRAY || t == DOUBLE_ARRAY;
    }
  };

} // end of namespace bsplab

#endif
