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


#ifndef BSPLAB_ERROR_TYPES_HPP
#define BSPLAB_ERROR_TYPES_HPP

#include <stdexcept>
#include <string>

namespace bsplab {

/**
 * Invalid run configuration: a bad concurrency, iteration limit,
 * tolerance, partitioning or reducer name. Raised before a run starts.
 */
class config_error : public std::invalid_argument {
  public:
  explicit config_error(const std::string& msg) : std::invalid_argument(msg) {}
};

/**
 * Base class of every error raised by the schema or the value store.
 */
class schema_error : public std::runtime_error {
  public:
  explicit schema_error(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * A property key that the schema does not declare.
 */
class schema_key_not_found : public schema_error {
  std::string m_key;
  public:
  explicit schema_key_not_found(const std::string& key)
    : schema_error("Property key '" + key + "' is not part of the schema"),
      m_key(key) {}
  ~schema_key_not_found() throw() {}
  const std::string& key() const { return m_key; }
};

/**
 * An accessor or a value whose type disagrees with the declared type
 * of the element.
 */
class type_mismatch : public schema_error {
  public:
  explicit type_mismatch(const std::string& msg) : schema_error(msg) {}
};

/**
 * A message that a messenger refuses to carry.
 */
class invalid_message : public std::invalid_argument {
  public:
  explicit invalid_message(const std::string& msg) : std::invalid_argument(msg) {}
};

} // namespace bsplab

#endif
