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


#ifndef BSPLAB_MESSAGE_REDUCER_HPP
#define BSPLAB_MESSAGE_REDUCER_HPP

#include <string>
#include <boost/shared_ptr.hpp>

namespace bsplab {

  /**
   * \brief Folds the messages sent to one vertex in one superstep into
   * a single value.
   *
   * reduce() must be associative and commutative and identity() must be
   * neutral: reduce(identity(), x) == x. The messages are folded in an
   * unspecified order, concurrently with other senders.
   */
  class imessage_reducer {
  public:
    virtual ~imessage_reducer() { }
    virtual double identity() const = 0;
    virtual double reduce(double current, double message) const = 0;
  };


  /// Sum of the messages. Identity 0.
  class sum_reducer : public imessage_reducer {
  public:
    double identity() const { return 0.0; }
    double reduce(double current, double message) const { return current + message; }
  };

  /// Smallest message. Identity DBL_MAX.
  class min_reducer : public imessage_reducer {
  public:
    double identity() const;
    double reduce(double current, double message) const {
      return message < current ? message : current;
    }
  };

  /// Largest message. Identity -DBL_MAX.
  class max_reducer : public imessage_reducer {
  public:
    double identity() const;
    double reduce(double current, double message) const {
      return message > current ? message : current;
    }
  };

  /// Number of messages, their values are ignored. Identity 0.
  class count_reducer : public imessage_reducer {
  public:
    double identity() const { return 0.0; }
    double reduce(double current, double) const { return current + 1.0; }
  };


  /**
   * The built-in reducers by name. The string form is the upper case
   * name, parse() is case-insensitive.
   */
  struct reducer_type {
    enum reducer_type_enum { SUM, MIN, MAX, COUNT };

    static std::string to_string(reducer_type_enum r);

    /// Throws config_error on an unknown name.
    static reducer_type_enum parse(const std::string& str);

    static boost::shared_ptr<imessage_reducer> create(reducer_type_enum r);
  };

} // end of namespace bsplab

#endif
