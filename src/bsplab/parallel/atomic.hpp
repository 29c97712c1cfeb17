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


#ifndef BSPLAB_ATOMIC_HPP
#define BSPLAB_ATOMIC_HPP

#include <stdint.h>
#include <cstring>

namespace bsplab {
  /**
   * \brief atomic object toolkit
   * \ingroup util
   * A templated class for creating atomic numbers on top of the GCC
   * __sync builtins.
   */
  template<typename T>
  class atomic{
  public:
    //! The current value of the atomic number
    volatile T value;

    //! Creates an atomic number with value "value"
    atomic(const T& value = T()) : value(value) { }

    //! Performs an atomic increment by 1, returning the new value
    T inc() { return __sync_add_and_fetch(&value, 1);  }

    //! Performs an atomic decrement by 1, returning the new value
    T dec() { return __sync_sub_and_fetch(&value, 1);  }

    //! Performs an atomic increment by 'val', returning the new value
    T inc(const T val) { return __sync_add_and_fetch(&value, val);  }

    //! Performs an atomic decrement by 'val', returning the new value
    T dec(const T val) { return __sync_sub_and_fetch(&value, val);  }

    //! Lvalue implicit cast
    operator T() const { return value; }

    //! Performs an atomic increment by 1, returning the new value
    T operator++() { return inc(); }

    //! Performs an atomic decrement by 1, returning the new value
    T operator--() { return dec(); }

    //! Performs an atomic increment by 'val', returning the new value
    T operator+=(const T val) { return inc(val); }

    //! Performs an atomic decrement by 'val', returning the new value
    T operator-=(const T val) { return dec(val); }
  };


  /**
   * \ingroup util
     atomic instruction that is equivalent to the following:
     \code
     if (a==oldval) {
       a = newval;
       return true;
     }
     else {
       return false;
    }
    \endcode
  */
  template<typename T>
  bool atomic_compare_and_swap(T& a, T oldval, T newval) {
    return __sync_bool_compare_and_swap(&a, oldval, newval);
  }

  template<typename T>
  bool atomic_compare_and_swap(volatile T& a, T oldval, T newval) {
    return __sync_bool_compare_and_swap(&a, oldval, newval);
  }

  /**
   * \ingroup util
   * Compare and swap on the bit pattern of a double. The comparison is
   * bitwise, so -0.0 and 0.0 differ and a NaN matches an identical NaN.
   */
  template <>
  inline bool atomic_compare_and_swap(double& a,
                                      double oldval,
                                      double newval) {
    uint64_t oldbits, newbits;
    memcpy(&oldbits, &oldval, sizeof(double));
    memcpy(&newbits, &newval, sizeof(double));
    return __sync_bool_compare_and_swap
      (reinterpret_cast<uint64_t*>(&a), oldbits, newbits);
  }

  /**
   * \ingroup util
   * Reads a double with a full barrier so that a value written by
   * atomic_compare_and_swap on another thread is observed.
   */
  inline double atomic_read(const double& a) {
    __sync_synchronize();
    return *const_cast<const volatile double*>(&a);
  }

}
#endif
