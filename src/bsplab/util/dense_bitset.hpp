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


#ifndef BSPLAB_DENSE_BITSET_HPP
#define BSPLAB_DENSE_BITSET_HPP

#include <cstdlib>
#include <cstring>
#include <iterator>
#include <stdint.h>
#include <bsplab/logger/assertions.hpp>

namespace bsplab {

  /**  \ingroup util
   *  Implements an atomic dense bitset.
   *
   *  Bits beyond size() inside the last word are always kept clear so
   *  that popcount() and all_set() only see the bits that exist.
   */
  class dense_bitset {
  public:

    /// Constructs a bitset of 0 length
    dense_bitset() : array(NULL), len(0), arrlen(0) {
    }

    /// Constructs a bitset with 'size' bits. All bits will be cleared.
    explicit dense_bitset(size_t size) : array(NULL), len(0), arrlen(0) {
      resize(size);
      clear();
    }

    /// Make a copy of the bitset db
    dense_bitset(const dense_bitset &db) : array(NULL), len(0), arrlen(0) {
      *this = db;
    }

    /// destructor
    ~dense_bitset() {free(array);}

    /// Make a copy of the bitset db
    inline dense_bitset& operator=(const dense_bitset& db) {
      if (this == &db) return *this;
      resize(db.size());
      if (arrlen > 0) memcpy(array, db.array, sizeof(size_t) * arrlen);
      return *this;
    }

    /** Resizes the current bitset to hold n bits.
    Existing bits will not be changed. If the array size is increased,
    the new bits are cleared.
    */
    inline void resize(size_t n) {
      const size_t oldarrlen = arrlen;
      len = n;
      arrlen = (n + BITS_PER_WORD - 1) / BITS_PER_WORD;
      if (arrlen == 0) {
        free(array);
        array = NULL;
        return;
      }
      size_t* newarray = (size_t*)realloc(array, sizeof(size_t) * arrlen);
      ASSERT_TRUE(newarray != NULL);
      array = newarray;
      for (size_t i = oldarrlen; i < arrlen; ++i) array[i] = 0;
      mask_tail();
    }

    /// Sets all bits to 0
    inline void clear() {
      for (size_t i = 0;i < arrlen; ++i) array[i] = 0;
    }

    /// Sets all bits to 1
    inline void fill() {
      for (size_t i = 0;i < arrlen; ++i) array[i] = (size_t)-1;
      mask_tail();
    }

    /// Returns the value of the bit b
    inline bool get(size_t b) const{
      size_t arrpos, bitpos;
      bit_to_pos(b, arrpos, bitpos);
      return array[arrpos] & (size_t(1) << bitpos);
    }

    //! Atomically sets the bit at position b to true returning the old value
    inline bool set_bit(size_t b) {
      size_t arrpos, bitpos;
      bit_to_pos(b, arrpos, bitpos);
      const size_t mask(size_t(1) << bitpos);
      return __sync_fetch_and_or(array + arrpos, mask) & mask;
    }

    //! Atomically set the bit at b to false returning the old value
    inline bool clear_bit(size_t b) {
      size_t arrpos, bitpos;
      bit_to_pos(b, arrpos, bitpos);
      const size_t test_mask(size_t(1) << bitpos);
      const size_t clear_mask(~test_mask);
      return __sync_fetch_and_and(array + arrpos, clear_mask) & test_mask;
    }

    //! Atomically sets the state of the bit to the new value returning the old value
    inline bool set(size_t b, bool value) {
      if (value) return set_bit(b);
      else return clear_bit(b);
    }

    /** Returns true with b containing the position of the
        first bit set to true.
        If such a bit does not exist, this function returns false.
    */
    inline bool first_bit(size_t &b) const {
      for (size_t i = 0; i < arrlen; ++i) {
        if (array[i]) {
          b = i * BITS_PER_WORD + size_t(__builtin_ctzl(array[i]));
          return true;
        }
      }
      return false;
    }

    /** Where b is a bit index, this function will return in b,
        the position of the next bit set to true, and return true.
        If all bits after b are false, this function returns false.
    */
    inline bool next_bit(size_t &b) const {
      size_t arrpos, bitpos;
      bit_to_pos(b, arrpos, bitpos);
      // try to find the next bit in this block
      if (bitpos + 1 < BITS_PER_WORD) {
        const size_t above = array[arrpos] & (size_t(-1) << (bitpos + 1));
        if (above != 0) {
          b = arrpos * BITS_PER_WORD + size_t(__builtin_ctzl(above));
          return true;
        }
      }
      // we have to loop through the rest of the array
      for (size_t i = arrpos + 1; i < arrlen; ++i) {
        if (array[i]) {
          b = i * BITS_PER_WORD + size_t(__builtin_ctzl(array[i]));
          return true;
        }
      }
      return false;
    }

    struct bit_pos_iterator {
      typedef std::forward_iterator_tag iterator_category;
      typedef size_t value_type;
      typedef ptrdiff_t difference_type;
      typedef const size_t* pointer;
      typedef const size_t& reference;
      size_t pos;
      const dense_bitset* db;
      bit_pos_iterator():pos(-1),db(NULL) {}
      bit_pos_iterator(const dense_bitset* const db, size_t pos):pos(pos),db(db) {}

      size_t operator*() const {
        return pos;
      }
      bit_pos_iterator& operator++(){
        if (db->next_bit(pos) == false) pos = size_t(-1);
        return *this;
      }
      bool operator==(const bit_pos_iterator& other) const {
        return other.pos == pos;
      }
      bool operator!=(const bit_pos_iterator& other) const {
        return other.pos != pos;
      }
    };

    typedef bit_pos_iterator iterator;
    typedef bit_pos_iterator const_iterator;

    bit_pos_iterator begin() const {
      size_t pos;
      if (first_bit(pos) == false) pos = size_t(-1);
      return bit_pos_iterator(this, pos);
    }

    bit_pos_iterator end() const {
      return bit_pos_iterator(this, size_t(-1));
    }

    ///  Returns the number of bits in this bitset
    inline size_t size() const {
      return len;
    }

    /// Returns the number of bits set
    size_t popcount() const {
      size_t ret = 0;
      for (size_t i = 0;i < arrlen; ++i) {
        ret += size_t(__builtin_popcountl(array[i]));
      }
      return ret;
    }

    /// True if every one of the size() bits is set. Vacuously true when empty.
    bool all_set() const {
      if (arrlen == 0) return true;
      for (size_t i = 0;i + 1 < arrlen; ++i) {
        if (array[i] != size_t(-1)) return false;
      }
      return array[arrlen - 1] == tail_mask();
    }

  private:
    static const size_t BITS_PER_WORD = 8 * sizeof(size_t);

    inline static void bit_to_pos(size_t b, size_t& arrpos, size_t& bitpos) {
      arrpos = b / BITS_PER_WORD;
      bitpos = b & (BITS_PER_WORD - 1);
    }

    inline size_t tail_mask() const {
      const size_t tailbits = len % BITS_PER_WORD;
      return tailbits == 0 ? size_t(-1) : ((size_t(1) << tailbits) - 1);
    }

    inline void mask_tail() {
      if (arrlen > 0) array[arrlen - 1] &= tail_mask();
    }

    size_t* array;
    size_t len;
    size_t arrlen;
  };

}
#endif
