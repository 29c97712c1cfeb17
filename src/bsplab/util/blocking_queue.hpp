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


#ifndef BSPLAB_BLOCKING_QUEUE_HPP
#define BSPLAB_BLOCKING_QUEUE_HPP

#include <deque>
#include <utility>
#include <bsplab/parallel/pthread_tools.hpp>

namespace bsplab {

  /**
   * \ingroup util
   * \brief Implements a blocking queue useful for producer/consumer models
   */
  template<typename T>
  class blocking_queue {
  private:

    typedef typename std::deque<T> queue_type;

    bool m_alive;
    queue_type m_queue;
    mutex m_mutex;
    conditional m_conditional;
    conditional m_empty_conditional;

  public:

    //! creates a blocking queue
    blocking_queue() : m_alive(true) { }

    //! Add an element to the blocking queue
    inline void enqueue(const T& elem) {
      m_mutex.lock();
      m_queue.push_back(elem);
      // Signal threads waiting on the queue
      m_conditional.signal();
      m_mutex.unlock();
    }

    /**
     * Blocks until an element is available in the queue or until
     * stop_blocking() is called. The second field of the pair is false
     * when the queue was stopped.
     */
    inline std::pair<T, bool> dequeue() {
      m_mutex.lock();
      T elem = T();
      bool success = false;
      // Wait while the queue is empty and this queue is alive
      while(m_queue.empty() && m_alive) {
        m_conditional.wait(m_mutex);
      }
      // An element has been added or a signal was raised
      if(!m_queue.empty()) {
        success = true;
        elem = m_queue.front();
        m_queue.pop_front();
        if (m_queue.empty()) {
          m_empty_conditional.broadcast();
        }
      }
      m_mutex.unlock();
      return std::make_pair(elem, success);
    }

    /** Wakes up all threads waiting on the queue whether
        or not an element is available. Once this function is called,
        all existing and future dequeue operations return with failure
        once the remaining elements are drained.
    */
    inline void stop_blocking() {
      m_mutex.lock();
      m_alive = false;
      m_conditional.broadcast();
      m_empty_conditional.broadcast();
      m_mutex.unlock();
    }

    /**
     * Waits until the queue is empty. Returns false if the queue was
     * stopped while waiting.
     */
    bool wait_until_empty() {
      m_mutex.lock();
      // if the queue still has elements in it while I am still alive, wait
      while (m_queue.empty() == false && m_alive == true) {
        m_empty_conditional.wait(m_mutex);
      }
      bool alive = m_alive;
      m_mutex.unlock();
      return alive;
    }

    ~blocking_queue() {
      stop_blocking();
    }
  }; // end of blocking_queue class

} // end of namespace bsplab

#endif
