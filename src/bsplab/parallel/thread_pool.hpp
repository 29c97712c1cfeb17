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


#ifndef BSPLAB_THREAD_POOL_HPP
#define BSPLAB_THREAD_POOL_HPP

#include <exception>
#include <queue>
#include <boost/function.hpp>
#include <bsplab/parallel/pthread_tools.hpp>
#include <bsplab/util/blocking_queue.hpp>

namespace bsplab {

  /**
   * \ingroup util
   * Manages a pool of threads.
   *
   * The thread pool preallocates a collection of threads which it keeps
   * asleep. When tasks are issued through the "launch" function, threads
   * are woken up to perform the tasks. The engine uses it to run one
   * task per static partition under the RANGE and DEGREE strategies.
   *
   * Exceptions thrown within a task are caught and forwarded to the
   * join() function. If several tasks failed, join() throws the first
   * one and discards the rest, after every task has finished.
   */
  class thread_pool {
  private:

    thread_group threads;
    blocking_queue<boost::function<void (void)> > spawn_queue;
    size_t pool_size;

    // protects the exception, and the task counters
    mutex mut;
    conditional event_condition;  // to wake up the joining thread
    std::exception_ptr first_exception;
    size_t tasks_inserted;
    size_t tasks_completed;
    bool waiting_on_join; // true if a thread is waiting in join

    // not implemented
    thread_pool& operator=(const thread_pool &thrgrp);
    thread_pool(const thread_pool&);

    /**
       Called by each thread. Loops around a queue of tasks.
    */
    void wait_for_task();

  public:

    /* Initializes a thread pool with nthreads. */
    explicit thread_pool(size_t nthreads = 2);

    /**
     * Get the number of threads
     */
    size_t size() const;

    /**
     * Queue a task. It is picked up by the next idle thread.
     */
    void launch(const boost::function<void (void)> &spawn_function);

    /** Waits for all tasks to complete. The first exception thrown by
        a task since the last join() is rethrown here.
    */
    void join();

    //! Destructor. Cleans up all threads
    ~thread_pool();
  };

}
#endif
