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


#include <boost/bind.hpp>
#include <bsplab/parallel/thread_pool.hpp>
#include <bsplab/logger/assertions.hpp>

namespace bsplab {

  thread_pool::thread_pool(size_t nthreads) {
    ASSERT_GT(nthreads, 0);
    waiting_on_join = false;
    tasks_inserted = 0;
    tasks_completed = 0;
    pool_size = nthreads;
    for (size_t i = 0;i < pool_size; ++i) {
      threads.launch(boost::bind(&thread_pool::wait_for_task, this));
    }
  } // end of thread_pool


  size_t thread_pool::size() const { return pool_size; }


  void thread_pool::wait_for_task() {
    while(1) {
      std::pair<boost::function<void (void)>, bool> queue_entry =
        spawn_queue.dequeue();
      // quit if the queue is dead
      if (!queue_entry.second) break;
      std::exception_ptr error;
      try {
        queue_entry.first();
      } catch(...) {
        // forwarded to join()
        error = std::current_exception();
      }
      mut.lock();
      if (error && !first_exception) first_exception = error;
      tasks_completed++;
      // the waiting on join flag just prevents me from
      // signaling every time completed == inserted.
      if (waiting_on_join && tasks_completed == tasks_inserted) {
        event_condition.signal();
      }
      mut.unlock();
    }
  } // end of wait_for_task


  void thread_pool::launch(const boost::function<void (void)> &spawn_function) {
    mut.lock();
    tasks_inserted++;
    mut.unlock();
    spawn_queue.enqueue(spawn_function);
  }


  void thread_pool::join() {
    mut.lock();
    waiting_on_join = true;
    while(tasks_completed != tasks_inserted) {
      event_condition.wait(mut);
    }
    waiting_on_join = false;
    std::exception_ptr error = first_exception;
    first_exception = std::exception_ptr();
    mut.unlock();
    if (error) std::rethrow_exception(error);
  }


  thread_pool::~thread_pool() {
    // wait for all execution to complete
    spawn_queue.wait_until_empty();
    // kill the queue
    spawn_queue.stop_blocking();
    threads.join();
  }

}
