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


#include <bsplab/parallel/pthread_tools.hpp>
#include <boost/bind.hpp>

namespace bsplab {

  // Some magic to ensure that keys are created at program startup =========>
  void destroy_tls_data(void* ptr);
  struct thread_keys {
    pthread_key_t BSPLAB_TSD_ID;
    thread_keys() : BSPLAB_TSD_ID(0) {
      pthread_key_create(&BSPLAB_TSD_ID, destroy_tls_data);
    }
  };
  static const thread_keys keys;
  // END MAGIC =============================================================>


  /**
   * Create thread specific data
   */
  thread::tls_data* create_tls_data(size_t thread_id = 0) {
    // Require that the data not yet exist
    ASSERT_TRUE(pthread_getspecific(keys.BSPLAB_TSD_ID) == NULL);
    thread::tls_data* data = new thread::tls_data(thread_id);
    pthread_setspecific(keys.BSPLAB_TSD_ID, data);
    return data;
  } // end create the thread specific data

  /**
   * This function tries to get the thread specific data.  If no
   * thread specific data has been associated with the thread than it
   * is created.
   */
  thread::tls_data& thread::get_tls_data() {
    tls_data* tsd =
      reinterpret_cast<tls_data*>(pthread_getspecific(keys.BSPLAB_TSD_ID));
    // If no tsd be has been associated, create one
    if(tsd == NULL) tsd = create_tls_data();
    return *tsd;
  } // end of get thread specific data

  void destroy_tls_data(void* ptr) {
    thread::tls_data* tsd = reinterpret_cast<thread::tls_data*>(ptr);
    delete tsd;
  }

  void* thread::invoke(void *_args) {
    thread::invoke_args* args = static_cast<thread::invoke_args*>(_args);
    // Create the bsplab thread specific data
    create_tls_data(args->m_thread_id);
    //! Run the users thread code
    args->spawn_routine();
    //! Delete the arguments
    delete args;
    return NULL;
  } // end of invoke

  void thread::launch(const boost::function<void (void)> &spawn_routine) {
    ASSERT_FALSE(thread_started);
    // fill in the thread attributes
    pthread_attr_t attr;
    int error = 0;
    error = pthread_attr_init(&attr);
    ASSERT_TRUE(!error);
    error = pthread_attr_setstacksize(&attr, m_stack_size);
    ASSERT_TRUE(!error);
    error = pthread_attr_setdetachstate(&attr, PTHREAD_CREATE_JOINABLE);
    ASSERT_TRUE(!error);
    thread::invoke_args* args = new invoke_args(m_thread_id, spawn_routine);
    error = pthread_create(&m_p_thread, &attr, invoke, static_cast<void*>(args));
    pthread_attr_destroy(&attr);
    if(error) {
      delete args;
      logstream(LOG_FATAL) << "pthread_create() returned error " << error
                           << std::endl;
    }
    thread_started = true;
  }

  void thread::join() {
    if(!thread_started) return;
    int error = pthread_join(m_p_thread, NULL);
    thread_started = false;
    if(error) {
      logstream(LOG_FATAL) << "pthread_join() returned error " << error
                           << std::endl;
    }
  } // end of join


  // -----------------------------------------------------------------
  //                 Thread Group Object Public Members
  // -----------------------------------------------------------------
  // thread group exception forwarding is a little more complicated
  // because it has to be able to catch it on a bunch of threads

  void thread_group::invoke(boost::function<void (void)> spawn_function,
                            thread_group *group) {
    std::exception_ptr retval;
    try {
      spawn_function();
    }
    catch (...) {
      // handed to the joining thread
      retval = std::current_exception();
    }
    group->mut.lock();
    group->joinqueue.push(std::make_pair(pthread_self(), retval));
    group->cond.signal();
    group->mut.unlock();
  }

  void thread_group::launch(const boost::function<void (void)> &spawn_function) {
    // Create a thread object and launch it.
    // We do not need to keep a copy of the thread around
    thread local_thread(m_thread_counter++);
    mut.lock();
    threads_running++;
    mut.unlock();
    local_thread.launch(boost::bind(thread_group::invoke, spawn_function, this));
  }

  void thread_group::join() {
    mut.lock();
    while(threads_running > 0) {
      // if no threads are joining. wait
      while (joinqueue.empty()) cond.wait(mut);
      // a thread is joining
      std::pair<pthread_t, std::exception_ptr> joining_thread = joinqueue.front();
      joinqueue.pop();
      threads_running--;
      // unlock here since I might be in join for a little while
      mut.unlock();
      pthread_join(joining_thread.first, NULL);
      // It is safe to throw here since I have the mutex unlocked.
      if (joining_thread.second) {
        std::rethrow_exception(joining_thread.second);
      }
      mut.lock();
    }
    mut.unlock();
  }

  thread_group::~thread_group() {
    while (running_threads() > 0) {
      try {
        join();
      } catch (const std::exception& e) {
        logstream(LOG_ERROR) << "Unjoined thread failed: " << e.what()
                             << std::endl;
      }
    }
  }

}
