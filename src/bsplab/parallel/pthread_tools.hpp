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


#ifndef BSPLAB_PTHREAD_TOOLS_HPP
#define BSPLAB_PTHREAD_TOOLS_HPP

#include <cstdlib>
#include <pthread.h>
#include <sched.h>
#include <sys/time.h>
#include <unistd.h>
#include <exception>
#include <queue>
#include <utility>
#include <boost/function.hpp>
#include <bsplab/logger/assertions.hpp>

#define __likely__(x)       __builtin_expect((x),1)
#define __unlikely__(x)     __builtin_expect((x),0)

/**
 * \file pthread_tools.hpp A collection of utilities for threading
 */
namespace bsplab {

  /**
   * \class mutex
   *
   * Wrapper around pthread's mutex. Used where a thread may hold the
   * lock for a while or has to sleep on a conditional.
   */
  class mutex {
  private:
    // mutable not actually needed
    mutable pthread_mutex_t m_mut;
  public:
    mutex() {
      int error = pthread_mutex_init(&m_mut, NULL);
      ASSERT_TRUE(!error);
    }
    inline void lock() const {
      int error = pthread_mutex_lock( &m_mut  );
      ASSERT_TRUE(!error);
    }
    inline void unlock() const {
      int error = pthread_mutex_unlock( &m_mut );
      ASSERT_TRUE(!error);
    }
    inline bool try_lock() const {
      return pthread_mutex_trylock( &m_mut ) == 0;
    }
    ~mutex(){
      pthread_mutex_destroy( &m_mut );
    }
    friend class conditional;
  }; // End of Mutex


  /**
   * \class simple_spinlock
   *
   * A one byte test-and-set spinlock. Cheap enough to keep one per
   * vertex. Critical sections guarded by it must be short and must not
   * call user code.
   */
  class simple_spinlock {
  private:
    // mutable not actually needed
    mutable volatile char spinner;
  public:
    simple_spinlock () {
      spinner = 0;
    }
    // copies start out unlocked so the lock can live in std::vector
    simple_spinlock (const simple_spinlock&) {
      spinner = 0;
    }
    simple_spinlock& operator=(const simple_spinlock&) {
      return *this;
    }
    inline void lock() const {
      while(spinner == 1 || __sync_lock_test_and_set(&spinner, 1));
    }
    inline void unlock() const {
      __sync_synchronize();
      spinner = 0;
    }
    inline bool try_lock() const {
      return (__sync_lock_test_and_set(&spinner, 1) == 0);
    }
  };


  /**
   * \class conditional
   * Wrapper around pthread's condition variable
   */
  class conditional {
  private:
    mutable pthread_cond_t  m_cond;
  public:
    conditional() {
      int error = pthread_cond_init(&m_cond, NULL);
      ASSERT_TRUE(!error);
    }
    inline void wait(const mutex& mut) const {
      int error = pthread_cond_wait(&m_cond, &mut.m_mut);
      ASSERT_TRUE(!error);
    }
    /// Waits at most ns nanoseconds. Returns 0 if signalled.
    inline int timedwait_ns(const mutex& mut, long ns) const {
      struct timespec timeout;
      struct timeval tv;
      gettimeofday(&tv, NULL);
      long nsec = tv.tv_usec * 1000 + ns;
      timeout.tv_sec = tv.tv_sec + nsec / 1000000000;
      timeout.tv_nsec = nsec % 1000000000;
      return pthread_cond_timedwait(&m_cond, &mut.m_mut, &timeout);
    }
    inline void signal() const {
      int error = pthread_cond_signal(&m_cond);
      ASSERT_TRUE(!error);
    }
    inline void broadcast() const {
      int error = pthread_cond_broadcast(&m_cond);
      ASSERT_TRUE(!error);
    }
    ~conditional() {
      pthread_cond_destroy(&m_cond);
    }
  }; // End conditional


  /**
   * \class thread
   * A collection of routines for starting and managing threads.
   */
  class thread {
  public:

    /**
     * This class contains the data unique to each thread. All threads
     * are guaranteed to have an associated bsplab thread specific
     * data. The thread object is copyable.
     */
    class tls_data {
    public:
      inline tls_data(size_t thread_id) : thread_id_(thread_id) { }
      inline size_t thread_id() { return thread_id_; }
      inline void set_thread_id(size_t t) { thread_id_ = t; }
    private:
      size_t thread_id_;
    }; // end of thread specific data


    /// Static helper routines
    // ===============================================================

    /**
     * Get the thread specific data associated with this thread
     */
    static tls_data& get_tls_data();

    /** Get the id of the calling thread.  This will typically be the
        index in the thread group. Between 0 to ncpus. */
    static inline size_t thread_id() { return get_tls_data().thread_id(); }

    /** Set the id of the calling thread. */
    static inline void set_thread_id(size_t t) { get_tls_data().set_thread_id(t); }

  private:

    struct invoke_args{
      size_t m_thread_id;
      boost::function<void(void)> spawn_routine;
      invoke_args(size_t m_thread_id, const boost::function<void(void)> &spawn_routine)
          : m_thread_id(m_thread_id), spawn_routine(spawn_routine) { };
    };

    //! Little helper function used to launch threads
    static void* invoke(void *_args);

  public:

    /**
     * Creates a thread with a user-defined associated thread ID
     */
    inline thread(size_t thread_id = 0) :
      m_stack_size(8 * 1048576),
      m_p_thread(0),
      m_thread_id(thread_id),
      thread_started(false) { }

    /**
     * execute this function to spawn a new thread running spawn_function
     * routine. The routine must not let exceptions escape.
     */
    void launch(const boost::function<void (void)> &spawn_routine);

    /**
     * Join the calling thread with this thread.
     */
    void join();

    inline bool active() const {
      return thread_started;
    }

  private:
    //! The size of the internal stack for this thread
    size_t m_stack_size;
    //! The internal pthread object
    pthread_t m_p_thread;
    //! the threads id
    size_t m_thread_id;
    bool thread_started;
  }; // End of class thread


  /**
   * \class thread_group Manages a collection of threads
   *
   * Exceptions thrown by a launched function are captured and
   * rethrown from join() on the joining thread, one per join() call.
   * This class is not copyable.
   */
  class thread_group {
   private:
    size_t m_thread_counter;
    size_t threads_running;
    mutex mut;
    conditional cond;
    std::queue<std::pair<pthread_t, std::exception_ptr> > joinqueue;
    // not implemented
    thread_group& operator=(const thread_group &thrgrp);
    thread_group(const thread_group&);
    static void invoke(boost::function<void (void)> spawn_function, thread_group *group);
   public:
    /**
     * Initializes a thread group.
     */
    thread_group() : m_thread_counter(0), threads_running(0) { }

    /**
     * Launch a single thread which calls spawn_function. The thread id
     * of the new thread is its launch index within the group.
     */
    void launch(const boost::function<void (void)> &spawn_function);

    //! Waits for all threads to complete execution
    void join();

    inline size_t running_threads() {
      return threads_running;
    }
    //! Destructor. Waits for all threads to complete execution
    ~thread_group();

  }; // End of thread group

}; // End Namespace
#endif
