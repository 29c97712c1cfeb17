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


#ifndef BSPLAB_FORK_JOIN_POOL_HPP
#define BSPLAB_FORK_JOIN_POOL_HPP

#include <deque>
#include <exception>
#include <vector>
#include <stdint.h>
#include <boost/function.hpp>
#include <bsplab/parallel/pthread_tools.hpp>
#include <bsplab/parallel/atomic.hpp>

namespace bsplab {

  /**
   * \ingroup util
   * A work-stealing pool for fork-join parallelism.
   *
   * Every worker owns a deque of pending tasks. The owner pushes and pops
   * at the bottom; idle workers steal from the top of a randomly chosen
   * victim. join() publishes its right branch for stealing, runs the left
   * branch itself and then either takes the right branch back or, if it
   * was stolen, keeps executing stolen work until the thief finishes it.
   * A joining worker therefore never sleeps while work exists.
   *
   * \code
   *   fork_join_pool pool(4);
   *   pool.invoke(boost::bind(&sum_range, &pool, 0, n));
   *   // inside sum_range:
   *   pool->join(boost::bind(&sum_range, pool, lo, mid),
   *              boost::bind(&sum_range, pool, mid, hi));
   * \endcode
   *
   * Exceptions thrown by either branch are rethrown from join() once both
   * branches have completed (the left one wins when both fail), and from
   * invoke() for the root task.
   */
  class fork_join_pool {
  public:
    typedef boost::function<void (void)> task_function_type;

    /// Starts nworkers worker threads.
    explicit fork_join_pool(size_t nworkers);

    /// Stops and joins the workers. No task may be running.
    ~fork_join_pool();

    /// The number of worker threads
    size_t size() const { return workers.size(); }

    /**
     * Runs root on the pool and blocks the calling thread until it and
     * every task it forked have completed. Called from one of this pool's
     * workers, root simply runs inline.
     */
    void invoke(const task_function_type& root);

    /**
     * Runs left and right, possibly in parallel, and returns when both
     * are done. Called from outside the pool it behaves like invoke().
     */
    void join(const task_function_type& left, const task_function_type& right);

    /// True when the calling thread is one of this pool's workers.
    bool is_worker_thread() const;

  private:
    struct task {
      task_function_type fn;
      volatile bool done;
      bool notify_invoker;
      std::exception_ptr error;
      explicit task(const task_function_type& fn, bool notify_invoker = false)
        : fn(fn), done(false), notify_invoker(notify_invoker) { }
    };

    struct worker {
      simple_spinlock lock;
      std::deque<task*> tasks;
      uint32_t rng_state;
    };

    void worker_loop(size_t id);
    void run_task(task* t);
    void push_local(size_t id, task* t);
    bool pop_local(size_t id, task*& t);
    bool steal(size_t thief, task*& t);
    void notify_sleepers();

    std::vector<worker*> workers;

    simple_spinlock injection_lock;
    std::deque<task*> injection_queue;

    atomic<size_t> pending_tasks;
    mutex sleep_mut;
    conditional sleep_cond;
    atomic<size_t> nsleeping;

    mutex invoke_mut;
    conditional invoke_cond;

    volatile bool shutting_down;
    thread_group threads;

    // not implemented
    fork_join_pool(const fork_join_pool&);
    fork_join_pool& operator=(const fork_join_pool&);
  };

}
#endif
