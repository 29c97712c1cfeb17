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
#include <bsplab/parallel/fork_join_pool.hpp>
#include <bsplab/logger/assertions.hpp>

namespace bsplab {

  namespace {
    // The pool the calling thread works for, and its worker index.
    __thread const fork_join_pool* tls_pool = NULL;
    __thread size_t tls_worker_id = 0;

    // spins before a worker without work goes to sleep
    const size_t IDLE_SPINS = 64;
    // idle workers recheck for work at least this often
    const long IDLE_SLEEP_NS = 1000000;

    inline uint32_t xorshift(uint32_t& state) {
      state ^= state << 13;
      state ^= state >> 17;
      state ^= state << 5;
      return state;
    }
  }


  fork_join_pool::fork_join_pool(size_t nworkers)
    : pending_tasks(0), nsleeping(0), shutting_down(false) {
    ASSERT_GT(nworkers, 0);
    workers.resize(nworkers);
    for (size_t i = 0; i < nworkers; ++i) {
      workers[i] = new worker;
      workers[i]->rng_state = uint32_t(2654435761u * (i + 1));
    }
    for (size_t i = 0; i < nworkers; ++i) {
      threads.launch(boost::bind(&fork_join_pool::worker_loop, this, i));
    }
  }


  fork_join_pool::~fork_join_pool() {
    sleep_mut.lock();
    shutting_down = true;
    sleep_cond.broadcast();
    sleep_mut.unlock();
    threads.join();
    for (size_t i = 0; i < workers.size(); ++i) {
      ASSERT_TRUE(workers[i]->tasks.empty());
      delete workers[i];
    }
  }


  bool fork_join_pool::is_worker_thread() const {
    return tls_pool == this;
  }


  void fork_join_pool::run_task(task* t) {
    try {
      t->fn();
    } catch (...) {
      // rethrown by whoever waits for this task
      t->error = std::current_exception();
    }
    if (t->notify_invoker) {
      invoke_mut.lock();
      t->done = true;
      invoke_cond.broadcast();
      invoke_mut.unlock();
    }
    else {
      __sync_synchronize();
      t->done = true;
    }
  }


  void fork_join_pool::notify_sleepers() {
    if (nsleeping.value > 0) {
      sleep_mut.lock();
      sleep_cond.signal();
      sleep_mut.unlock();
    }
  }


  void fork_join_pool::push_local(size_t id, task* t) {
    worker& w = *workers[id];
    w.lock.lock();
    w.tasks.push_back(t);
    w.lock.unlock();
    pending_tasks.inc();
    notify_sleepers();
  }


  bool fork_join_pool::pop_local(size_t id, task*& t) {
    worker& w = *workers[id];
    bool success = false;
    w.lock.lock();
    if (!w.tasks.empty()) {
      t = w.tasks.back();
      w.tasks.pop_back();
      success = true;
    }
    w.lock.unlock();
    if (success) pending_tasks.dec();
    return success;
  }


  bool fork_join_pool::steal(size_t thief, task*& t) {
    const size_t nworkers = workers.size();
    const size_t start = xorshift(workers[thief]->rng_state) % nworkers;
    for (size_t k = 0; k < nworkers; ++k) {
      const size_t victim = (start + k) % nworkers;
      if (victim == thief) continue;
      worker& w = *workers[victim];
      // skip busy victims rather than queue on their lock
      if (!w.lock.try_lock()) continue;
      bool success = false;
      if (!w.tasks.empty()) {
        t = w.tasks.front();
        w.tasks.pop_front();
        success = true;
      }
      w.lock.unlock();
      if (success) {
        pending_tasks.dec();
        return true;
      }
    }
    // root tasks submitted from outside the pool
    bool success = false;
    injection_lock.lock();
    if (!injection_queue.empty()) {
      t = injection_queue.front();
      injection_queue.pop_front();
      success = true;
    }
    injection_lock.unlock();
    if (success) pending_tasks.dec();
    return success;
  }


  void fork_join_pool::worker_loop(size_t id) {
    tls_pool = this;
    tls_worker_id = id;
    size_t idle_spins = 0;
    while (!shutting_down) {
      task* t = NULL;
      if (pop_local(id, t) || steal(id, t)) {
        run_task(t);
        idle_spins = 0;
        continue;
      }
      if (++idle_spins < IDLE_SPINS) {
        sched_yield();
        continue;
      }
      idle_spins = 0;
      sleep_mut.lock();
      if (pending_tasks.value == 0 && !shutting_down) {
        nsleeping.inc();
        sleep_cond.timedwait_ns(sleep_mut, IDLE_SLEEP_NS);
        nsleeping.dec();
      }
      sleep_mut.unlock();
    }
    tls_pool = NULL;
  }


  void fork_join_pool::invoke(const task_function_type& root) {
    if (is_worker_thread()) {
      root();
      return;
    }
    task root_task(root, true);
    injection_lock.lock();
    injection_queue.push_back(&root_task);
    injection_lock.unlock();
    pending_tasks.inc();
    notify_sleepers();

    invoke_mut.lock();
    while (!root_task.done) invoke_cond.wait(invoke_mut);
    invoke_mut.unlock();
    if (root_task.error) std::rethrow_exception(root_task.error);
  }


  void fork_join_pool::join(const task_function_type& left,
                            const task_function_type& right) {
    if (!is_worker_thread()) {
      invoke(boost::bind(&fork_join_pool::join, this, left, right));
      return;
    }
    const size_t id = tls_worker_id;
    task right_task(right);
    push_local(id, &right_task);

    std::exception_ptr left_error;
    try {
      left();
    } catch (...) {
      // rethrown once the right branch is finished
      left_error = std::current_exception();
    }

    // Thieves take from the top, so if the right branch is still here it
    // is the bottom entry. Otherwise it was stolen and the deque is empty.
    task* t = NULL;
    if (pop_local(id, t)) {
      ASSERT_TRUE(t == &right_task);
      run_task(&right_task);
    }
    else {
      while (!right_task.done) {
        task* stolen = NULL;
        if (steal(id, stolen)) run_task(stolen);
        else sched_yield();
      }
      __sync_synchronize();
    }

    if (left_error) std::rethrow_exception(left_error);
    if (right_task.error) std::rethrow_exception(right_task.error);
  }

}
