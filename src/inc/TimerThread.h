/*******************************************************************************
 *
 * Copyright (c) 2000-2003 Intel Corporation
 * Copyright (c) 2020 J.F. Dockes <jf@dockes.org>
 * Copyright (c) 2026 The ecpemu contributors
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * - Redistributions of source code must retain the above copyright notice,
 * this list of conditions and the following disclaimer.
 * - Redistributions in binary form must reproduce the above copyright notice,
 * this list of conditions and the following disclaimer in the documentation
 * and/or other materials provided with the distribution.
 * - Neither name of Intel Corporation nor the names of its contributors
 * may be used to endorse or promote products derived from this software
 * without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
 * "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
 * LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
 * A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL INTEL OR
 * CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
 * PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY
 * OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
 * NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 *
 ******************************************************************************/

#ifndef TIMERTHREAD_H
#define TIMERTHREAD_H

#include <chrono>
#include <memory>

/*! A unit of work to be run by the TimerThread. */
class JobWorker {
public:
    virtual ~JobWorker() = default;
    virtual void work() = 0;
};

/*!
 * A timer thread that allows the scheduling of jobs to run at a
 * specified time in the future.
 *
 * Jobs are run one at a time on the timer's own thread, without holding
 * the timer lock, so a job may schedule or remove other jobs.
 */
class TimerThread {
public:
    TimerThread();
    /*! Calls shutdown() */
    ~TimerThread();
    TimerThread(const TimerThread&) = delete;
    TimerThread& operator=(const TimerThread&) = delete;

    /*!
     * \brief Schedules a job to run at a specified time.
     *
     * \return 0 on success, -1 if the timer was shut down.
     */
    int schedule(
        /*! [in] Monotonic time of event */
        std::chrono::steady_clock::time_point when,
        /* [out] Id of timer event. (can be null). */
        int *id,
        std::unique_ptr<JobWorker> worker);

    /*! Schedule a job to run after delay */
    int schedule(std::chrono::milliseconds delay, int *id,
                 std::unique_ptr<JobWorker> worker);

    /*!
     * \brief Removes an event from the timer Q.
     *
     * Events can only be removed before they have started to run.
     *
     * \return 0 on success, -1 if no such event is queued.
     */
    int remove(int id);

    /*!
     * \brief Shutdown the timer thread.
     *
     * Events scheduled in the future will NOT be run. If a job is running,
     * waits for it to complete. Must not be called from a job.
     *
     * \return 0. Can be called several times.
     */
    int shutdown();

    class Internal;
private:
    std::unique_ptr<Internal> m;
};

#endif /* TIMERTHREAD_H */
