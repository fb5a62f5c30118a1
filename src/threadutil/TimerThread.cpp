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

#include "TimerThread.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <list>
#include <mutex>
#include <thread>
#include <utility>

#include "ecpdebug.h"

using namespace std::chrono;

/*! Data holder for a timer event. */
struct TimerEvent {
    TimerEvent(std::unique_ptr<JobWorker> w, steady_clock::time_point et, int _id)
        : worker(std::move(w)), eventTime(et), id(_id)
    {
    }

    std::unique_ptr<JobWorker> worker;
    steady_clock::time_point eventTime;
    int id;
};

class TimerThread::Internal {
public:
    Internal();
    void run();

    std::mutex mutex;
    std::condition_variable condition;
    int lastEventId{0};
    /* Ordered by eventTime, the head of the Q is the next event. */
    std::list<TimerEvent> eventQ;
    bool inshutdown{false};
    std::thread thread;
};

TimerThread::Internal::Internal()
{
    thread = std::thread(&TimerThread::Internal::run, this);
}

/*!
 * \brief Implements timer thread.
 *
 * Sleeps until next event scheduled time, then runs it then sleeps...
 */
void TimerThread::Internal::run()
{
    std::unique_lock<std::mutex> lck(mutex);

    while (true) {
        /* mutex should always be locked at top of loop */
        if (inshutdown) {
            return;
        }
        if (eventQ.empty()) {
            condition.wait(lck);
            continue;
        }
        steady_clock::time_point currentTime = steady_clock::now();
        /* Copy: the event may be removed while we wait */
        steady_clock::time_point nextTime = eventQ.front().eventTime;
        if (currentTime < nextTime) {
            condition.wait_until(lck, nextTime);
            continue;
        }
        auto worker = std::move(eventQ.front().worker);
        eventQ.pop_front();
        lck.unlock();
        worker->work();
        worker.reset();
        lck.lock();
    }
}

TimerThread::TimerThread()
    : m(std::make_unique<Internal>())
{
}

TimerThread::~TimerThread()
{
    shutdown();
}

int TimerThread::schedule(
    steady_clock::time_point when, int *id, std::unique_ptr<JobWorker> worker)
{
    std::scoped_lock lck(m->mutex);
    if (m->inshutdown) {
        return -1;
    }

    int eventid = m->lastEventId++;
    if (id) {
        *id = eventid;
    }
    auto it = std::find_if(m->eventQ.begin(), m->eventQ.end(),
                           [=](const auto& e) { return e.eventTime > when; });
    m->eventQ.emplace(it, std::move(worker), when, eventid);

    /* signal change in Q. */
    m->condition.notify_all();
    return 0;
}

int TimerThread::schedule(
    std::chrono::milliseconds delay, int *id, std::unique_ptr<JobWorker> worker)
{
    return schedule(steady_clock::now() + delay, id, std::move(worker));
}

int TimerThread::remove(int id)
{
    std::scoped_lock lck(m->mutex);

    auto it = std::find_if(m->eventQ.begin(), m->eventQ.end(),
                           [id](const auto& e) { return e.id == id; });
    if (it != m->eventQ.end()) {
        m->eventQ.erase(it);
        return 0;
    }

    return -1;
}

int TimerThread::shutdown()
{
    std::list<TimerEvent> dropped;
    {
        std::scoped_lock lck(m->mutex);
        m->inshutdown = true;
        dropped.swap(m->eventQ);
        m->condition.notify_all();
    }
    if (m->thread.joinable()) {
        if (m->thread.get_id() == std::this_thread::get_id()) {
            EcpPrintf(ECP_ERROR, TIMER, __FILE__, __LINE__,
                      "TimerThread::shutdown: called from a timer job\n");
            m->thread.detach();
        } else {
            m->thread.join();
        }
    }
    if (!dropped.empty()) {
        EcpPrintf(ECP_DEBUG, TIMER, __FILE__, __LINE__,
                  "TimerThread::shutdown: dropped %d pending events\n",
                  static_cast<int>(dropped.size()));
    }
    return 0;
}
