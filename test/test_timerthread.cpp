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

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

#include "TimerThread.h"
#include "testutil.h"

using namespace std::chrono;

static std::mutex ordermutex;
static std::vector<int> order;

class RecordJob : public JobWorker {
public:
    explicit RecordJob(int v) : m_v(v) {}
    void work() override {
        std::scoped_lock lck(ordermutex);
        order.push_back(m_v);
    }
private:
    int m_v;
};

class CountJob : public JobWorker {
public:
    explicit CountJob(std::atomic<int>& c) : m_c(c) {}
    void work() override {
        m_c++;
    }
private:
    std::atomic<int>& m_c;
};

int main(int, char **)
{
    {
        // Events run in time order, whatever the scheduling order
        TimerThread timer;
        CHECK(timer.schedule(milliseconds(300), nullptr,
                             std::make_unique<RecordJob>(3)) == 0);
        CHECK(timer.schedule(milliseconds(100), nullptr,
                             std::make_unique<RecordJob>(1)) == 0);
        CHECK(timer.schedule(milliseconds(200), nullptr,
                             std::make_unique<RecordJob>(2)) == 0);
        std::this_thread::sleep_for(milliseconds(600));
        std::scoped_lock lck(ordermutex);
        CHECK(order.size() == 3);
        CHECK(order == std::vector<int>({1, 2, 3}));
    }
    {
        // Removed events do not run
        std::atomic<int> count{0};
        TimerThread timer;
        int id1{-1}, id2{-1};
        timer.schedule(milliseconds(150), &id1, std::make_unique<CountJob>(count));
        timer.schedule(milliseconds(150), &id2, std::make_unique<CountJob>(count));
        CHECK(id1 != id2);
        CHECK(timer.remove(id1) == 0);
        CHECK(timer.remove(id1) == -1);
        std::this_thread::sleep_for(milliseconds(400));
        CHECK(count == 1);
        CHECK(timer.remove(id2) == -1);
    }
    {
        // Shutdown drops pending events and refuses new ones
        std::atomic<int> count{0};
        TimerThread timer;
        timer.schedule(seconds(10), nullptr, std::make_unique<CountJob>(count));
        auto start = steady_clock::now();
        CHECK(timer.shutdown() == 0);
        CHECK(steady_clock::now() - start < seconds(2));
        CHECK(timer.shutdown() == 0);
        CHECK(timer.schedule(milliseconds(0), nullptr,
                             std::make_unique<CountJob>(count)) == -1);
        CHECK(count == 0);
    }
    return test_result("test_timerthread");
}
