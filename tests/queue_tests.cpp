// Execution contexts, chunk pipe and the would-block retry loop.
#include "asyncsftp/ChunkPipe.hpp"
#include "asyncsftp/MockTransport.hpp"
#include "asyncsftp/RetryLoop.hpp"
#include "asyncsftp/SerialQueue.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace asyncsftp;

namespace {

constexpr auto kWait = std::chrono::seconds(10);

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

// ---- SerialQueue ----

void test_serial_queue_runs_in_order(TestContext &t) {
    std::vector<int> order;
    std::set<std::thread::id> threads;
    {
        SerialQueue q("test.serial");
        for (int i = 0; i < 100; ++i)
            q.async([&order, &threads, i] {
                order.push_back(i);
                threads.insert(std::this_thread::get_id());
            });
        q.sync([] {});
    }
    bool ordered = order.size() == 100;
    for (std::size_t i = 0; ordered && i < order.size(); ++i)
        ordered = order[i] == static_cast<int>(i);
    t.check(ordered, "serial queue runs tasks in submission order");
    t.check(threads.size() == 1, "serial queue uses a single thread");
    t.check(threads.count(std::this_thread::get_id()) == 0,
            "tasks never run on the submitting thread");
}

void test_serial_queue_sync_and_current(TestContext &t) {
    SerialQueue q("test.sync");
    t.check(!q.isCurrent(), "caller is not the queue");
    bool inside = false;
    bool nested = false;
    q.sync([&] {
        inside = q.isCurrent();
        // sync from the queue itself must not deadlock
        q.sync([&] { nested = q.isCurrent(); });
    });
    t.check(inside, "isCurrent() inside a queued task");
    t.check(nested, "nested sync runs inline on the queue");

    bool rethrown = false;
    try {
        q.sync([] { throw std::runtime_error("boom"); });
    } catch (const std::runtime_error &) {
        rethrown = true;
    }
    t.check(rethrown, "sync() rethrows the task's exception to the caller");

    std::atomic<bool> ran{false};
    q.sync([&ran] { ran = true; });
    t.check(ran.load(), "queue keeps working after a throwing task");
}

// ---- WorkerPool ----

void test_worker_pool_runs_off_caller(TestContext &t) {
    WorkerPool pool(2, "test.pool");
    std::promise<std::thread::id> where;
    auto fut = where.get_future();
    pool.async([&where] { where.set_value(std::this_thread::get_id()); });
    t.check(fut.wait_for(kWait) == std::future_status::ready,
            "task runs on the pool");
    t.check(fut.get() != std::this_thread::get_id(),
            "pool task runs off the caller's thread");
    t.check(pool.name() == "test.pool", "pool keeps its name");
    t.check(!pool.isWorkerThread(), "caller is not a pool thread");
}

void test_worker_pool_drains_on_shutdown(TestContext &t) {
    std::atomic<int> done{0};
    {
        WorkerPool pool(2, "test.drain");
        for (int i = 0; i < 50; ++i)
            pool.async([&done] {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                ++done;
            });
    }
    t.check(done.load() == 50, "queued tasks all run before the pool dies");
}

void test_worker_pool_after_shutdown_runs_inline(TestContext &t) {
    WorkerPool pool(1, "test.stopped");
    pool.shutdown();
    pool.shutdown();
    std::thread::id where;
    pool.async([&where] { where = std::this_thread::get_id(); });
    t.check(where == std::this_thread::get_id(),
            "a stopped pool runs tasks on the submitting thread");
}

// ---- ChunkPipe ----

ChunkPipe::Chunk chunkOf(const std::string &s) {
    return ChunkPipe::Chunk(s.begin(), s.end());
}

void test_chunk_pipe_order_and_close(TestContext &t) {
    ChunkPipe pipe(4);
    t.check(pipe.push(chunkOf("a")), "push a");
    t.check(pipe.push(chunkOf("bb")), "push bb");
    pipe.close();
    ChunkPipe::Chunk c;
    t.check(pipe.pop(c) && std::string(c.begin(), c.end()) == "a",
            "first chunk out is the first in");
    t.check(pipe.pop(c) && std::string(c.begin(), c.end()) == "bb",
            "second chunk follows");
    t.check(!pipe.pop(c), "pop after the last chunk reports end of stream");
    t.check(!pipe.aborted(), "closing is not aborting");
}

void test_chunk_pipe_backpressure(TestContext &t) {
    ChunkPipe pipe(1);
    t.check(pipe.push(chunkOf("1")), "first push fits");
    std::atomic<bool> secondPushed{false};
    std::thread producer([&] {
        pipe.push(chunkOf("2"));
        secondPushed = true;
        pipe.close();
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    t.check(!secondPushed.load(), "producer blocks while the pipe is full");

    std::string got;
    ChunkPipe::Chunk c;
    while (pipe.pop(c))
        got.append(c.begin(), c.end());
    producer.join();
    t.check(secondPushed.load(), "producer resumes once space frees up");
    t.check(got == "12", "consumer sees every chunk in order");
}

void test_chunk_pipe_abort(TestContext &t) {
    ChunkPipe pipe(2);
    std::promise<bool> popped;
    auto fut = popped.get_future();
    std::thread consumer([&] {
        ChunkPipe::Chunk c;
        popped.set_value(pipe.pop(c));
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    pipe.abort();
    t.check(fut.wait_for(kWait) == std::future_status::ready,
            "abort releases a consumer blocked on an empty pipe");
    consumer.join();
    t.check(!fut.get(), "an aborted pop yields no chunk");
    t.check(pipe.aborted(), "aborted() reports the abort");
    t.check(!pipe.push(chunkOf("x")), "push after abort is refused");

    ChunkPipe full(1);
    t.check(full.push(chunkOf("a")), "fill the pipe");
    std::promise<bool> pushed;
    auto pushFut = pushed.get_future();
    std::thread producer([&] { pushed.set_value(full.push(chunkOf("b"))); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    full.abort();
    t.check(pushFut.wait_for(kWait) == std::future_status::ready,
            "abort releases a producer blocked on a full pipe");
    producer.join();
    t.check(!pushFut.get(), "the blocked push reports the abort");
}

// ---- retry loop ----

struct OpenMock {
    std::shared_ptr<MockTransport::Server> server =
        std::make_shared<MockTransport::Server>();
    MockTransport transport{server};

    OpenMock() {
        std::string err;
        transport.openSocket("mock.test", 22, err);
    }

    std::size_t waits() {
        std::lock_guard<std::mutex> lk(server->mu);
        return server->readiness_waits;
    }
};

void test_retry_until_ready(TestContext &t) {
    OpenMock m;
    int calls = 0;
    const int rc = retryWhileBlocked(m.transport, std::chrono::milliseconds(50),
                                     [&calls] {
                                         return ++calls < 4 ? kWouldBlock : 7;
                                     });
    t.check(rc == 7, "retry returns the first non-would-block result");
    t.check(calls == 4, "operation called until it stops blocking");
    t.check(m.waits() == 3, "one readiness wait per would-block");
}

void test_retry_stop_predicate(TestContext &t) {
    OpenMock m;
    int calls = 0;
    const int rc = retryWhileBlocked(
        m.transport, std::chrono::milliseconds(50), [] { return true; },
        [&calls] {
            ++calls;
            return kWouldBlock;
        });
    t.check(rc == kRetryInterrupted, "stop predicate interrupts the loop");
    t.check(calls == 1, "operation is not called again after the stop");
    t.check(m.waits() == 0, "no readiness wait once stopped");

    const int done = retryWhileBlocked(
        m.transport, std::chrono::milliseconds(50), [] { return true; },
        [] { return 0; });
    t.check(done == 0, "a completed operation is never reported as stopped");
}

void test_retry_wait_failure(TestContext &t) {
    OpenMock m;
    m.transport.closeSocket();
    const int rc = retryWhileBlocked(m.transport, std::chrono::milliseconds(50),
                                     [] { return kWouldBlock; });
    t.check(rc == kRetryWaitFailed, "a dead socket ends the loop");
}

} // namespace

int main() {
    TestContext t;
    test_serial_queue_runs_in_order(t);
    test_serial_queue_sync_and_current(t);
    test_worker_pool_runs_off_caller(t);
    test_worker_pool_drains_on_shutdown(t);
    test_worker_pool_after_shutdown_runs_inline(t);
    test_chunk_pipe_order_and_close(t);
    test_chunk_pipe_backpressure(t);
    test_chunk_pipe_abort(t);
    test_retry_until_ready(t);
    test_retry_stop_predicate(t);
    test_retry_wait_failure(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] asyncsftp_queue_tests\n";
    return EXIT_SUCCESS;
}
