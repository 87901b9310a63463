#include "operation_queue.h"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

void TestRunsInSubmissionOrder()
{
    OperationQueue queue;
    queue.Start();

    std::vector<int> order;
    for (int i = 0; i < 5; ++i)
    {
        assert(queue.Post([&order, i]() { order.push_back(i); }));
    }
    auto last = queue.Submit([&order]() { return order.size(); });
    assert(last.get() == 5);
    queue.Shutdown();

    assert((order == std::vector<int>{0, 1, 2, 3, 4}));
}

void TestSubmitCarriesResultAndException()
{
    OperationQueue queue;
    queue.Start();

    auto value = queue.Submit([]() { return std::string("restored"); });
    assert(value.get() == "restored");

    auto failing = queue.Submit([]() -> int { throw std::runtime_error("boom"); });
    bool caught = false;
    try
    {
        failing.get();
    }
    catch (const std::runtime_error& e)
    {
        caught = std::string(e.what()) == "boom";
    }
    assert(caught);

    // The queue survives a failed task
    assert(queue.Submit([]() { return 7; }).get() == 7);
    queue.Shutdown();
}

void TestStopDrainsAndRejects()
{
    OperationQueue queue;
    queue.Start();

    int ran = 0;
    for (int i = 0; i < 3; ++i) assert(queue.Post([&ran]() { ++ran; }));
    queue.Shutdown();
    assert(ran == 3);
    assert(queue.Queued() == 0);

    assert(!queue.Post([&ran]() { ++ran; }));
    assert(!queue.Submit([]() { return 1; }).valid());
}

void TestPostedFailureDoesNotStopQueue()
{
    OperationQueue queue;
    assert(!queue.Post([]() {}));   // not started yet
    queue.Start();

    assert(queue.Post([]() { throw std::runtime_error("posted"); }));
    assert(queue.Submit([]() { return 3; }).get() == 3);
    queue.Shutdown();
}

} // namespace

int main()
{
    TestRunsInSubmissionOrder();
    TestSubmitCarriesResultAndException();
    TestStopDrainsAndRejects();
    TestPostedFailureDoesNotStopQueue();

    std::cout << "operation_queue_test: pass\n";
    return 0;
}
