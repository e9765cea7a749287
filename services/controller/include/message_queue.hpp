#pragma once
#include "../../../shared/cpp/bridge_sdk/include/message.hpp"
#include <deque>
#include <mutex>
#include <vector>

// FIFO of messages waiting for the agent's next poll. The HTTP daemon thread
// drains it while the controller enqueues, so both operations take the lock.
class MessageQueue {
public:
    void enqueue(BridgeMessage msg);
    // Removes and returns everything queued, oldest first.
    std::vector<BridgeMessage> drain_all();
    std::size_t size();
    void clear();

private:
    std::mutex mtx_;
    std::deque<BridgeMessage> items_;
};
