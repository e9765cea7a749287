#include "../include/message_queue.hpp"
#include <iterator>
#include <utility>

void MessageQueue::enqueue(BridgeMessage msg) {
    std::lock_guard<std::mutex> lock(mtx_);
    items_.push_back(std::move(msg));
}

std::vector<BridgeMessage> MessageQueue::drain_all() {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<BridgeMessage> out(std::make_move_iterator(items_.begin()),
                                   std::make_move_iterator(items_.end()));
    items_.clear();
    return out;
}

std::size_t MessageQueue::size() {
    std::lock_guard<std::mutex> lock(mtx_);
    return items_.size();
}

void MessageQueue::clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    items_.clear();
}
