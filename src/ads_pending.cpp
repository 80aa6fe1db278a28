#include "ads_pending.hpp"

#include <utility>

namespace ads {

PendingTable::Ticket PendingTable::add() {
    std::lock_guard<std::mutex> lock(mutex_);

    // The table can never hold 2^32 entries, so this terminates.
    while (pending_.count(next_id_) != 0) {
        ++next_id_;
    }

    Ticket ticket;
    ticket.invoke_id = next_id_++;
    std::promise<Reply> slot;
    ticket.reply = slot.get_future();
    pending_.emplace(ticket.invoke_id, std::move(slot));
    return ticket;
}

bool PendingTable::complete(uint32_t invoke_id, Frame frame, const ClaimHook& on_claim) {
    std::promise<Reply> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(invoke_id);
        if (it == pending_.end()) {
            return false;
        }
        slot = std::move(it->second);
        pending_.erase(it);
    }

    if (on_claim) on_claim(frame);

    Reply reply;
    reply.frame = std::move(frame);
    slot.set_value(std::move(reply));
    return true;
}

bool PendingTable::remove(uint32_t invoke_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.erase(invoke_id) != 0;
}

size_t PendingTable::fail_all(const Error& error) {
    std::map<uint32_t, std::promise<Reply>> swept;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        swept.swap(pending_);
    }

    for (auto& entry : swept) {
        Reply reply;
        reply.error = error;
        entry.second.set_value(std::move(reply));
    }
    return swept.size();
}

bool PendingTable::contains(uint32_t invoke_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(invoke_id) != 0;
}

size_t PendingTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

} // namespace ads
