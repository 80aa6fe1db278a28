#pragma once
/**
 * @file ads_pending.hpp
 * @brief Table of in-flight requests keyed by invoke id
 *
 * Each entry is a one-shot slot (std::promise) fulfilled by exactly one of:
 * - complete(): the reader delivers the matching response
 * - remove():   the waiting caller gives up at its deadline
 * - fail_all(): the connection dropped, every waiter gets the failure
 *
 * Invoke ids are allocated here, monotonically with wrap-around, skipping any
 * id that is still pending.
 */

#include "ads_error.hpp"
#include "ads_frame.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <mutex>

namespace ads {

/// What a waiting caller receives: a frame, or the reason there is none
struct Reply {
    Error error;
    Frame frame;

    bool ok() const { return error.kind == ErrorKind::None; }
};

class PendingTable {
public:
    struct Ticket {
        uint32_t invoke_id = 0;
        std::future<Reply> reply;
    };

    explicit PendingTable(uint32_t first_id = 1) : next_id_(first_id) {}

    PendingTable(const PendingTable&) = delete;
    PendingTable& operator=(const PendingTable&) = delete;

    /// Allocate an unused invoke id and register its slot
    Ticket add();

    /// Runs between retiring an entry and fulfilling it
    using ClaimHook = std::function<void(const Frame&)>;

    /**
     * @brief Fulfil and retire the entry; false if no such entry (late or unknown reply)
     *
     * `on_claim` runs only when the entry was still pending, after it left
     * the table and before the waiter is woken. A waiter whose deadline
     * passes meanwhile finds remove() false and receives this reply.
     */
    bool complete(uint32_t invoke_id, Frame frame, const ClaimHook& on_claim = ClaimHook());

    /// Retire the entry without fulfilling it; false if it was already retired
    bool remove(uint32_t invoke_id);

    /// Fail and retire every entry, returns how many there were
    size_t fail_all(const Error& error);

    bool contains(uint32_t invoke_id) const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<uint32_t, std::promise<Reply>> pending_;
    uint32_t next_id_;
};

} // namespace ads
