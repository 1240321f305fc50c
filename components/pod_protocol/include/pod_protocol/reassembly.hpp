#pragma once

#include "pod_protocol/fragment.hpp"
#include "pod_protocol/types.hpp"

#include <map>
#include <optional>

namespace pod_protocol {

/**
 * @brief Reassembles logical messages from a stream of fragments
 *
 * A first fragment starts a new message and clears the part buffer.
 * Continuations are only accepted after it and are kept ordered by their
 * sequence number, so they may arrive in any order. A message is only
 * emitted when every continuation 1..N-1 is present and all fragments pass
 * their checksum.
 */
class ReassemblyFeed {
public:
    enum class State {
        IDLE,
        ACCUMULATING
    };

    ReassemblyFeed() = default;

    /**
     * @brief Feed the next received fragment
     * @param fragment Fragment as received
     * @return The complete logical message, once its last fragment arrived
     */
    std::optional<Bytes> feed(const Fragment& fragment);

    /**
     * @brief Drop everything received so far
     */
    void reset();

    State state() const { return first_ ? State::ACCUMULATING : State::IDLE; }

    // Number of continuation fragments currently held
    size_t pendingParts() const { return parts_.size(); }

    // Counters for diagnostics
    uint64_t messagesCompleted() const { return messagesCompleted_; }
    uint64_t messagesDiscarded() const { return messagesDiscarded_; }

private:
    std::optional<Bytes> tryComplete();
    void discard(const char* reason);

    std::optional<Fragment> first_;
    std::map<uint16_t, Fragment> parts_;

    uint64_t messagesCompleted_ = 0;
    uint64_t messagesDiscarded_ = 0;
};

} // namespace pod_protocol
