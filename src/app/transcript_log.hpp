// Copyright (c) 2025 Dualscribe
// Bounded, append-ordered store of final transcripts.
//
// Slots live in a deque addressed by sequence number; an id -> sequence map
// gives O(1) lookup and removal. Removed entries leave a dead slot behind
// that is reclaimed once it reaches the front. Eviction is FIFO over live
// entries.

#pragma once
#include "app/transcript_types.hpp"

#include <cstdint>
#include <deque>
#include <unordered_map>
#include <vector>

namespace app {

class TranscriptLog {
public:
    explicit TranscriptLog(size_t capacity);

    /// Appends and evicts the oldest live entries beyond capacity.
    /// @return the evicted transcripts, oldest first
    std::vector<Transcript> append(Transcript transcript);

    /// @return false if no live entry has this id
    bool remove(uint64_t id);

    const Transcript* find(uint64_t id) const;

    /// Visits live entries newest first until `visit` returns false.
    template <typename Visitor>
    void visit_newest_first(Visitor&& visit) const {
        for (auto it = slots_.rbegin(); it != slots_.rend(); ++it) {
            if (!it->live) continue;
            if (!visit(it->transcript)) return;
        }
    }

    std::vector<Transcript> recent(size_t n) const;
    std::vector<Transcript> all() const;

    size_t size() const { return live_count_; }
    bool empty() const { return live_count_ == 0; }
    size_t capacity() const { return capacity_; }

    void clear();

private:
    struct Slot {
        Transcript transcript;
        bool live = true;
    };

    void reclaim_front();

    std::deque<Slot> slots_;
    uint64_t base_seq_ = 0;                          // sequence number of slots_.front()
    std::unordered_map<uint64_t, uint64_t> index_;   // id -> sequence
    size_t live_count_ = 0;
    size_t capacity_;
};

} // namespace app
