// Copyright (c) 2025 Dualscribe

#include "app/transcript_log.hpp"

#include <algorithm>

namespace app {

TranscriptLog::TranscriptLog(size_t capacity)
    : capacity_(std::max<size_t>(1, capacity)) {}

std::vector<Transcript> TranscriptLog::append(Transcript transcript) {
    const uint64_t id = transcript.id;
    slots_.push_back(Slot{std::move(transcript), true});
    index_[id] = base_seq_ + slots_.size() - 1;
    live_count_++;

    std::vector<Transcript> evicted;
    while (live_count_ > capacity_) {
        reclaim_front();
        Slot& oldest = slots_.front();
        index_.erase(oldest.transcript.id);
        evicted.push_back(std::move(oldest.transcript));
        slots_.pop_front();
        base_seq_++;
        live_count_--;
    }
    reclaim_front();
    return evicted;
}

bool TranscriptLog::remove(uint64_t id) {
    auto it = index_.find(id);
    if (it == index_.end()) return false;

    Slot& slot = slots_[static_cast<size_t>(it->second - base_seq_)];
    slot.live = false;
    index_.erase(it);
    live_count_--;
    reclaim_front();
    return true;
}

const Transcript* TranscriptLog::find(uint64_t id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return nullptr;
    return &slots_[static_cast<size_t>(it->second - base_seq_)].transcript;
}

std::vector<Transcript> TranscriptLog::recent(size_t n) const {
    std::vector<Transcript> out;
    out.reserve(std::min(n, live_count_));
    visit_newest_first([&](const Transcript& t) {
        if (out.size() >= n) return false;
        out.push_back(t);
        return true;
    });
    std::reverse(out.begin(), out.end());
    return out;
}

std::vector<Transcript> TranscriptLog::all() const {
    std::vector<Transcript> out;
    out.reserve(live_count_);
    for (const auto& slot : slots_) {
        if (slot.live) out.push_back(slot.transcript);
    }
    return out;
}

void TranscriptLog::clear() {
    slots_.clear();
    index_.clear();
    base_seq_ = 0;
    live_count_ = 0;
}

void TranscriptLog::reclaim_front() {
    while (!slots_.empty() && !slots_.front().live) {
        slots_.pop_front();
        base_seq_++;
    }
}

} // namespace app
