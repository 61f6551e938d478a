#include "bpe.hpp"

#include <queue>

namespace tkb {

namespace {

constexpr size_t NONE = static_cast<size_t>(-1);

// A pair of adjacent parts as it looked when pushed. Parts are keyed by
// their start offset, which never changes while the part is alive.
struct Candidate {
    int32_t rank;
    size_t left;
    size_t left_end;
    size_t right_end;
};

// Lowest rank first, then leftmost
struct CandidateOrder {
    bool operator()(const Candidate& a, const Candidate& b) const {
        if (a.rank != b.rank) return a.rank > b.rank;
        return a.left > b.left;
    }
};

} // namespace

void bpe_merge(const Vocabulary& vocab, const uint8_t* piece, size_t len, std::vector<BpePart>& out) {
    if (len == 0) {
        return;
    }

    if (len == 1) {
        out.push_back({0, 1, vocab.byte_rank(piece[0])});
        return;
    }

    // Whole piece is a token
    if (auto whole = vocab.rank(piece, len)) {
        out.push_back({0, len, *whole});
        return;
    }

    std::vector<size_t> end(len);
    std::vector<size_t> prev(len);
    std::vector<char> alive(len, 1);
    for (size_t i = 0; i < len; ++i) {
        end[i] = i + 1;
        prev[i] = i == 0 ? NONE : i - 1;
    }

    std::priority_queue<Candidate, std::vector<Candidate>, CandidateOrder> heap;

    auto push_pair = [&](size_t left) {
        size_t right = end[left];
        if (right >= len) return;
        size_t right_end = end[right];
        if (auto r = vocab.rank(piece + left, right_end - left)) {
            heap.push({*r, left, right, right_end});
        }
    };

    for (size_t i = 0; i + 1 < len; ++i) {
        push_pair(i);
    }

    while (!heap.empty()) {
        Candidate c = heap.top();
        heap.pop();

        // Skip pairs that changed since they were pushed
        if (!alive[c.left] || end[c.left] != c.left_end) continue;
        if (c.left_end >= len || !alive[c.left_end] || end[c.left_end] != c.right_end) continue;

        end[c.left] = c.right_end;
        alive[c.left_end] = 0;
        if (c.right_end < len) {
            prev[c.right_end] = c.left;
        }

        if (prev[c.left] != NONE) {
            push_pair(prev[c.left]);
        }
        push_pair(c.left);
    }

    for (size_t i = 0; i < len; i = end[i]) {
        size_t part_len = end[i] - i;
        int32_t id;
        if (part_len == 1) {
            id = vocab.byte_rank(piece[i]);
        } else {
            id = *vocab.rank(piece + i, part_len);
        }
        out.push_back({i, end[i], id});
    }
}

} // namespace tkb
