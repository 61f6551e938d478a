#pragma once

#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace tkb {

// One merged part of a piece; offsets are relative to the piece start.
// id is -1 when a single byte has no token in the vocabulary.
struct BpePart {
    size_t start;
    size_t end;
    int32_t id;
};

/**
 * Byte-pair merge of one piece.
 *
 * Starts from single bytes and repeatedly merges the adjacent pair whose
 * concatenation has the lowest rank, leftmost first on equal ranks, until
 * no adjacent pair is a token. Uses a linked list of parts and a min-heap
 * with stale-entry skipping: O(n log n) time and O(n) memory for n bytes.
 *
 * Parts are appended to `out`.
 */
void bpe_merge(const Vocabulary& vocab, const uint8_t* piece, size_t len, std::vector<BpePart>& out);

} // namespace tkb
