#pragma once
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include <pagestream/error.hpp>

namespace pagestream
{
// Pulls up to n items from seq, fewer only if seq ends first.
template <typename Seq>
std::vector<typename Seq::item_type> take(Seq &seq, size_t n)
{
    std::vector<typename Seq::item_type> items;
    while (items.size() < n) {
        auto x = seq.Next();
        if (!x) { break; }
        items.push_back(std::move(*x));
    }
    return items;
}

// Drains seq, passing every chunk_size items to f as one batch; the last
// batch may be shorter. Returns the number of batches delivered.
template <typename Seq, typename F>
int64_t for_each_chunk(Seq &seq, size_t chunk_size, const F &f)
{
    if (chunk_size == 0) {
        throw InvalidConfiguration("chunk size must be positive");
    }
    int64_t chunks = 0;
    for (;;) {
        auto batch = take(seq, chunk_size);
        if (batch.empty()) { break; }
        const bool last = batch.size() < chunk_size;
        f(std::move(batch));
        ++chunks;
        if (last) { break; }
    }
    return chunks;
}
}  // namespace pagestream
