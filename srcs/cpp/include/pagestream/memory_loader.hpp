#pragma once
#include <algorithm>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <pagestream/page_loader.hpp>

namespace pagestream
{
// MemoryLoader serves pages out of datasets registered with Put.
template <typename Source, typename Item>
class MemoryLoader : public PageLoader<Source, Item>
{
    std::map<Source, std::vector<Item>> datasets_;
    int64_t calls_;

  public:
    MemoryLoader() : calls_(0) {}

    void Put(Source source, std::vector<Item> items)
    {
        datasets_[std::move(source)] = std::move(items);
    }

    int64_t Calls() const { return calls_; }

    std::vector<Item> Load(const Source &source, int64_t offset,
                           int64_t limit) override
    {
        ++calls_;
        const auto it = datasets_.find(source);
        if (it == datasets_.end()) {
            throw std::invalid_argument("unknown source");
        }
        if (offset < 0 || limit <= 0) {
            throw std::invalid_argument("invalid page: offset=" +
                                        std::to_string(offset) +
                                        ", limit=" + std::to_string(limit));
        }
        const auto &items = it->second;
        const int64_t n   = static_cast<int64_t>(items.size());
        if (offset >= n) { return {}; }
        const int64_t end = offset + std::min(limit, n - offset);
        return std::vector<Item>(items.begin() + offset, items.begin() + end);
    }
};
}  // namespace pagestream
