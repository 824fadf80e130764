#pragma once
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace pagestream
{
// A PageLoader fetches one page of items from a backing store.
//
// Load(source, offset, limit) must return an empty vector if and only if
// there is no more data at or beyond offset, and otherwise up to limit items
// in the order they are to be emitted. Callers advance offset by a whole
// limit after every non-empty page, even a short one, so offset is a page
// stride and not a count of items already seen.
template <typename Source, typename Item> class PageLoader
{
  public:
    using source_type = Source;
    using item_type   = Item;

    virtual ~PageLoader() = default;

    virtual std::vector<Item> Load(const Source &source, int64_t offset,
                                   int64_t limit) = 0;
};

template <typename Source, typename Item>
using LoadFunc =
    std::function<std::vector<Item>(const Source &, int64_t, int64_t)>;

template <typename Source, typename Item>
class FunctionLoader : public PageLoader<Source, Item>
{
    LoadFunc<Source, Item> load_;

  public:
    explicit FunctionLoader(LoadFunc<Source, Item> load)
        : load_(std::move(load))
    {
    }

    std::vector<Item> Load(const Source &source, int64_t offset,
                           int64_t limit) override
    {
        return load_(source, offset, limit);
    }
};
}  // namespace pagestream
