#pragma once
#include <cstdint>
#include <cstdio>
#include <deque>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <pagestream/error.hpp>
#include <pagestream/page_loader.hpp>
#include <pagestream/utils/logging.hpp>
#include <pagestream/utils/trace.hpp>

namespace pagestream
{
// PaginatedSequence turns a PageLoader into a lazy, forward-only stream of
// items. One page is buffered at a time; the loader is called only when a
// pull finds the buffer empty. Not safe for concurrent pulls.
template <typename Source, typename Item> class PaginatedSequence
{
  public:
    using loader_t  = PageLoader<Source, Item>;
    using item_type = Item;

    // single-pass input iterator, every increment is a pull
    class iterator_t
    {
        PaginatedSequence *seq_;
        std::optional<Item> cur_;

      public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = Item;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const Item *;
        using reference         = const Item &;

        iterator_t() : seq_(nullptr) {}

        explicit iterator_t(PaginatedSequence *seq) : seq_(seq)
        {
            cur_ = seq_->Next();
        }

        bool operator==(const iterator_t &it) const
        {
            return cur_.has_value() == it.cur_.has_value() &&
                   (!cur_.has_value() || seq_ == it.seq_);
        }

        bool operator!=(const iterator_t &it) const { return !(*this == it); }

        const Item &operator*() const { return *cur_; }

        const Item *operator->() const { return &*cur_; }

        iterator_t &operator++()
        {
            cur_ = seq_->Next();
            return *this;
        }
    };

  private:
    const Source source_;
    const std::shared_ptr<loader_t> loader_;
    const int64_t page_size_;

    std::deque<Item> buffer_;
    int64_t offset_;
    bool exhausted_;

    int64_t pages_fetched_;
    int64_t items_emitted_;

    static int64_t checked_page_size(int64_t page_size)
    {
        if (page_size <= 0) {
            throw InvalidConfiguration("page size must be positive, got " +
                                       std::to_string(page_size));
        }
        return page_size;
    }

    static std::shared_ptr<loader_t>
    checked_loader(std::shared_ptr<loader_t> loader)
    {
        if (!loader) { throw InvalidConfiguration("page loader is null"); }
        return loader;
    }

    // returns false once the loader has no more items; a loader failure
    // ends the sequence and is rethrown unchanged
    bool fetch()
    {
        TRACE_SCOPE("PaginatedSequence::fetch");
        std::vector<Item> page;
        try {
            page = loader_->Load(source_, offset_, page_size_);
        } catch (...) {
            exhausted_ = true;
            throw;
        }
        if (page.empty()) {
            log_fmt("exhausted at offset=%lld after %lld page(s)",
                    static_cast<long long>(offset_),
                    static_cast<long long>(pages_fetched_));
            exhausted_ = true;
            return false;
        }
        log_fmt("fetched %zu item(s) at offset=%lld limit=%lld", page.size(),
                static_cast<long long>(offset_),
                static_cast<long long>(page_size_));
        buffer_.assign(std::make_move_iterator(page.begin()),
                       std::make_move_iterator(page.end()));
        offset_ += page_size_;
        ++pages_fetched_;
        return true;
    }

  public:
    PaginatedSequence(Source source, std::shared_ptr<loader_t> loader,
                      int64_t page_size)
        : source_(std::move(source)),
          loader_(checked_loader(std::move(loader))),
          page_size_(checked_page_size(page_size)),
          offset_(0),
          exhausted_(false),
          pages_fetched_(0),
          items_emitted_(0)
    {
    }

    PaginatedSequence(const PaginatedSequence &) = delete;
    PaginatedSequence &operator=(const PaginatedSequence &) = delete;

    // Pull the next item; std::nullopt marks the end of the sequence.
    // Exceptions thrown by the loader pass through, leave offset as it was
    // before the pull and end the sequence.
    std::optional<Item> Next()
    {
        if (exhausted_) { return std::nullopt; }
        if (buffer_.empty() && !fetch()) { return std::nullopt; }
        Item x = std::move(buffer_.front());
        buffer_.pop_front();
        ++items_emitted_;
        return x;
    }

    // pulls the first item, so calling begin() twice skips one
    iterator_t begin() { return iterator_t(this); }

    iterator_t end() { return iterator_t(); }

    const Source &Descriptor() const { return source_; }

    int64_t Offset() const { return offset_; }

    int64_t PageSize() const { return page_size_; }

    bool Exhausted() const { return exhausted_; }

    int64_t Buffered() const { return static_cast<int64_t>(buffer_.size()); }

    int64_t PagesFetched() const { return pages_fetched_; }

    int64_t ItemsEmitted() const { return items_emitted_; }

    void LogStats() const
    {
        char line[256];
        std::snprintf(line, sizeof(line),
                      "pages fetched: %lld, items emitted: %lld, offset: "
                      "%lld, page size: %lld%s",
                      static_cast<long long>(pages_fetched_),
                      static_cast<long long>(items_emitted_),
                      static_cast<long long>(offset_),
                      static_cast<long long>(page_size_),
                      exhausted_ ? ", exhausted" : "");
        write_log(line);
    }
};

template <typename Source, typename Item>
std::unique_ptr<PaginatedSequence<Source, Item>>
make_paginated_sequence(Source source,
                        std::shared_ptr<PageLoader<Source, Item>> loader,
                        int64_t page_size)
{
    return std::make_unique<PaginatedSequence<Source, Item>>(
        std::move(source), std::move(loader), page_size);
}

template <typename Source, typename Item>
std::unique_ptr<PaginatedSequence<Source, Item>>
make_paginated_sequence(Source source, LoadFunc<Source, Item> load,
                        int64_t page_size)
{
    return make_paginated_sequence<Source, Item>(
        std::move(source),
        std::make_shared<FunctionLoader<Source, Item>>(std::move(load)),
        page_size);
}
}  // namespace pagestream
