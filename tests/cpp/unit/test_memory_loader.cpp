#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "testing.hpp"

#include <pagestream/memory_loader.hpp>
#include <pagestream/paginated_sequence.hpp>

using ints = std::vector<int>;

TEST(pagestream_memory_loader_test, test_slices)
{
    pagestream::MemoryLoader<std::string, int> loader;
    loader.Put("nums", ints({1, 2, 3, 4, 5}));

    ASSERT_EQ(loader.Load("nums", 0, 2), ints({1, 2}));
    ASSERT_EQ(loader.Load("nums", 2, 2), ints({3, 4}));
    ASSERT_EQ(loader.Load("nums", 4, 2), ints({5}));
    ASSERT_EQ(loader.Load("nums", 5, 2), ints());
    ASSERT_EQ(loader.Load("nums", 100, 2), ints());
    ASSERT_EQ(loader.Calls(), 5);
}

TEST(pagestream_memory_loader_test, test_bad_requests)
{
    pagestream::MemoryLoader<std::string, int> loader;
    loader.Put("nums", ints({1}));

    ASSERT_THROW(loader.Load("other", 0, 1), std::invalid_argument);
    ASSERT_THROW(loader.Load("nums", -1, 1), std::invalid_argument);
    ASSERT_THROW(loader.Load("nums", 0, 0), std::invalid_argument);
}

TEST(pagestream_memory_loader_test, test_stream_whole_dataset)
{
    auto loader = std::make_shared<pagestream::MemoryLoader<std::string, int>>();
    ints data(103);
    for (int i = 0; i < 103; ++i) { data[i] = i * i; }
    loader->Put("squares", data);
    loader->Put("none", ints());

    for (const int page_size : {1, 7, 50, 103, 5000}) {
        pagestream::PaginatedSequence<std::string, int> seq("squares", loader,
                                                            page_size);
        ASSERT_EQ(drain(seq), data) << "page size: " << page_size;
        ASSERT_EQ(seq.PagesFetched(), (103 + page_size - 1) / page_size);
    }

    pagestream::PaginatedSequence<std::string, int> seq("none", loader, 10);
    ASSERT_EQ(drain(seq), ints());
    ASSERT_EQ(seq.PagesFetched(), 0);
}

TEST(pagestream_memory_loader_test, test_unknown_source_surfaces_on_pull)
{
    auto loader = std::make_shared<pagestream::MemoryLoader<std::string, int>>();
    pagestream::PaginatedSequence<std::string, int> seq("missing", loader, 4);
    ASSERT_EQ(loader->Calls(), 0);
    ASSERT_THROW(seq.Next(), std::invalid_argument);
    ASSERT_EQ(loader->Calls(), 1);
}
