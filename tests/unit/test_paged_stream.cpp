#include "apca/core/paged_stream.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace apca::core;

namespace {

using StringPage = Page<std::string>;

struct ScriptedPage {
    std::vector<std::string> items;
    std::optional<std::string> token;
};

// Replays a fixed list of pages and records the token of every call.
class ScriptedFetcher {
  public:
    explicit ScriptedFetcher(std::vector<ScriptedPage> pages) : pages_(std::move(pages)) {}

    StringPage operator()(const std::optional<std::string>& token) {
        std::lock_guard lock(mutex_);
        const auto index = tokens_.size();
        tokens_.push_back(token);
        if (index >= pages_.size()) {
            throw std::runtime_error("fetched past the last page");
        }
        return StringPage{pages_[index].items, pages_[index].token};
    }

    std::vector<std::optional<std::string>> tokens() const {
        std::lock_guard lock(mutex_);
        return tokens_;
    }

  private:
    mutable std::mutex mutex_;
    std::vector<ScriptedPage> pages_;
    std::vector<std::optional<std::string>> tokens_;
};

// Page whose consumption by the engine is observable.
struct CountingPage {
    using item_type = int;

    std::vector<int> items;
    std::optional<std::string> next_page_token;
    std::atomic<int>* consumed{nullptr};

    std::pair<std::vector<int>, std::optional<std::string>> split() && {
        consumed->fetch_add(1);
        return {std::move(items), std::move(next_page_token)};
    }
};

void end_to_end() {
    auto fetcher = std::make_shared<ScriptedFetcher>(std::vector<ScriptedPage>{
        {{"a", "b"}, "t1"},
        {{"c"}, "t2"},
        {{}, std::nullopt},
    });
    PagedStream<StringPage> stream(
        [fetcher](const std::optional<std::string>& token) { return (*fetcher)(token); });

    const auto items = stream.collect();
    assert((items == std::vector<std::string>{"a", "b", "c"}));
    assert(!stream.next().has_value());
    assert(stream.exhausted());

    const auto tokens = fetcher->tokens();
    assert(tokens.size() == 3);
    assert(!tokens[0].has_value());
    assert(tokens[1] == "t1");
    assert(tokens[2] == "t2");
}

void yields_every_item_in_order() {
    std::vector<ScriptedPage> pages;
    std::vector<std::string> expected;
    for (int page = 0; page < 5; ++page) {
        ScriptedPage scripted;
        for (int item = 0; item < 3; ++item) {
            auto value = std::to_string(page) + "-" + std::to_string(item);
            scripted.items.push_back(value);
            expected.push_back(value);
        }
        if (page < 4) {
            scripted.token = "p" + std::to_string(page + 1);
        }
        pages.push_back(std::move(scripted));
    }
    auto fetcher = std::make_shared<ScriptedFetcher>(std::move(pages));
    PagedStream<StringPage> stream(
        [fetcher](const std::optional<std::string>& token) { return (*fetcher)(token); });

    std::vector<std::string> seen;
    while (auto item = stream.next()) {
        seen.push_back(*item);
    }
    assert(seen == expected);
    assert(fetcher->tokens().size() == 5);
}

void never_fetches_ahead_of_consumption() {
    std::atomic<int> consumed{0};
    std::atomic<int> calls{0};
    std::atomic<bool> overlapped{false};

    PagedStream<CountingPage> stream([&](const std::optional<std::string>& token) {
        const int call = calls.fetch_add(1);
        // Every earlier page must have been handed to the engine already.
        if (consumed.load() != call) {
            overlapped = true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        CountingPage page;
        page.items = {call * 10, call * 10 + 1};
        page.next_page_token =
            call < 4 ? std::optional<std::string>("n" + std::to_string(call + 1)) : std::nullopt;
        page.consumed = &consumed;
        (void)token;
        return page;
    });

    int count = 0;
    while (auto item = stream.next()) {
        ++count;
        // Give a premature fetch time to happen.
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    assert(count == 10);
    assert(calls.load() == 5);
    assert(!overlapped.load());
}

void empty_page_with_token_continues() {
    auto fetcher = std::make_shared<ScriptedFetcher>(std::vector<ScriptedPage>{
        {{}, "t1"},
        {{}, "t2"},
        {{"x"}, std::nullopt},
    });
    PagedStream<StringPage> stream(
        [fetcher](const std::optional<std::string>& token) { return (*fetcher)(token); });

    auto first = stream.next();
    assert(first.has_value() && *first == "x");
    assert(!stream.next().has_value());
    assert(fetcher->tokens().size() == 3);
}

void failure_is_terminal() {
    std::atomic<int> calls{0};
    PagedStream<StringPage> stream([&](const std::optional<std::string>& token) {
        const int call = calls.fetch_add(1);
        if (call == 1) {
            assert(token == "t1");
            throw std::runtime_error("page 2 unavailable");
        }
        return StringPage{{"a", "b"}, std::string("t1")};
    });

    assert(stream.next() == "a");
    assert(stream.next() == "b");

    int errors = 0;
    try {
        (void)stream.next();
    } catch (const std::runtime_error& error) {
        assert(std::string(error.what()) == "page 2 unavailable");
        ++errors;
    }
    assert(errors == 1);

    assert(!stream.next().has_value());
    assert(!stream.next().has_value());
    assert(stream.exhausted());
    assert(calls.load() == 2);
}

void dropping_a_stream_does_not_wait_for_its_fetch() {
    // Shared with the fetch, which outlives the stream.
    auto finished = std::make_shared<std::atomic<bool>>(false);
    const auto started = std::chrono::steady_clock::now();
    {
        PagedStream<StringPage> stream([finished](const std::optional<std::string>& token) {
            if (!token) {
                return StringPage{{"first"}, std::string("t1")};
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
            *finished = true;
            return StringPage{{"late"}, std::nullopt};
        });
        assert(stream.next() == "first");
    }
    const auto elapsed = std::chrono::steady_clock::now() - started;
    assert(elapsed < std::chrono::milliseconds(250));
    assert(!finished->load());

    // The orphaned fetch still runs to completion.
    while (!finished->load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void moved_stream_keeps_going() {
    auto fetcher = std::make_shared<ScriptedFetcher>(std::vector<ScriptedPage>{
        {{"a"}, "t1"},
        {{"b"}, std::nullopt},
    });
    PagedStream<StringPage> original(
        [fetcher](const std::optional<std::string>& token) { return (*fetcher)(token); });
    assert(original.next() == "a");

    PagedStream<StringPage> moved(std::move(original));
    assert(moved.next() == "b");
    assert(!moved.next().has_value());
}

}  // namespace

int main() {
    end_to_end();
    yields_every_item_in_order();
    never_fetches_ahead_of_consumption();
    empty_page_with_token_continues();
    failure_is_terminal();
    dropping_a_stream_does_not_wait_for_its_fetch();
    moved_stream_keeps_going();

    bool threw = false;
    try {
        PagedStream<StringPage> invalid{PageFetcher<StringPage>{}};
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "Paged stream tests passed\n";
    return 0;
}
