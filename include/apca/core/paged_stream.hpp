#pragma once

#include "apca/core/logging.hpp"

#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace apca::core {

/**
 * A page is one response of a cursor-paginated endpoint. Page types expose
 *
 *     using item_type = ...;
 *     std::pair<std::vector<item_type>, std::optional<std::string>> split() &&;
 *
 * where the second member is the token of the next page, absent once the vendor
 * has no more data. An empty page that still carries a token is not the end.
 */
template <typename Page>
using PageFetcher = std::function<Page(const std::optional<std::string>&)>;

/**
 * Lazily walks a cursor-paginated resource one page at a time.
 *
 * The first fetch (with no token) is scheduled on construction. Each time the
 * buffered page runs dry, next() waits for the in-flight fetch, buffers its
 * items and schedules the fetch of the following page if the vendor returned a
 * token. There is never more than one fetch outstanding, and page k+1 is only
 * requested once page k's token is known.
 *
 * A fetch that throws rethrows from the next() call waiting on it. The instance
 * then never fetches again: already buffered items are still returned, after
 * which next() reports the end. Build a new stream to retry.
 *
 * Each fetch runs on its own detached thread that shares ownership of the
 * fetcher and of the slot its page lands in. Destroying a stream therefore
 * returns at once: an in-flight fetch finishes in the background and its page
 * is discarded.
 */
template <typename Page>
class PagedStream {
  public:
    using item_type = typename Page::item_type;
    using fetcher_type = PageFetcher<Page>;

    explicit PagedStream(fetcher_type fetcher)
        : fetcher_(std::make_shared<const fetcher_type>(std::move(fetcher))) {
        if (!*fetcher_) {
            throw std::invalid_argument("PagedStream requires a page fetcher");
        }
        schedule(std::nullopt);
    }

    PagedStream(PagedStream&&) noexcept = default;
    PagedStream& operator=(PagedStream&&) noexcept = default;
    PagedStream(const PagedStream&) = delete;
    PagedStream& operator=(const PagedStream&) = delete;

    /**
     * Returns the next item, blocking while the page that holds it is fetched.
     * std::nullopt marks the end of the sequence.
     */
    std::optional<item_type> next() {
        while (buffer_.empty()) {
            if (!pending_) {
                return std::nullopt;
            }
            // Taking the slot first means a throwing fetch is never retried.
            auto fetch = std::move(pending_);
            auto [items, token] = fetch->wait().split();
            buffer_.assign(std::make_move_iterator(items.begin()),
                           std::make_move_iterator(items.end()));
            if (token) {
                schedule(std::move(token));
            }
        }
        item_type item = std::move(buffer_.front());
        buffer_.pop_front();
        return item;
    }

    // Drains every remaining item.
    std::vector<item_type> collect() {
        std::vector<item_type> items;
        while (auto item = next()) {
            items.push_back(std::move(*item));
        }
        return items;
    }

    [[nodiscard]] bool exhausted() const noexcept { return buffer_.empty() && !pending_; }

  private:
    // Result slot of one fetch, owned jointly by the stream and the fetching thread.
    class Fetch {
      public:
        void complete(Page page) {
            {
                std::lock_guard lock(mutex_);
                page_.emplace(std::move(page));
            }
            cv_.notify_all();
        }

        void fail(std::exception_ptr error) {
            {
                std::lock_guard lock(mutex_);
                error_ = std::move(error);
            }
            cv_.notify_all();
        }

        Page wait() {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return page_.has_value() || error_ != nullptr; });
            if (error_) {
                std::rethrow_exception(error_);
            }
            return std::move(*page_);
        }

      private:
        std::mutex mutex_;
        std::condition_variable cv_;
        std::optional<Page> page_;
        std::exception_ptr error_;
    };

    void schedule(std::optional<std::string> token) {
        logger()->debug("scheduling page fetch{}{}", token ? " with token " : " without token",
                        token.value_or(std::string{}));
        auto fetch = std::make_shared<Fetch>();
        std::thread([fetcher = fetcher_, fetch, token = std::move(token)]() {
            try {
                fetch->complete((*fetcher)(token));
            } catch (...) {
                fetch->fail(std::current_exception());
            }
        }).detach();
        pending_ = std::move(fetch);
    }

    std::shared_ptr<const fetcher_type> fetcher_;
    std::deque<item_type> buffer_;
    std::shared_ptr<Fetch> pending_;
};

/**
 * Generic page for resources whose response is a flat list plus a token.
 */
template <typename Item>
struct Page {
    using item_type = Item;

    std::vector<Item> items;
    std::optional<std::string> next_page_token;

    std::pair<std::vector<Item>, std::optional<std::string>> split() && {
        return {std::move(items), std::move(next_page_token)};
    }
};

}  // namespace apca::core
