#pragma once

#include "core/error.hpp"
#include <deque>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace sqltrace {

/**
 * @brief Producer behind a ResultStream
 *
 * next() returns std::nullopt once the sequence is exhausted. A source
 * may hold a statement cursor or a checked-out connection; destroying it
 * releases them.
 */
template<typename T>
class IStreamSource {
public:
    virtual ~IStreamSource() = default;

    [[nodiscard]] virtual std::optional<Result<T>> next() = 0;
};

/**
 * @brief Lazy, move-only sequence of results
 *
 * Items are produced one at a time on next(). The stream ends after the
 * source is exhausted or after the first error; the source is released
 * at that point. Dropping a stream early abandons the remaining items.
 *
 * A stream returned by a connection borrows that connection: the caller
 * keeps the connection alive while iterating.
 */
template<typename T>
class ResultStream {
public:
    ResultStream() = default;
    explicit ResultStream(std::unique_ptr<IStreamSource<T>> source)
        : source_(std::move(source)) {}

    ResultStream(ResultStream&&) noexcept = default;
    ResultStream& operator=(ResultStream&&) noexcept = default;
    ResultStream(const ResultStream&) = delete;
    ResultStream& operator=(const ResultStream&) = delete;

    [[nodiscard]] std::optional<Result<T>> next() {
        if (!source_) {
            return std::nullopt;
        }
        auto item = source_->next();
        if (!item || item->is_error()) {
            source_.reset();
        }
        return item;
    }

    /// True once the stream has ended (exhausted, failed or empty)
    [[nodiscard]] bool finished() const { return source_ == nullptr; }

    /// Drain the remaining items; stops at the first error
    [[nodiscard]] Result<std::vector<T>> collect() {
        std::vector<T> items;
        while (auto item = next()) {
            if (item->is_error()) {
                return Result<std::vector<T>>::error(item->error());
            }
            items.emplace_back(item->take_value());
        }
        return Result<std::vector<T>>::ok(std::move(items));
    }

    /// Hand the source to a decorator
    [[nodiscard]] std::unique_ptr<IStreamSource<T>> release() { return std::move(source_); }

private:
    std::unique_ptr<IStreamSource<T>> source_;
};

/**
 * @brief Source over already-materialized items
 */
template<typename T>
class BufferedSource : public IStreamSource<T> {
public:
    BufferedSource() = default;
    explicit BufferedSource(std::deque<Result<T>> items) : items_(std::move(items)) {}

    void push(Result<T> item) { items_.emplace_back(std::move(item)); }

    std::optional<Result<T>> next() override {
        if (items_.empty()) {
            return std::nullopt;
        }
        auto item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

private:
    std::deque<Result<T>> items_;
};

/// Stream that yields a single error and ends
template<typename T>
[[nodiscard]] ResultStream<T> error_stream(DbError err) {
    auto source = std::make_unique<BufferedSource<T>>();
    source->push(Result<T>::error(std::move(err)));
    return ResultStream<T>(std::move(source));
}

} // namespace sqltrace
