// AceProxy - AceStream Multiplexing Proxy
// Result type for error handling without exceptions

#ifndef ACEPROXY_CORE_RESULT_HPP
#define ACEPROXY_CORE_RESULT_HPP

#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace aceproxy {
namespace core {

/**
 * @brief Either a success value or an error.
 *
 * Every fallible operation in AceProxy returns a Result instead of throwing.
 * Accessing the wrong alternative throws std::logic_error, which is a
 * programming error rather than a runtime condition.
 *
 * @tparam T The success value type
 * @tparam E The error type
 */
template<typename T, typename E>
class Result {
public:
    static Result success(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result error(E err) {
        return Result(std::in_place_index<1>, std::move(err));
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return storage_.index() == 0;
    }

    [[nodiscard]] bool isError() const noexcept {
        return storage_.index() == 1;
    }

    [[nodiscard]] T& value() & {
        requireSuccess();
        return std::get<0>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        requireSuccess();
        return std::get<0>(storage_);
    }

    [[nodiscard]] T&& value() && {
        requireSuccess();
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E& error() & {
        requireError();
        return std::get<1>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        requireError();
        return std::get<1>(storage_);
    }

    /**
     * @brief Get the success value or a fallback when this is an error.
     */
    [[nodiscard]] T valueOr(T fallback) const& {
        return isSuccess() ? std::get<0>(storage_) : std::move(fallback);
    }

    [[nodiscard]] T valueOr(T fallback) && {
        return isSuccess() ? std::get<0>(std::move(storage_)) : std::move(fallback);
    }

private:
    template<std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v)
        : storage_(tag, std::forward<V>(v)) {}

    void requireSuccess() const {
        if (!isSuccess()) {
            throw std::logic_error("Attempted to access value on error result");
        }
    }

    void requireError() const {
        if (!isError()) {
            throw std::logic_error("Attempted to access error on success result");
        }
    }

    // Index-based so that T and E may be the same type.
    std::variant<T, E> storage_;
};

/**
 * @brief Result for operations that produce no value on success.
 */
template<typename E>
class Result<void, E> {
public:
    static Result success() {
        return Result();
    }

    static Result error(E err) {
        Result r;
        r.error_ = std::move(err);
        r.ok_ = false;
        return r;
    }

    [[nodiscard]] bool isSuccess() const noexcept { return ok_; }
    [[nodiscard]] bool isError() const noexcept { return !ok_; }

    [[nodiscard]] E& error() & {
        if (ok_) {
            throw std::logic_error("Attempted to access error on success result");
        }
        return error_;
    }

    [[nodiscard]] const E& error() const& {
        if (ok_) {
            throw std::logic_error("Attempted to access error on success result");
        }
        return error_;
    }

private:
    Result() : error_{}, ok_(true) {}

    E error_;
    bool ok_;
};

} // namespace core
} // namespace aceproxy

#endif // ACEPROXY_CORE_RESULT_HPP
