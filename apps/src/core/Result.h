#pragma once

#include <utility>
#include <variant>

namespace Biomorph {

/**
 * Value-or-error return type for recoverable failures.
 *
 * Usage:
 *   Result<Config, std::string> r = ConfigLoader::load<Config>("biomorph.json");
 *   if (r.isError()) { ... r.errorValue() ... }
 */
template <typename T, typename E>
class Result {
public:
    static Result okay(T value)
    {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result error(E error)
    {
        return Result(std::in_place_index<1>, std::move(error));
    }

    bool isValue() const { return storage_.index() == 0; }
    bool isError() const { return storage_.index() == 1; }

    T& value() { return std::get<0>(storage_); }
    const T& value() const { return std::get<0>(storage_); }

    E& errorValue() { return std::get<1>(storage_); }
    const E& errorValue() const { return std::get<1>(storage_); }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> index, U&& payload) : storage_(index, std::forward<U>(payload))
    {}

    std::variant<T, E> storage_;
};

} // namespace Biomorph
