#pragma once

#include <utility>
#include <variant>

namespace RNodeClient {

/**
 * @brief Value-or-error return type used by every fallible operation.
 *
 * Holds either an okay value of type T or an error of type E. T and E may be
 * the same type (e.g., Result<std::string, std::string>).
 *
 * Example:
 *   Result<int, std::string> parse(const std::string& s);
 *   auto r = parse("42");
 *   if (r.isError()) { log(r.errorValue()); }
 */
template <typename T, typename E>
class Result {
public:
    using OkayType = T;
    using ErrorType = E;

    Result() : data_(std::in_place_index<0>) {}

    static Result okay(T value) { return Result(std::in_place_index<0>, std::move(value)); }

    static Result error(E err) { return Result(std::in_place_index<1>, std::move(err)); }

    bool isValue() const { return data_.index() == 0; }
    bool isError() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& errorValue() { return std::get<1>(data_); }
    const E& errorValue() const { return std::get<1>(data_); }

private:
    template <std::size_t Index, typename U>
    Result(std::in_place_index_t<Index> tag, U&& value) : data_(tag, std::forward<U>(value))
    {}

    std::variant<T, E> data_;
};

} // namespace RNodeClient
