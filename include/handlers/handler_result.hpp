#ifndef ARCHIVER_HANDLERS_HANDLER_RESULT_HPP
#define ARCHIVER_HANDLERS_HANDLER_RESULT_HPP

#include <string>
#include <utility>
#include <variant>
#include "store/store_error.hpp"

namespace archiver {
namespace handlers {

struct HandlerError {
  store::ArchiveError kind;
  std::string message;
};

// Outcome of one request operation: a success payload or one error kind
template <typename T>
class Result {
public:
  static Result success(T value) {
    return Result(std::variant<T, HandlerError>(std::in_place_index<0>, std::move(value)));
  }

  static Result failure(store::ArchiveError kind, std::string message) {
    return Result(std::variant<T, HandlerError>(std::in_place_index<1>,
                                                HandlerError{kind, std::move(message)}));
  }

  static Result failure(HandlerError error) {
    return Result(std::variant<T, HandlerError>(std::in_place_index<1>, std::move(error)));
  }

  bool ok() const { return outcome_.index() == 0; }

  T& value() { return std::get<0>(outcome_); }
  const T& value() const { return std::get<0>(outcome_); }
  const HandlerError& error() const { return std::get<1>(outcome_); }

private:
  explicit Result(std::variant<T, HandlerError> outcome) : outcome_(std::move(outcome)) {}

  std::variant<T, HandlerError> outcome_;
};

} // namespace handlers
} // namespace archiver

#endif // ARCHIVER_HANDLERS_HANDLER_RESULT_HPP
