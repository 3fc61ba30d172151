#pragma once
#include <string>
#include <utility>
#include <variant>

enum class ErrorKind { USAGE, DECODE, TRANSPORT, REMOTE_REJECTED, PROTOCOL_VIOLATION };

struct SignerError {
  ErrorKind kind = ErrorKind::PROTOCOL_VIOLATION;
  std::string context;  // phase that failed, e.g. "create_transaction"
  std::string message;
  std::string ToString() const;
};

const char* ErrorKindName(ErrorKind kind);
// Process exit status for a failed invocation.
int ExitCodeFor(ErrorKind kind);

inline SignerError MakeError(ErrorKind kind, std::string context, std::string message) {
  return SignerError{kind, std::move(context), std::move(message)};
}

// Value or error; every pipeline phase returns one of these instead of throwing.
template <typename T>
class Result {
public:
  Result(T value) : data_(std::move(value)) {}
  Result(SignerError error) : data_(std::move(error)) {}

  bool IsOk() const { return std::holds_alternative<T>(data_); }
  explicit operator bool() const { return IsOk(); }

  T& Value() { return std::get<T>(data_); }
  const T& Value() const { return std::get<T>(data_); }
  const SignerError& Error() const { return std::get<SignerError>(data_); }

  // Re-labels a failure with the phase it surfaced in, keeping kind and message.
  Result& WithContext(const std::string& context) {
    if (!IsOk()) std::get<SignerError>(data_).context = context;
    return *this;
  }

private:
  std::variant<T, SignerError> data_;
};
