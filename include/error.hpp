#pragma once

#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>

#include <string>
#include <system_error>
#include <utility>

namespace impscan {

// Raised by the lexer when a digit run does not fit in a 32-bit signed
// integer. The digits are already consumed when this is reported.
class NumericOverflowError : public llvm::ErrorInfo<NumericOverflowError> {
public:
  static char ID;

  NumericOverflowError(std::string digits, size_t offset, size_t line,
                       size_t column, size_t end_column)
      : digits_(std::move(digits)), offset_(offset), line_(line),
        column_(column), end_column_(end_column) {}

  void log(llvm::raw_ostream &os) const override;
  std::error_code convertToErrorCode() const override;

  const std::string &digits() const { return digits_; }
  size_t offset() const { return offset_; }
  size_t line() const { return line_; }
  size_t column() const { return column_; }
  size_t end_column() const { return end_column_; }

private:
  std::string digits_;
  size_t offset_;
  size_t line_;
  size_t column_;
  size_t end_column_;
};

// Host-side record of a bad token, ready to be rendered against the source.
struct Diagnostic {
  std::string message;
  size_t line;
  size_t column;
  size_t end_column; // For range highlighting

  Diagnostic(std::string msg, size_t l = 0, size_t c = 0, size_t end = 0)
      : message(std::move(msg)), line(l), column(c), end_column(end) {}
};

} // namespace impscan
