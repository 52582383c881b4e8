#include "error.hpp"

namespace impscan {

char NumericOverflowError::ID = 0;

void NumericOverflowError::log(llvm::raw_ostream &os) const {
  os << "integer literal '" << digits_ << "' is out of range";
}

std::error_code NumericOverflowError::convertToErrorCode() const {
  return std::make_error_code(std::errc::result_out_of_range);
}

} // namespace impscan
