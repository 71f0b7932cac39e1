#include "base/blob.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(chainrelay::base, BlobError, e) {
  using chainrelay::base::BlobError;
  switch (e) {
    case BlobError::INCORRECT_LENGTH:
      return "Byte string length does not match the expected size";
  }
  return "Unknown blob error";
}

namespace chainrelay::base {

  // addresses and 32-byte hashes
  template class Blob<20ul>;
  template class Blob<32ul>;

}  // namespace chainrelay::base
