#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace jobguard::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace jobguard::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e) || dynamic_cast<const CodecError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const TransactionConflict*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (dynamic_cast<const IntegrityError*>(&e)) {
    return {::grpc::StatusCode::DATA_LOSS, e.what()};
  }
  if (dynamic_cast<const StorageError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace jobguard::grpc
