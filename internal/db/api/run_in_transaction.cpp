#include "run_in_transaction.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace dispatch::db {

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::SerializationFailure:
      return "serialization failure";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "unknown";
}

void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = context + ": " + ToString(result.code) + (result.message.empty() ? "" : " (" + result.message + ")");
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
    case ErrorCode::ConstraintViolation:
      throw util::AlreadyExists(message);
    case ErrorCode::Conflict:
    case ErrorCode::SerializationFailure:
    case ErrorCode::Busy:
      throw util::Conflict(message);
    default:
      throw std::runtime_error(message);
  }
}

void RunInTransaction(Repository& repo, const std::function<void(Transaction&)>& fn, int max_attempts) {
  for (int attempt = 1;; ++attempt) {
    auto tx = repo.Begin();
    try {
      fn(*tx);
      tx->Commit();
      return;
    } catch (const util::Conflict& e) {
      if (attempt >= max_attempts) {
        throw;
      }
      DISPATCH_LOG_WARN("Retrying transaction after conflict",
                        {observability::IntField("attempt", attempt), observability::ErrorField(e.what())});
    }
  }
}

} // namespace dispatch::db
