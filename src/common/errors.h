#ifndef WAITINGROOM_ERRORS_H_
#define WAITINGROOM_ERRORS_H_

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include <grpcpp/grpcpp.h>

namespace WaitingRoom {

/**
 * Failure classes surfaced by the store adapters, the reconciler and the reset controller.
 * Each class maps to exactly one absl::StatusCode so callers can branch on the code alone.
 *
 *   StoreFailure        kUnavailable       read/write against a store failed
 *   DuplicateIssuance   kAlreadyExists     insert-if-absent on the issuance log hit an existing key
 *   IdentityMismatch    kInvalidArgument   reset requested with the wrong event id
 *   RebuildFailure      kInternal          a table delete/create/backup step failed
 *   RebuildTimeout      kDeadlineExceeded  a table never reached the awaited state
 *   ResetBusy           kAborted           a reset is already executing in this process
 *   ResetInProgress     kFailedPrecondition  an admission write arrived while the system is frozen
 */
absl::Status StoreFailure(absl::string_view operation, absl::string_view detail);
absl::Status DuplicateIssuance(absl::string_view detail);
absl::Status IdentityMismatch(absl::string_view detail);
absl::Status RebuildFailure(absl::string_view step, const absl::Status& cause);
absl::Status RebuildTimeout(absl::string_view detail);
absl::Status ResetBusy();
absl::Status ResetInProgress();

inline bool IsStoreFailure(const absl::Status& s) { return absl::IsUnavailable(s); }
inline bool IsDuplicateIssuance(const absl::Status& s) { return absl::IsAlreadyExists(s); }
inline bool IsIdentityMismatch(const absl::Status& s) { return absl::IsInvalidArgument(s); }
inline bool IsRebuildTimeout(const absl::Status& s) { return absl::IsDeadlineExceeded(s); }
inline bool IsResetInProgress(const absl::Status& s) { return absl::IsFailedPrecondition(s); }

/// Translates an abseil status to the gRPC status with the same code and message.
grpc::Status ToGrpcStatus(const absl::Status& status);

} // namespace WaitingRoom

#endif // WAITINGROOM_ERRORS_H_
