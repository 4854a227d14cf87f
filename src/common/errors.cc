#include "errors.h"

#include "absl/strings/str_cat.h"

namespace WaitingRoom {

absl::Status StoreFailure(absl::string_view operation, absl::string_view detail) {
	return absl::UnavailableError(absl::StrCat("store failure during ", operation, ": ", detail));
}

absl::Status DuplicateIssuance(absl::string_view detail) {
	return absl::AlreadyExistsError(absl::StrCat("serving counter issuance already recorded: ", detail));
}

absl::Status IdentityMismatch(absl::string_view detail) {
	return absl::InvalidArgumentError(absl::StrCat("Invalid event ID: ", detail));
}

absl::Status RebuildFailure(absl::string_view step, const absl::Status& cause) {
	// A timeout keeps its own code so operators can tell a slow store from a broken one
	if (absl::IsDeadlineExceeded(cause)) {
		return absl::DeadlineExceededError(absl::StrCat(step, ": ", cause.message()));
	}
	return absl::InternalError(absl::StrCat(step, ": ", cause.ToString()));
}

absl::Status RebuildTimeout(absl::string_view detail) {
	return absl::DeadlineExceededError(detail);
}

absl::Status ResetBusy() {
	return absl::AbortedError("a reset is already executing");
}

absl::Status ResetInProgress() {
	return absl::FailedPreconditionError("reset in progress");
}

grpc::Status ToGrpcStatus(const absl::Status& status) {
	if (status.ok()) {
		return grpc::Status::OK;
	}
	// absl and gRPC share the canonical code numbering
	return grpc::Status(static_cast<grpc::StatusCode>(status.code()),
			std::string(status.message()));
}

} // namespace WaitingRoom
