#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include <grpcpp/grpcpp.h>

namespace locamat {

using IdList = std::vector<int64_t>;

/**
 * Base exception for all rental engine errors.
 */
class RentalError : public std::runtime_error {
public:
    explicit RentalError(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * Returns true if caller input violated a precondition.
     */
    virtual bool is_validation_error() const { return false; }

    /**
     * Returns true if a referenced client, unit or line does not exist.
     */
    virtual bool is_not_found() const { return false; }

    /**
     * Returns true if a referenced resource is in the wrong state.
     */
    virtual bool is_conflict() const { return false; }

    /**
     * Returns true if a pure computation received a malformed argument.
     */
    virtual bool is_invalid_argument() const { return false; }

    /**
     * Returns true if the store failed for reasons unrelated to the request.
     */
    virtual bool is_storage_error() const { return false; }

    /**
     * Identifiers of the resources the error is about, if any.
     */
    virtual const IdList& ids() const {
        static const IdList kNone;
        return kNone;
    }

    virtual grpc::Status to_grpc_status() const {
        return grpc::Status(grpc::StatusCode::UNKNOWN, what());
    }
};

/**
 * Thrown when caller-supplied input violates a precondition.
 * Always raised before any row lock is taken.
 */
class ValidationError : public RentalError {
public:
    explicit ValidationError(const std::string& message)
        : RentalError(message) {}

    bool is_validation_error() const override { return true; }

    grpc::Status to_grpc_status() const override {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, what());
    }
};

/**
 * Thrown when a referenced client, equipment unit or contract line is absent.
 */
class NotFoundError : public RentalError {
public:
    NotFoundError(const std::string& resource, IdList missing_ids);

    const std::string& resource() const { return resource_; }
    const IdList& ids() const override { return missing_ids_; }

    bool is_not_found() const override { return true; }

    grpc::Status to_grpc_status() const override {
        return grpc::Status(grpc::StatusCode::NOT_FOUND, what());
    }

private:
    std::string resource_;
    IdList missing_ids_;
};

/**
 * Thrown when resources exist but cannot take part in the operation:
 * equipment not available, line already returned, row lock timed out.
 */
class ConflictError : public RentalError {
public:
    ConflictError(const std::string& reason, IdList conflicting_ids);

    static ConflictError lock_timeout(IdList ids) {
        return ConflictError(kLockTimeout, std::move(ids));
    }

    const std::string& reason() const { return reason_; }
    const IdList& ids() const override { return conflicting_ids_; }

    bool is_conflict() const override { return true; }
    bool is_lock_timeout() const { return reason_ == kLockTimeout; }

    grpc::Status to_grpc_status() const override {
        // ABORTED tells gRPC clients the call is safe to retry.
        return grpc::Status(is_lock_timeout() ? grpc::StatusCode::ABORTED
                                              : grpc::StatusCode::FAILED_PRECONDITION,
                            what());
    }

    static constexpr const char* kLockTimeout = "lock timeout";

private:
    std::string reason_;
    IdList conflicting_ids_;
};

/**
 * Thrown when a pure function receives an argument outside its domain.
 */
class InvalidArgumentError : public RentalError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : RentalError(message) {}

    bool is_invalid_argument() const override { return true; }

    grpc::Status to_grpc_status() const override {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, what());
    }
};

/**
 * Thrown for infrastructure failures: constraint violations, misuse of a
 * finished unit of work, inconsistent stored state.
 */
class StorageError : public RentalError {
public:
    explicit StorageError(const std::string& message)
        : RentalError(message) {}

    bool is_storage_error() const override { return true; }

    grpc::Status to_grpc_status() const override {
        return grpc::Status(grpc::StatusCode::INTERNAL, what());
    }
};

} // namespace locamat
