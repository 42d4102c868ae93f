#pragma once

#include <cstdint>
#include <string>

namespace modbridge {

enum class ErrorCode : std::uint8_t {
    None = 0,
    CompileError,               // Malformed chunk or disallowed chunk mode
    InterfaceMismatch,          // Guest does not satisfy the host interface contract
    SetupTrap,                  // Guest faulted during instantiation or setup()
    InvocationTrap,             // Guest faulted during a system call
    GuestFailure,               // Guest returned an explicit failure value
    UnknownComponentType,
    SchemaMismatch,
    DuplicateIncompatibleType,
    ReloadError,                // Shadow instantiation failed, old instance kept
    OrderingError,              // Provisional entity referenced before its spawn
    UnknownEntity,
    UnknownModule,
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::CompileError: return "CompileError";
        case ErrorCode::InterfaceMismatch: return "InterfaceMismatch";
        case ErrorCode::SetupTrap: return "SetupTrap";
        case ErrorCode::InvocationTrap: return "InvocationTrap";
        case ErrorCode::GuestFailure: return "GuestFailure";
        case ErrorCode::UnknownComponentType: return "UnknownComponentType";
        case ErrorCode::SchemaMismatch: return "SchemaMismatch";
        case ErrorCode::DuplicateIncompatibleType: return "DuplicateIncompatibleType";
        case ErrorCode::ReloadError: return "ReloadError";
        case ErrorCode::OrderingError: return "OrderingError";
        case ErrorCode::UnknownEntity: return "UnknownEntity";
        case ErrorCode::UnknownModule: return "UnknownModule";
        default: return "unknown";
    }
}

// Outcome of an operation that can fail without producing a value.
struct Status {
    ErrorCode code{ErrorCode::None};
    std::string message;

    static Status success() { return {}; }
    static Status fail(ErrorCode c, std::string msg) { return {c, std::move(msg)}; }

    bool ok() const { return code == ErrorCode::None; }
    explicit operator bool() const { return ok(); }

    // "CompileError: <message>"
    std::string describe() const {
        if (ok()) return "ok";
        return std::string(error_code_name(code)) + ": " + message;
    }
};

} // namespace modbridge
