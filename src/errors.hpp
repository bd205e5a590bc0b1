#pragma once

#include <string>

namespace tmx_cwb {

enum class ErrorCode {
    None,
    UnavailableLanguage,
    AmbiguousLanguagePair,
    CorpusNotFound,
    NoAlignmentData,
    StagingIOFailure,
    ExternalToolFailure,
    TmxReadFailure,
    TmxWriteFailure,
    InvalidArgument
};

struct Error {
    ErrorCode code = ErrorCode::None;
    std::string message;

    explicit operator bool() const { return code != ErrorCode::None; }
};

const char* error_code_name(ErrorCode code);

// Fills `error` and returns false so call sites can `return fail(...)`.
bool fail(Error& error, ErrorCode code, std::string message);

}  // namespace tmx_cwb
