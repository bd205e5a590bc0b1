#include "errors.hpp"

#include <utility>

namespace tmx_cwb {

const char* error_code_name(ErrorCode code) {
    switch (code) {
    case ErrorCode::None:
        return "None";
    case ErrorCode::UnavailableLanguage:
        return "UnavailableLanguage";
    case ErrorCode::AmbiguousLanguagePair:
        return "AmbiguousLanguagePair";
    case ErrorCode::CorpusNotFound:
        return "CorpusNotFound";
    case ErrorCode::NoAlignmentData:
        return "NoAlignmentData";
    case ErrorCode::StagingIOFailure:
        return "StagingIOFailure";
    case ErrorCode::ExternalToolFailure:
        return "ExternalToolFailure";
    case ErrorCode::TmxReadFailure:
        return "TmxReadFailure";
    case ErrorCode::TmxWriteFailure:
        return "TmxWriteFailure";
    case ErrorCode::InvalidArgument:
        return "InvalidArgument";
    }
    return "Unknown";
}

bool fail(Error& error, ErrorCode code, std::string message) {
    error.code = code;
    error.message = std::move(message);
    return false;
}

}  // namespace tmx_cwb
