#include "core/error.hpp"

namespace droidpack {

const char *errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::UnsupportedAbi:
        return "UnsupportedAbi";
    case ErrorKind::InvalidInstallation:
        return "InvalidInstallation";
    case ErrorKind::ApiLevelOutOfRange:
        return "ApiLevelOutOfRange";
    case ErrorKind::ToolMissing:
        return "ToolMissing";
    case ErrorKind::InvalidManifest:
        return "InvalidManifest";
    case ErrorKind::DuplicateComponent:
        return "DuplicateComponent";
    case ErrorKind::DuplicateLibrary:
        return "DuplicateLibrary";
    case ErrorKind::ProcessFailed:
        return "ProcessFailed";
    case ErrorKind::SigningError:
        return "SigningError";
    case ErrorKind::IoError:
        return "IoError";
    case ErrorKind::ConfigError:
        return "ConfigError";
    }
    return "Unknown";
}

} // namespace droidpack
