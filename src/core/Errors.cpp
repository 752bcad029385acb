#include "core/Errors.hpp"

namespace sigil {

const char* errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::NotFound:          return "NotFound";
    case ErrorKind::NotWritable:       return "NotWritable";
    case ErrorKind::UnsupportedFormat: return "UnsupportedFormat";
    case ErrorKind::CastError:         return "CastError";
    case ErrorKind::VaultLocked:       return "VaultLocked";
    case ErrorKind::CorruptFile:       return "CorruptFile";
    case ErrorKind::UnknownScope:      return "UnknownScope";
    case ErrorKind::InvalidPolicy:     return "InvalidPolicy";
    case ErrorKind::InvalidKey:        return "InvalidKey";
    case ErrorKind::LockedKey:         return "LockedKey";
    case ErrorKind::IoFailure:         return "IoFailure";
    }
    return "Unknown";
}

SigilError::SigilError(ErrorKind kind, const QString& message)
    : std::runtime_error(message.toStdString()), kind_(kind)
{
}

CastError::CastError(const QString& key, const QString& rawValue, const QString& reason)
    : SigilError(ErrorKind::CastError,
                 QStringLiteral("Cannot cast '%1' = '%2': %3").arg(key, rawValue, reason))
    , key_(key)
    , rawValue_(rawValue)
{
}

CorruptFileError::CorruptFileError(const QString& path, const QString& detail)
    : SigilError(ErrorKind::CorruptFile,
                 QStringLiteral("Failed to parse %1: %2").arg(path, detail))
    , path_(path)
{
}

} // namespace sigil
