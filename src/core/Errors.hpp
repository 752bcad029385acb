#pragma once

#include <QString>
#include <stdexcept>

namespace sigil {

enum class ErrorKind {
    NotFound,
    NotWritable,
    UnsupportedFormat,
    CastError,
    VaultLocked,
    CorruptFile,
    UnknownScope,
    InvalidPolicy,
    InvalidKey,
    LockedKey,
    IoFailure
};

const char* errorKindName(ErrorKind kind);

/// Base of every failure the resolver, backends and secret chain report.
/// Callers either catch the concrete subclass or switch on kind().
class SigilError : public std::runtime_error {
public:
    SigilError(ErrorKind kind, const QString& message);

    ErrorKind kind() const { return kind_; }
    QString message() const { return QString::fromStdString(what()); }

private:
    ErrorKind kind_;
};

class NotFoundError : public SigilError {
public:
    explicit NotFoundError(const QString& message)
        : SigilError(ErrorKind::NotFound, message) {}
};

class NotWritableError : public SigilError {
public:
    explicit NotWritableError(const QString& message)
        : SigilError(ErrorKind::NotWritable, message) {}
};

class UnsupportedFormatError : public SigilError {
public:
    explicit UnsupportedFormatError(const QString& message)
        : SigilError(ErrorKind::UnsupportedFormat, message) {}
};

/// Explicit cast rejected a stored value. Carries the offending key and raw text.
class CastError : public SigilError {
public:
    CastError(const QString& key, const QString& rawValue, const QString& reason);

    const QString& key() const { return key_; }
    const QString& rawValue() const { return rawValue_; }

private:
    QString key_;
    QString rawValue_;
};

class VaultLockedError : public SigilError {
public:
    explicit VaultLockedError(const QString& message)
        : SigilError(ErrorKind::VaultLocked, message) {}
};

class CorruptFileError : public SigilError {
public:
    CorruptFileError(const QString& path, const QString& detail);

    const QString& path() const { return path_; }

private:
    QString path_;
};

class UnknownScopeError : public SigilError {
public:
    explicit UnknownScopeError(const QString& scopeId)
        : SigilError(ErrorKind::UnknownScope, QStringLiteral("Unknown scope '%1'").arg(scopeId)) {}
};

class InvalidPolicyError : public SigilError {
public:
    explicit InvalidPolicyError(const QString& message)
        : SigilError(ErrorKind::InvalidPolicy, message) {}
};

class InvalidKeyError : public SigilError {
public:
    explicit InvalidKeyError(const QString& key)
        : SigilError(ErrorKind::InvalidKey, QStringLiteral("Malformed key '%1'").arg(key)) {}
};

/// User-level write to a key the provider's metadata marks as locked.
class LockedKeyError : public SigilError {
public:
    explicit LockedKeyError(const QString& key)
        : SigilError(ErrorKind::LockedKey, QStringLiteral("'%1' is project-controlled and locked").arg(key)) {}
};

class IoFailureError : public SigilError {
public:
    explicit IoFailureError(const QString& message)
        : SigilError(ErrorKind::IoFailure, message) {}
};

} // namespace sigil
