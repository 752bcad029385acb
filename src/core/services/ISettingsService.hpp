#pragma once

#include <QString>
#include <QVariant>

namespace sigil {

class ISettingsService {
public:
    virtual ~ISettingsService() = default;

    /// Effective value for a dot-notation key (e.g., "db.port").
    /// Returns invalid QVariant if no scope holds the key.
    /// Thread-safe.
    virtual QVariant value(const QString& key) const = 0;

    /// Write to the current write scope. Returns false if nothing changed.
    virtual bool setValue(const QString& key, const QVariant& value) = 0;

    /// Write to an explicit scope.
    virtual bool setValue(const QString& key, const QVariant& value, const QString& scopeId) = 0;

    /// Remove the key from the current write scope, exposing lower scopes.
    virtual bool clearValue(const QString& key) = 0;

    /// Secret by bare key ("api_key"). Returns empty string if no provider has it.
    virtual QString secret(const QString& key) const = 0;

    virtual void setSecret(const QString& key, const QString& value) = 0;
};

} // namespace sigil
