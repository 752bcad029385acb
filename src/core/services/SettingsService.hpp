#pragma once

#include <QObject>
#include "ISettingsService.hpp"

namespace sigil {

class Resolver;

/// Concrete ISettingsService over a Resolver.
/// Does NOT own the Resolver (caller manages lifetime).
/// Errors from the resolver propagate unchanged.
class SettingsService : public QObject, public ISettingsService {
    Q_OBJECT
public:
    explicit SettingsService(Resolver* resolver, QObject* parent = nullptr);

    Q_INVOKABLE QVariant value(const QString& key) const override;
    Q_INVOKABLE bool setValue(const QString& key, const QVariant& value) override;
    bool setValue(const QString& key, const QVariant& value, const QString& scopeId) override;
    Q_INVOKABLE bool clearValue(const QString& key) override;
    Q_INVOKABLE QString secret(const QString& key) const override;
    void setSecret(const QString& key, const QString& value) override;

    /// Scope the key's effective value currently comes from.
    Q_INVOKABLE QString effectiveScope(const QString& key) const;

    /// Forget cached scope files, e.g. after another process wrote them.
    Q_INVOKABLE void reload();

signals:
    /// Emitted after a write that changed a file. value is invalid for a clear.
    void settingChanged(const QString& key, const QVariant& value, const QString& scopeId);

private:
    Resolver* resolver_;
};

} // namespace sigil
