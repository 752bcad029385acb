#pragma once

#include "ISecretProvider.hpp"

namespace sigil {

/// Read-only secrets from SIGIL_SECRET_<PROVIDER>_<KEY> variables, for CI.
/// Reads the live environment on every call.
class EnvSecretProvider : public ISecretProvider {
public:
    explicit EnvSecretProvider(const QString& providerId);

    QString name() const override { return QStringLiteral("env"); }
    bool isAvailable() const override { return true; }
    bool supportsWrite() const override { return false; }

    SecretLookup get(const QString& key) override;
    void set(const QString& key, const QString& value) override;
    bool remove(const QString& key) override;

    QString variableFor(const QString& key) const;

private:
    QString providerId_;
};

} // namespace sigil
