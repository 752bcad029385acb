#pragma once

#include <QString>

namespace sigil {

/// PEP 503 style normalization: trim, lowercase, runs of '-', '_' and '.'
/// collapse to a single '-'. "My_App.Core" -> "my-app-core".
QString normalizeProviderId(const QString& raw);

/// True when raw normalizes to a non-empty id made of [a-z0-9] groups.
bool isValidProviderId(const QString& raw);

/// Provider id as it appears in environment variable names:
/// uppercase with '-' and '.' mapped to '_'. "my-app" -> "MY_APP".
QString providerEnvToken(const QString& providerId);

} // namespace sigil
