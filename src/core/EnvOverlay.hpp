#pragma once

#include "core/Mapping.hpp"
#include <QProcessEnvironment>
#include <functional>

namespace sigil {

/// Produces the overlay mapping for a provider. Swappable at resolver
/// construction for a different naming convention.
using EnvReader = std::function<Mapping(const QString& providerId)>;

/// SIGIL_<PROVIDER>_<KEY> variables of the live process environment as
/// dotted keys. The first '_' after the provider prefix separates section and
/// leaf: SIGIL_DEMO_UI_COLOR -> ui.color, SIGIL_DEMO_DB_MAX_CONN -> db.max_conn.
///
/// A single '_' cannot say whether it is a level separator or part of a
/// name, so that form only reaches keys of one or two levels: a.b.c cannot
/// be written with single underscores (SIGIL_DEMO_A_B_C reads as a.b_c).
/// For deeper keys spell every separator as "__": SIGIL_DEMO_A__B__C ->
/// a.b.c, SIGIL_DEMO_NET__HTTP__MAX_CONN -> net.http.max_conn. A name that
/// contains "__" is split only there.
Mapping readEnv(const QString& providerId);

Mapping readEnv(const QString& providerId, const QProcessEnvironment& env);

/// Variable name for key under prefix: ("SIGIL_", "demo", "ui.color") ->
/// SIGIL_DEMO_UI_COLOR.
QString envVariableName(const QString& prefix, const QString& providerId, const QString& dottedKey);

} // namespace sigil
