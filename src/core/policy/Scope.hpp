#pragma once

#include <QString>
#include <functional>

namespace sigil {

inline const QString kEnvScope = QStringLiteral("env");
inline const QString kProjectLocalScope = QStringLiteral("project-local");
inline const QString kProjectScope = QStringLiteral("project");
inline const QString kUserLocalScope = QStringLiteral("user-local");
inline const QString kUserScope = QStringLiteral("user");
inline const QString kDefaultScope = QStringLiteral("default");

inline const QString kSettingsFileName = QStringLiteral("settings.ini");

/// Everything a scope needs to turn itself into a file path.
struct ScopeContext {
    QString providerId;     // normalized provider identity
    QString hostId;         // normalized local host name
    QString userConfigDir;  // <user config>/sigil
    QString projectDir;     // project root, empty when outside a project
    QString defaultsPath;   // provider defaults file, empty when not found

    /// Context for providerId using the standard user config directory, the
    /// local host id and the project root found from the working directory.
    /// defaultsPath is left for the caller (see IDefaultsLocator).
    static ScopeContext forProvider(const QString& providerId);
};

enum class ScopeKind {
    FileBacked,
    Overlay
};

/// One precedence layer. Immutable once constructed.
class Scope {
public:
    using PathResolver = std::function<QString(const ScopeContext&)>;

    Scope(const QString& id, bool writable, bool machineAffinity, PathResolver resolver);

    /// Read-only layer synthesized at load time (no file).
    static Scope overlay(const QString& id);

    /// Terminal read-only layer backed by ScopeContext::defaultsPath.
    static Scope defaults();

    /// <userConfigDir>/<provider>/settings.ini
    static Scope user(const QString& id = kUserScope, bool machineAffinity = false);

    /// <projectDir>/.sigil/<provider>/settings.ini
    static Scope project(const QString& id = kProjectScope, bool machineAffinity = false);

    const QString& id() const { return id_; }
    bool isWritable() const { return writable_; }
    bool hasMachineAffinity() const { return machineAffinity_; }
    ScopeKind kind() const { return kind_; }
    bool isOverlay() const { return kind_ == ScopeKind::Overlay; }
    bool isDefaults() const { return id_ == kDefaultScope; }

    /// Path before machine-affinity adjustment; empty for overlays or when the
    /// context lacks the directory this scope lives in.
    QString basePath(const ScopeContext& context) const;

private:
    Scope(const QString& id, ScopeKind kind);

    QString id_;
    bool writable_ = false;
    bool machineAffinity_ = false;
    ScopeKind kind_ = ScopeKind::FileBacked;
    PathResolver resolver_;
};

} // namespace sigil
