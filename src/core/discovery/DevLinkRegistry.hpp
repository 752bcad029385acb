#pragma once

#include <QMap>
#include <QString>

namespace sigil {

/// Development links: one small file per provider under
/// <user config>/sigil/dev-links/<provider>.link holding the absolute path of
/// that provider's defaults file. Lets a package author point the resolver at
/// a working-tree defaults file instead of the installed copy.
class DevLinkRegistry {
public:
    explicit DevLinkRegistry(const QString& linksDir = defaultLinksDir());

    static QString defaultLinksDir();

    const QString& linksDir() const { return linksDir_; }

    /// Create or replace the link. defaultsPath is made absolute.
    /// Throws NotFoundError if defaultsPath is not an existing file.
    void link(const QString& providerId, const QString& defaultsPath);

    /// Remove the link. Returns false if there was none.
    bool unlink(const QString& providerId);

    /// Linked defaults path, or empty if there is no link or its target has
    /// since disappeared.
    QString target(const QString& providerId) const;

    /// provider id -> defaults path for every link whose target exists.
    QMap<QString, QString> links() const;

private:
    QString linkFile(const QString& providerId) const;

    QString linksDir_;
};

} // namespace sigil
