#include <QtTest>
#include <QDir>
#include <QFile>
#include <QStandardPaths>
#include <QTemporaryDir>
#include "core/Errors.hpp"
#include "core/Paths.hpp"
#include "core/Resolver.hpp"
#include "core/discovery/IDefaultsLocator.hpp"
#include "core/policy/PolicyHandle.hpp"
#include "core/secrets/SecretChain.hpp"
#include "core/secrets/VaultProvider.hpp"

namespace {

const QString kProvider = QStringLiteral("factorydemo");

class FixedLocator : public sigil::IDefaultsLocator {
public:
    explicit FixedLocator(const QString& path) : path_(path) {}
    QString resolveDefaultsPath(const QString&) const override { return path_; }

private:
    QString path_;
};

void writeFile(const QString& path, const QByteArray& bytes)
{
    QFile f(path);
    QVERIFY(f.open(QIODevice::WriteOnly | QIODevice::Truncate));
    f.write(bytes);
}

} // namespace

// Resolver::forProvider() on a headless host: no session bus, so the keyring
// is unavailable and the vault is the first writable secret store.
class TestResolverFactory : public QObject {
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanup();

    void testAttachesStandardChain();
    void testVaultUnlocksFromEnvironment();
    void testLockedVaultFallsThroughToEnv();
    void testLoadsMetadataBesideDefaults();
    void testNoMetadataWithoutFile();
    void testCorruptMetadataSurfaces();

private:
    QTemporaryDir project_;
    QTemporaryDir defaults_;
    sigil::PolicyHandle handle_;
};

void TestResolverFactory::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
    qputenv("DBUS_SESSION_BUS_ADDRESS", "unix:path=/nonexistent/sigil-test-bus");
    QVERIFY(project_.isValid());
    QVERIFY(defaults_.isValid());
    qputenv("SIGIL_ROOT", project_.path().toUtf8());
    QVERIFY(QFile::copy(QStringLiteral(TEST_DATA_DIR "/defaults.ini"), defaults_.filePath("settings.ini")));
}

void TestResolverFactory::cleanup()
{
    qunsetenv("SIGIL_MASTER_PWD");
    qunsetenv("SIGIL_SECRET_FACTORYDEMO_API_KEY");
    QFile::remove(defaults_.filePath("settings.meta.yaml"));
    QDir(QDir(sigil::Paths::userConfigDir()).filePath(kProvider)).removeRecursively();
}

void TestResolverFactory::testAttachesStandardChain()
{
    auto r = sigil::Resolver::forProvider(kProvider, handle_);
    auto chain = r->secretChain();
    QVERIFY(chain);
    QCOMPARE(chain->providerNames(), (QStringList{"keyring", "vault", "env"}));
    QVERIFY(chain->vault());
    QCOMPARE(chain->vault()->path(), sigil::VaultProvider::defaultPath(kProvider));
}

void TestResolverFactory::testVaultUnlocksFromEnvironment()
{
    qputenv("SIGIL_MASTER_PWD", "factory-pw");
    auto r = sigil::Resolver::forProvider(kProvider, handle_);
    auto vault = r->secretChain()->vault();
    QVERIFY(vault->isUnlocked());

    QVERIFY(r->set("secret.token", "t0k"));
    QVERIFY(QFile::exists(sigil::VaultProvider::defaultPath(kProvider)));
    QCOMPARE(r->value("secret.token").toString(), QString("t0k"));
    QVERIFY(!QFile::exists(r->pathFor("user")));

    auto reopened = sigil::Resolver::forProvider(kProvider, handle_);
    QCOMPARE(reopened->value("secret.token").toString(), QString("t0k"));
    QVERIFY(reopened->clear("secret.token"));
    QVERIFY(!r->value("secret.token").isValid());
}

void TestResolverFactory::testLockedVaultFallsThroughToEnv()
{
    qputenv("SIGIL_SECRET_FACTORYDEMO_API_KEY", "abc123");
    auto r = sigil::Resolver::forProvider(kProvider, handle_);
    QVERIFY(!r->secretChain()->vault()->isUnlocked());
    QCOMPARE(r->value("secret.api_key").toString(), QString("abc123"));
}

void TestResolverFactory::testLoadsMetadataBesideDefaults()
{
    writeFile(defaults_.filePath("settings.meta.yaml"),
              "db.port:\n  locked: true\nui.color:\n  policy: user_over_project\n");
    const FixedLocator locator(defaults_.filePath("settings.ini"));

    auto r = sigil::Resolver::forProvider(kProvider, handle_, &locator);
    QVERIFY(r->keyMetadata());
    QVERIFY(r->keyMetadata()->lookup("db.port").locked);
    QCOMPARE(r->intValue("db.port"), 5432);
    QVERIFY_THROWS_EXCEPTION(sigil::LockedKeyError, r->set("db.port", 1, "user"));
    const QStringList order = r->precedenceFor("ui.color");
    QVERIFY(order.indexOf("user") < order.indexOf("project"));
}

void TestResolverFactory::testNoMetadataWithoutFile()
{
    const FixedLocator locator(defaults_.filePath("settings.ini"));
    auto r = sigil::Resolver::forProvider(kProvider, handle_, &locator);
    QVERIFY(!r->keyMetadata());
    QCOMPARE(r->value("ui.color").toString(), QString("green"));
}

void TestResolverFactory::testCorruptMetadataSurfaces()
{
    writeFile(defaults_.filePath("settings.meta.yaml"), "db.port:\n  policy: sideways\n");
    const FixedLocator locator(defaults_.filePath("settings.ini"));
    QVERIFY_THROWS_EXCEPTION(sigil::CorruptFileError,
                             sigil::Resolver::forProvider(kProvider, handle_, &locator));
}

QTEST_MAIN(TestResolverFactory)
#include "test_resolver_factory.moc"
