#include <QtTest>
#include <QRandomGenerator>
#include <QTemporaryDir>
#include "core/Errors.hpp"
#include "core/backend/BackendRegistry.hpp"
#include "core/backend/IniBackend.hpp"

namespace {

// Stores nothing; load always returns one fixed key.
class FixedBackend : public sigil::IBackend {
public:
    QString name() const override { return QStringLiteral("fixed"); }
    QStringList suffixes() const override { return {QStringLiteral("cfg"), QStringLiteral("conf")}; }
    sigil::Mapping load(const QString&) const override { return {{"fixed.key", "yes"}}; }
    void save(const QString&, const sigil::Mapping&) const override {}
};

QString randomText(QRandomGenerator& rng, const QString& alphabet, int minLen, int maxLen)
{
    const int len = rng.bounded(minLen, maxLen + 1);
    QString out;
    for (int i = 0; i < len; ++i)
        out += alphabet.at(rng.bounded(alphabet.size()));
    return out;
}

// Keys with one to three segments, none of them a parent of another, and
// values drawn from characters that are special to at least one format.
sigil::Mapping randomMapping(QRandomGenerator& rng)
{
    const QString head = QStringLiteral("kqvz");
    const QString tail = QStringLiteral("abxy0189_- #");
    const QString valueChars = QStringLiteral("abAB09 =#;[]\"\\:'-,\n");

    sigil::Mapping m;
    const int count = rng.bounded(1, 16);
    while (m.size() < count) {
        QStringList segments;
        const int depth = rng.bounded(1, 4);
        for (int i = 0; i < depth; ++i)
            segments << head.at(rng.bounded(head.size())) + randomText(rng, tail, 0, 5);
        const QString key = segments.join(QLatin1Char('.'));
        if (!sigil::isValidKey(key) || m.contains(key))
            continue;

        bool clash = false;
        for (auto it = m.constBegin(); it != m.constEnd() && !clash; ++it)
            clash = it.key().startsWith(key + QLatin1Char('.')) || key.startsWith(it.key() + QLatin1Char('.'));
        if (clash)
            continue;

        m.insert(key, randomText(rng, valueChars, 0, 12));
    }
    return m;
}

} // namespace

class TestBackendRegistry : public QObject {
    Q_OBJECT
private slots:
    void testBuiltinsRegistered();
    void testLookupIsCaseInsensitive();
    void testUnknownSuffixThrows();
    void testRegisterCustomBackend();
    void testLaterRegistrationReplaces();
    void testEveryBuiltinRoundTrips();
    void testRandomMappingsRoundTripInEveryBackend();
};

void TestBackendRegistry::testBuiltinsRegistered()
{
    auto registry = sigil::BackendRegistry::withBuiltins();
    QCOMPARE(registry->registeredSuffixes(), (QStringList{"ini", "json", "yaml", "yml"}));
    QCOMPARE(registry->backendForPath("/x/settings.ini")->name(), QString("ini"));
    QCOMPARE(registry->backendForPath("/x/settings.yml")->name(), QString("yaml"));
    QCOMPARE(registry->backendForPath("/x/settings.json")->name(), QString("json"));
}

void TestBackendRegistry::testLookupIsCaseInsensitive()
{
    auto registry = sigil::BackendRegistry::withBuiltins();
    QVERIFY(registry->supports("/x/SETTINGS.INI"));
    QCOMPARE(registry->backendForPath("/x/Settings.Yaml")->name(), QString("yaml"));
}

void TestBackendRegistry::testUnknownSuffixThrows()
{
    auto registry = sigil::BackendRegistry::withBuiltins();
    QVERIFY(!registry->supports("/x/settings.toml"));
    QVERIFY_THROWS_EXCEPTION(sigil::UnsupportedFormatError, registry->backendForPath("/x/settings.toml"));
    QVERIFY_THROWS_EXCEPTION(sigil::UnsupportedFormatError, registry->backendForPath("/x/settings"));
}

void TestBackendRegistry::testRegisterCustomBackend()
{
    sigil::BackendRegistry registry;
    registry.registerBackend(std::make_shared<FixedBackend>());

    QVERIFY(registry.supports("a.cfg"));
    QVERIFY(registry.supports("a.conf"));
    QCOMPARE(registry.backendForPath("a.conf")->load("a.conf").value("fixed.key"), QString("yes"));
}

void TestBackendRegistry::testLaterRegistrationReplaces()
{
    auto registry = sigil::BackendRegistry::withBuiltins();
    registry->registerBackend(".INI", std::make_shared<FixedBackend>());
    QCOMPARE(registry->backendForPath("s.ini")->name(), QString("fixed"));
}

void TestBackendRegistry::testEveryBuiltinRoundTrips()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());

    const sigil::Mapping m{{"db.host", "localhost"},
                           {"db.port", "5432"},
                           {"ui.scale", "1.5"},
                           {"ui.dark", "false"},
                           {"title", "Demo: the app"}};

    auto registry = sigil::BackendRegistry::withBuiltins();
    for (const auto& suffix : registry->registeredSuffixes()) {
        const QString path = tmp.filePath("settings." + suffix);
        auto backend = registry->backendForPath(path);
        backend->save(path, m);
        QCOMPARE(backend->load(path), m);
    }
}

void TestBackendRegistry::testRandomMappingsRoundTripInEveryBackend()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());

    auto registry = sigil::BackendRegistry::withBuiltins();
    for (quint32 seed = 1; seed <= 40; ++seed) {
        QRandomGenerator rng(seed);
        const sigil::Mapping m = randomMapping(rng);

        for (const auto& suffix : registry->registeredSuffixes()) {
            const QString path = tmp.filePath(QStringLiteral("settings-%1.%2").arg(seed).arg(suffix));
            auto backend = registry->backendForPath(path);
            backend->save(path, m);
            const sigil::Mapping loaded = backend->load(path);
            if (loaded != m)
                qWarning() << "seed" << seed << suffix << "wrote" << m << "read" << loaded;
            QCOMPARE(loaded, m);
        }
    }
}

QTEST_MAIN(TestBackendRegistry)
#include "test_backend_registry.moc"
