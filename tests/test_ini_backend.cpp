#include <QtTest>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include "core/Errors.hpp"
#include "core/backend/IniBackend.hpp"

class TestIniBackend : public QObject {
    Q_OBJECT
private slots:
    void testLoadFixture();
    void testRootSectionForUndottedKeys();
    void testNestedKeyKeepsRemainderAsLeaf();
    void testMalformedLineIsCorrupt();
    void testKeyOutsideSectionIsCorrupt();
    void testDuplicateKeyIsCorrupt();
    void testMissingFileIsNotFound();
    void testSaveCreatesParentDirectories();
    void testSerializeIsSortedAndStable();
    void testEscapesSurviveRoundTrip();
    void testSaveLeavesNoTempFiles();
    void testPaddedAndQuotedValuesKeepTheirText();
    void testUnstorableKeysAreRejected();
};

void TestIniBackend::testLoadFixture()
{
    sigil::IniBackend ini;
    auto data = ini.load(QStringLiteral(TEST_DATA_DIR "/defaults.ini"));

    QCOMPARE(data.value("db.host"), QString("localhost"));
    QCOMPARE(data.value("db.port"), QString("5432"));
    QCOMPARE(data.value("ui.color"), QString("green"));
    QCOMPARE(data.value("ui.scale"), QString("1.5"));
    QCOMPARE(data.size(), 5);
}

void TestIniBackend::testRootSectionForUndottedKeys()
{
    auto data = sigil::IniBackend::parse("[__root__]\ndebug = true\n", "mem");
    QCOMPARE(data.value("debug"), QString("true"));

    QByteArray text = sigil::IniBackend::serialize({{"debug", "true"}});
    QCOMPARE(text, QByteArray("[__root__]\ndebug = true\n"));
}

void TestIniBackend::testNestedKeyKeepsRemainderAsLeaf()
{
    sigil::Mapping m{{"a.b.c", "1"}};
    QByteArray text = sigil::IniBackend::serialize(m);
    QCOMPARE(text, QByteArray("[a]\nb.c = 1\n"));
    QCOMPARE(sigil::IniBackend::parse(text, "mem"), m);
}

void TestIniBackend::testMalformedLineIsCorrupt()
{
    sigil::IniBackend ini;
    try {
        ini.load(QStringLiteral(TEST_DATA_DIR "/corrupt.ini"));
        QFAIL("expected CorruptFileError");
    } catch (const sigil::CorruptFileError& e) {
        QVERIFY(e.kind() == sigil::ErrorKind::CorruptFile);
        QVERIFY(e.path().endsWith("corrupt.ini"));
    }
}

void TestIniBackend::testKeyOutsideSectionIsCorrupt()
{
    QVERIFY_THROWS_EXCEPTION(sigil::CorruptFileError,
                             sigil::IniBackend::parse("host = x\n[db]\nport = 1\n", "mem"));
}

void TestIniBackend::testDuplicateKeyIsCorrupt()
{
    QVERIFY_THROWS_EXCEPTION(sigil::CorruptFileError,
                             sigil::IniBackend::parse("[db]\nport = 1\nport = 2\n", "mem"));
}

void TestIniBackend::testMissingFileIsNotFound()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());

    sigil::IniBackend ini;
    QVERIFY_THROWS_EXCEPTION(sigil::NotFoundError, ini.load(tmp.filePath("nope.ini")));
    QVERIFY_THROWS_EXCEPTION(sigil::NotFoundError, ini.load(tmp.filePath("no/such/dir/settings.ini")));
}

void TestIniBackend::testSaveCreatesParentDirectories()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString path = tmp.filePath("deep/er/settings.ini");

    sigil::IniBackend ini;
    sigil::Mapping m{{"db.port", "6000"}, {"ui.color", "blue"}};
    ini.save(path, m);

    QVERIFY(QFile::exists(path));
    QCOMPARE(ini.load(path), m);
}

void TestIniBackend::testSerializeIsSortedAndStable()
{
    sigil::Mapping m{{"ui.color", "blue"}, {"db.port", "6000"}, {"db.host", "h"}};
    const QByteArray expected("[db]\nhost = h\nport = 6000\n\n[ui]\ncolor = blue\n");
    QCOMPARE(sigil::IniBackend::serialize(m), expected);
    QCOMPARE(sigil::IniBackend::serialize(sigil::IniBackend::parse(expected, "mem")), expected);
}

void TestIniBackend::testEscapesSurviveRoundTrip()
{
    sigil::Mapping m{{"msg.body", "line one\nline two"}, {"paths.win", "C:\\temp\\new"}};
    QCOMPARE(sigil::IniBackend::parse(sigil::IniBackend::serialize(m), "mem"), m);
}

void TestIniBackend::testSaveLeavesNoTempFiles()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const QString path = tmp.filePath("settings.ini");

    sigil::IniBackend ini;
    ini.save(path, {{"a.b", "1"}});
    ini.save(path, {{"a.b", "2"}});

    const QStringList entries = QDir(tmp.path()).entryList(QDir::Files | QDir::Hidden);
    QCOMPARE(entries, QStringList{"settings.ini"});
    QCOMPARE(ini.load(path).value("a.b"), QString("2"));
}

void TestIniBackend::testPaddedAndQuotedValuesKeepTheirText()
{
    sigil::Mapping m{{"ui.label", " padded "},
                     {"ui.quoted", "\"already quoted\""},
                     {"ui.eq", "a = b"},
                     {"ui.hash", "#not a comment"},
                     {"ui.empty", ""}};
    const QByteArray text = sigil::IniBackend::serialize(m);
    QVERIFY(text.contains("label = \" padded \"\n"));
    QCOMPARE(sigil::IniBackend::parse(text, "mem"), m);
}

void TestIniBackend::testUnstorableKeysAreRejected()
{
    QVERIFY(!sigil::isValidKey("[x"));
    QVERIFY(!sigil::isValidKey("a.b=c"));
    QVERIFY(!sigil::isValidKey("a.#x"));
    QVERIFY(!sigil::isValidKey(";x"));
    QVERIFY(!sigil::isValidKey("a. b"));
    QVERIFY(!sigil::isValidKey("a.b\nc"));
    QVERIFY(sigil::isValidKey("a.b#c"));
    QVERIFY(sigil::isValidKey("a.b c"));

    QVERIFY_THROWS_EXCEPTION(sigil::InvalidKeyError, sigil::IniBackend::serialize({{"[x", "1"}}));
}

QTEST_MAIN(TestIniBackend)
#include "test_ini_backend.moc"
