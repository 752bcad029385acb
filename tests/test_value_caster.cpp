#include <QtTest>
#include "core/Errors.hpp"
#include "core/ValueCaster.hpp"

class TestValueCaster : public QObject {
    Q_OBJECT
private slots:
    void testAutoCast_data();
    void testAutoCast();
    void testLargeIntegersStayIntegral();
    void testJsonArray();
    void testJsonObject();
    void testBrokenJsonFallsBackToString();
    void testExplicitCasts();
    void testApplyCastWrapsFailures();
    void testStringify();
};

void TestValueCaster::testAutoCast_data()
{
    QTest::addColumn<QString>("raw");
    QTest::addColumn<int>("kind");
    QTest::addColumn<QVariant>("expected");

    QTest::newRow("int") << "6000" << int(sigil::ValueKind::Int) << QVariant(6000);
    QTest::newRow("negative") << "-3" << int(sigil::ValueKind::Int) << QVariant(-3);
    QTest::newRow("one is int") << "1" << int(sigil::ValueKind::Int) << QVariant(1);
    QTest::newRow("float") << "1.5" << int(sigil::ValueKind::Float) << QVariant(1.5);
    QTest::newRow("true") << "True" << int(sigil::ValueKind::Bool) << QVariant(true);
    QTest::newRow("no") << "no" << int(sigil::ValueKind::Bool) << QVariant(false);
    QTest::newRow("text") << "blue" << int(sigil::ValueKind::String) << QVariant(QString("blue"));
    QTest::newRow("empty") << "" << int(sigil::ValueKind::String) << QVariant(QString(""));
}

void TestValueCaster::testAutoCast()
{
    QFETCH(QString, raw);
    QFETCH(int, kind);
    QFETCH(QVariant, expected);

    const auto result = sigil::autoCast(raw);
    QCOMPARE(int(result.kind), kind);
    QCOMPARE(result.value, expected);
}

void TestValueCaster::testLargeIntegersStayIntegral()
{
    const auto result = sigil::autoCast("9000000000");
    QCOMPARE(int(result.kind), int(sigil::ValueKind::Int));
    QCOMPARE(result.value.toLongLong(), Q_INT64_C(9000000000));
}

void TestValueCaster::testJsonArray()
{
    const auto result = sigil::autoCast("[1, 2]");
    QCOMPARE(int(result.kind), int(sigil::ValueKind::Json));
    const QVariantList list = result.value.toList();
    QCOMPARE(list.size(), 2);
    QCOMPARE(list.at(1).toInt(), 2);
}

void TestValueCaster::testJsonObject()
{
    const auto result = sigil::autoCast("{\"a\": 1, \"b\": \"x\"}");
    QCOMPARE(int(result.kind), int(sigil::ValueKind::Json));
    const QVariantMap map = result.value.toMap();
    QCOMPARE(map.value("a").toInt(), 1);
    QCOMPARE(map.value("b").toString(), QString("x"));
}

void TestValueCaster::testBrokenJsonFallsBackToString()
{
    const auto result = sigil::autoCast("[not json");
    QCOMPARE(int(result.kind), int(sigil::ValueKind::String));
    QCOMPARE(result.value.toString(), QString("[not json"));
}

void TestValueCaster::testExplicitCasts()
{
    QCOMPARE(sigil::casts::toInt("5.0").toInt(), 5);
    QCOMPARE(sigil::casts::toInt(" 42 ").toInt(), 42);
    QCOMPARE(sigil::casts::toDouble("2").toDouble(), 2.0);
    QCOMPARE(sigil::casts::toBool("off").toBool(), false);
    QCOMPARE(sigil::casts::toBool("YES").toBool(), true);
    QCOMPARE(sigil::casts::toString("007").toString(), QString("007"));
    QCOMPARE(sigil::casts::toStringList("a, b,c").toStringList(), (QStringList{"a", "b", "c"}));
    QCOMPARE(sigil::casts::toStringList("[\"x\", \"y\"]").toStringList(), (QStringList{"x", "y"}));

    QVERIFY_THROWS_EXCEPTION(std::invalid_argument, sigil::casts::toInt("5.5"));
    QVERIFY_THROWS_EXCEPTION(std::invalid_argument, sigil::casts::toBool("maybe"));
}

void TestValueCaster::testApplyCastWrapsFailures()
{
    try {
        sigil::applyCast("db.port", "abc", sigil::casts::toInt);
        QFAIL("expected CastError");
    } catch (const sigil::CastError& e) {
        QVERIFY(e.kind() == sigil::ErrorKind::CastError);
        QCOMPARE(e.key(), QString("db.port"));
        QCOMPARE(e.rawValue(), QString("abc"));
    }

    sigil::CastFn invalid = [](const QString&) { return QVariant(); };
    QVERIFY_THROWS_EXCEPTION(sigil::CastError, sigil::applyCast("k", "v", invalid));

    QCOMPARE(sigil::applyCast("db.port", "6000", sigil::casts::toInt).toInt(), 6000);
}

void TestValueCaster::testStringify()
{
    QCOMPARE(sigil::stringifyValue(true), QString("true"));
    QCOMPARE(sigil::stringifyValue(6000), QString("6000"));
    QCOMPARE(sigil::stringifyValue(1.5), QString("1.5"));
    QCOMPARE(sigil::stringifyValue(QString("blue")), QString("blue"));
    QCOMPARE(sigil::stringifyValue(QStringList{"a", "b"}), QString("[\"a\",\"b\"]"));
}

QTEST_MAIN(TestValueCaster)
#include "test_value_caster.moc"
