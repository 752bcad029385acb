#include <QtTest>
#include "core/EnvOverlay.hpp"

class TestEnvOverlay : public QObject {
    Q_OBJECT
private slots:
    void testFirstUnderscoreSplitsSection();
    void testDoubleUnderscoreReachesDeepKeys();
    void testOtherProvidersIgnored();
    void testProviderWithDash();
    void testBarePrefixIgnored();
    void testReadsLiveEnvironment();
    void testVariableName();
};

void TestEnvOverlay::testFirstUnderscoreSplitsSection()
{
    QProcessEnvironment env;
    env.insert("SIGIL_DEMO_UI_COLOR", "blue");
    env.insert("SIGIL_DEMO_DB_MAX_CONN", "10");
    env.insert("SIGIL_DEMO_DEBUG", "1");

    const auto m = sigil::readEnv("demo", env);
    QCOMPARE(m.value("ui.color"), QString("blue"));
    QCOMPARE(m.value("db.max_conn"), QString("10"));
    QCOMPARE(m.value("debug"), QString("1"));
    QCOMPARE(m.size(), 3);
}

void TestEnvOverlay::testDoubleUnderscoreReachesDeepKeys()
{
    QProcessEnvironment env;
    env.insert("SIGIL_DEMO_A_B_C", "single");
    env.insert("SIGIL_DEMO_X__Y__Z", "deep");
    env.insert("SIGIL_DEMO_NET__HTTP__MAX_CONN", "8");
    env.insert("SIGIL_DEMO_BAD____KEY", "skipped");

    const auto m = sigil::readEnv("demo", env);
    QCOMPARE(m.value("a.b_c"), QString("single"));
    QCOMPARE(m.value("x.y.z"), QString("deep"));
    QCOMPARE(m.value("net.http.max_conn"), QString("8"));
    QCOMPARE(m.size(), 3);
}

void TestEnvOverlay::testOtherProvidersIgnored()
{
    QProcessEnvironment env;
    env.insert("SIGIL_OTHER_UI_COLOR", "red");
    env.insert("SIGIL_SECRET_DEMO_API_KEY", "abc");
    env.insert("PATH", "/usr/bin");

    QVERIFY(sigil::readEnv("demo", env).isEmpty());
}

void TestEnvOverlay::testProviderWithDash()
{
    QProcessEnvironment env;
    env.insert("SIGIL_MY_APP_UI_COLOR", "teal");

    QCOMPARE(sigil::readEnv("my-app", env).value("ui.color"), QString("teal"));
}

void TestEnvOverlay::testBarePrefixIgnored()
{
    QProcessEnvironment env;
    env.insert("SIGIL_DEMO_", "x");

    QVERIFY(sigil::readEnv("demo", env).isEmpty());
}

void TestEnvOverlay::testReadsLiveEnvironment()
{
    qputenv("SIGIL_ENVTEST_NET_TIMEOUT", "30");
    QCOMPARE(sigil::readEnv("envtest").value("net.timeout"), QString("30"));
    qunsetenv("SIGIL_ENVTEST_NET_TIMEOUT");
    QVERIFY(sigil::readEnv("envtest").isEmpty());
}

void TestEnvOverlay::testVariableName()
{
    QCOMPARE(sigil::envVariableName("SIGIL_", "demo", "ui.color"), QString("SIGIL_DEMO_UI_COLOR"));
    QCOMPARE(sigil::envVariableName("SIGIL_SECRET_", "my-app", "api_key"), QString("SIGIL_SECRET_MY_APP_API_KEY"));
}

QTEST_MAIN(TestEnvOverlay)
#include "test_env_overlay.moc"
