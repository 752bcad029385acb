#include <QtTest>
#include "core/Errors.hpp"
#include "core/policy/PolicyHandle.hpp"
#include "core/policy/ScopePolicy.hpp"

class TestScopePolicy : public QObject {
    Q_OBJECT
private slots:
    void testProjectOverUserOrder();
    void testUserOverProjectOrder();
    void testWritability();
    void testUnknownScopeThrows();
    void testRejectsMissingDefaults();
    void testRejectsDefaultsNotLast();
    void testRejectsDuplicateIds();
    void testRejectsWritableDefaults();
    void testResolvePaths();
    void testMachineAffinityPath();
    void testUnlocatedScopesResolveEmpty();
    void testWithScopesInsertsAboveDefaults();
    void testWithScopesRemoves();
    void testReordered();
    void testPolicyHandleSwapKeepsSnapshots();
};

static sigil::ScopeContext demoContext()
{
    sigil::ScopeContext ctx;
    ctx.providerId = "demo";
    ctx.hostId = "box";
    ctx.userConfigDir = "/home/u/.config/sigil";
    ctx.projectDir = "/work/proj";
    ctx.defaultsPath = "/usr/share/sigil/providers/demo/.sigil/settings.ini";
    return ctx;
}

void TestScopePolicy::testProjectOverUserOrder()
{
    auto p = sigil::ScopePolicy::projectOverUser();
    QCOMPARE(p.scopeIds(), (QStringList{"env", "project-local", "project", "user-local", "user", "default"}));
    QCOMPARE(p.machineScopes(), (QStringList{"project-local", "user-local"}));
    QVERIFY(p.scope("env").isOverlay());
    QVERIFY(p.scope("default").isDefaults());
}

void TestScopePolicy::testUserOverProjectOrder()
{
    auto p = sigil::ScopePolicy::userOverProject();
    QCOMPARE(p.scopeIds(), (QStringList{"env", "user-local", "user", "project-local", "project", "default"}));
}

void TestScopePolicy::testWritability()
{
    auto p = sigil::ScopePolicy::projectOverUser();
    QVERIFY(!p.canWrite("env"));
    QVERIFY(!p.canWrite("default"));
    QVERIFY(p.canWrite("user"));
    QVERIFY(p.canWrite("project-local"));
}

void TestScopePolicy::testUnknownScopeThrows()
{
    auto p = sigil::ScopePolicy::projectOverUser();
    QVERIFY(!p.contains("core"));
    QVERIFY_THROWS_EXCEPTION(sigil::UnknownScopeError, p.canWrite("core"));
    QVERIFY_THROWS_EXCEPTION(sigil::UnknownScopeError, p.resolvePath("core", demoContext()));
}

void TestScopePolicy::testRejectsMissingDefaults()
{
    QVERIFY_THROWS_EXCEPTION(sigil::InvalidPolicyError,
                             sigil::ScopePolicy({sigil::Scope::user(), sigil::Scope::project()}));
    QVERIFY_THROWS_EXCEPTION(sigil::InvalidPolicyError, sigil::ScopePolicy(std::vector<sigil::Scope>{}));
}

void TestScopePolicy::testRejectsDefaultsNotLast()
{
    QVERIFY_THROWS_EXCEPTION(sigil::InvalidPolicyError,
                             sigil::ScopePolicy({sigil::Scope::defaults(), sigil::Scope::user()}));
}

void TestScopePolicy::testRejectsDuplicateIds()
{
    QVERIFY_THROWS_EXCEPTION(sigil::InvalidPolicyError,
                             sigil::ScopePolicy({sigil::Scope::user(), sigil::Scope::user(), sigil::Scope::defaults()}));
}

void TestScopePolicy::testRejectsWritableDefaults()
{
    sigil::Scope writableDefaults("default", true, false,
                                  [](const sigil::ScopeContext& ctx) { return ctx.defaultsPath; });
    QVERIFY_THROWS_EXCEPTION(sigil::InvalidPolicyError,
                             sigil::ScopePolicy({sigil::Scope::user(), writableDefaults}));
}

void TestScopePolicy::testResolvePaths()
{
    auto p = sigil::ScopePolicy::projectOverUser();
    auto ctx = demoContext();

    QCOMPARE(p.resolvePath("user", ctx), QString("/home/u/.config/sigil/demo/settings.ini"));
    QCOMPARE(p.resolvePath("project", ctx), QString("/work/proj/.sigil/demo/settings.ini"));
    QCOMPARE(p.resolvePath("default", ctx), ctx.defaultsPath);
    QVERIFY(p.resolvePath("env", ctx).isEmpty());
}

void TestScopePolicy::testMachineAffinityPath()
{
    auto p = sigil::ScopePolicy::projectOverUser();
    auto ctx = demoContext();

    QCOMPARE(p.resolvePath("user-local", ctx), QString("/home/u/.config/sigil/demo/settings-local-box.ini"));
    QCOMPARE(p.resolvePath("project-local", ctx), QString("/work/proj/.sigil/demo/settings-local-box.ini"));
}

void TestScopePolicy::testUnlocatedScopesResolveEmpty()
{
    auto p = sigil::ScopePolicy::projectOverUser();
    auto ctx = demoContext();
    ctx.projectDir.clear();
    ctx.defaultsPath.clear();

    QVERIFY(p.resolvePath("project", ctx).isEmpty());
    QVERIFY(p.resolvePath("project-local", ctx).isEmpty());
    QVERIFY(p.resolvePath("default", ctx).isEmpty());
}

void TestScopePolicy::testWithScopesInsertsAboveDefaults()
{
    auto base = sigil::ScopePolicy({sigil::Scope::overlay("env"), sigil::Scope::user(), sigil::Scope::defaults()});
    sigil::Scope site("site", false, false, [](const sigil::ScopeContext&) { return QString("/etc/sigil/site.ini"); });

    auto p = base.withScopes({site});
    QCOMPARE(p.scopeIds(), (QStringList{"env", "user", "site", "default"}));
    QVERIFY(!p.canWrite("site"));
    // base is untouched
    QCOMPARE(base.scopeIds(), (QStringList{"env", "user", "default"}));
}

void TestScopePolicy::testWithScopesRemoves()
{
    auto p = sigil::ScopePolicy::projectOverUser().withScopes({}, {"project-local", "user-local"});
    QCOMPARE(p.scopeIds(), (QStringList{"env", "project", "user", "default"}));
    QVERIFY_THROWS_EXCEPTION(sigil::InvalidPolicyError,
                             sigil::ScopePolicy::projectOverUser().withScopes({}, {"default"}));
}

void TestScopePolicy::testReordered()
{
    auto p = sigil::ScopePolicy::projectOverUser().withScopes({}, {"project-local", "user-local"});
    auto r = p.reordered({"env", "user", "project", "default"});
    QCOMPARE(r.scopeIds(), (QStringList{"env", "user", "project", "default"}));

    QVERIFY_THROWS_EXCEPTION(sigil::InvalidPolicyError, p.reordered({"env", "user", "default"}));
    QVERIFY_THROWS_EXCEPTION(sigil::InvalidPolicyError, p.reordered({"env", "user", "user", "default"}));
    QVERIFY_THROWS_EXCEPTION(sigil::InvalidPolicyError, p.reordered({"default", "env", "user", "project"}));
}

void TestScopePolicy::testPolicyHandleSwapKeepsSnapshots()
{
    sigil::PolicyHandle handle;
    auto before = handle.current();
    QCOMPARE(before->scopeIds().at(1), QString("project-local"));

    handle.install(sigil::ScopePolicy::userOverProject());
    QCOMPARE(handle.current()->scopeIds().at(1), QString("user-local"));
    QCOMPARE(before->scopeIds().at(1), QString("project-local"));
}

QTEST_MAIN(TestScopePolicy)
#include "test_scope_policy.moc"
