#include <QtTest>
#include "permissions/RoleHierarchy.h"
#include "GuildFixture.h"

namespace
{
    constexpr Snowflake GUILD_ID = 1000;
    constexpr Snowflake OWNER_ID = 1;
}

class TestRoleHierarchy : public QObject
{
    Q_OBJECT

private slots:
    void highestRoleByPosition();
    void highestRoleTieFavoursLowerId();
    void highestRoleSkipsUnknownRoles();
    void highestRoleNoneWhenNothingResolves();
    void compareRequiresMembers();
    void compareSameUser();
    void ownerAlwaysWins();
    void comparePositions_data();
    void comparePositions();
    void outranks();
};

void TestRoleHierarchy::highestRoleByPosition()
{
    EntityStore<Role> roles;
    roles.insert(10, makeRole(10, 1, 0));
    roles.insert(20, makeRole(20, 5, 0));
    roles.insert(30, makeRole(30, 3, 0));

    const Role *highest = RoleHierarchy::memberHighestRole(makeMember(2, {10, 20, 30}), roles);
    QVERIFY(highest);
    QCOMPARE(highest->id, Snowflake(20));
}

void TestRoleHierarchy::highestRoleTieFavoursLowerId()
{
    EntityStore<Role> roles;
    roles.insert(200, makeRole(200, 4, 0));
    roles.insert(100, makeRole(100, 4, 0));

    // Independent of the order the member lists them in
    const Role *highest = RoleHierarchy::memberHighestRole(makeMember(2, {200, 100}), roles);
    QVERIFY(highest);
    QCOMPARE(highest->id, Snowflake(100));

    highest = RoleHierarchy::memberHighestRole(makeMember(2, {100, 200}), roles);
    QVERIFY(highest);
    QCOMPARE(highest->id, Snowflake(100));
}

void TestRoleHierarchy::highestRoleSkipsUnknownRoles()
{
    EntityStore<Role> roles;
    roles.insert(10, makeRole(10, 1, 0));

    const Role *highest = RoleHierarchy::memberHighestRole(makeMember(2, {99, 10, 98}), roles);
    QVERIFY(highest);
    QCOMPARE(highest->id, Snowflake(10));
}

void TestRoleHierarchy::highestRoleNoneWhenNothingResolves()
{
    EntityStore<Role> roles;
    roles.insert(10, makeRole(10, 1, 0));

    QVERIFY(!RoleHierarchy::memberHighestRole(makeMember(2, {98, 99}), roles));
    QVERIFY(!RoleHierarchy::memberHighestRole(makeMember(2), roles));
}

void TestRoleHierarchy::compareRequiresMembers()
{
    Guild guild = makeGuild(GUILD_ID, OWNER_ID, 0);
    guild.addMember(makeMember(OWNER_ID));
    guild.addMember(makeMember(2));

    QVERIFY(!RoleHierarchy::compareHierarchy(guild, OWNER_ID, 3));
    QVERIFY(!RoleHierarchy::compareHierarchy(guild, 3, 2));
}

void TestRoleHierarchy::compareSameUser()
{
    Guild guild = makeGuild(GUILD_ID, OWNER_ID, 0);
    guild.addRole(makeRole(10, 7, 0));
    guild.addMember(makeMember(OWNER_ID));
    guild.addMember(makeMember(2, {10}));

    QVERIFY(!RoleHierarchy::compareHierarchy(guild, 2, 2));
    QVERIFY(!RoleHierarchy::compareHierarchy(guild, OWNER_ID, OWNER_ID));
}

void TestRoleHierarchy::ownerAlwaysWins()
{
    Guild guild = makeGuild(GUILD_ID, OWNER_ID, 0);
    guild.addRole(makeRole(10, 50, Permissions::ADMINISTRATOR));
    guild.addMember(makeMember(OWNER_ID));
    guild.addMember(makeMember(2, {10}));

    std::optional<Snowflake> winner = RoleHierarchy::compareHierarchy(guild, 2, OWNER_ID);
    QVERIFY(winner);
    QCOMPARE(*winner, OWNER_ID);

    winner = RoleHierarchy::compareHierarchy(guild, OWNER_ID, 2);
    QVERIFY(winner);
    QCOMPARE(*winner, OWNER_ID);
}

void TestRoleHierarchy::comparePositions_data()
{
    // Member 2 holds role A, member 3 holds role B. winner 0 means no winner.
    QTest::addColumn<quint64>("roleA");
    QTest::addColumn<int>("positionA");
    QTest::addColumn<quint64>("roleB");
    QTest::addColumn<int>("positionB");
    QTest::addColumn<quint64>("winner");

    QTest::newRow("higher position wins") << 100ULL << 5 << 200ULL << 3 << 2ULL;
    QTest::newRow("higher position wins (rhs)") << 100ULL << 1 << 200ULL << 3 << 3ULL;
    QTest::newRow("equal position, lower id wins") << 100ULL << 4 << 200ULL << 4 << 2ULL;
    QTest::newRow("equal position, lower id wins (rhs)") << 300ULL << 4 << 200ULL << 4 << 3ULL;
    QTest::newRow("same role") << 100ULL << 4 << 100ULL << 4 << 0ULL;
    QTest::newRow("both position zero") << 100ULL << 0 << 200ULL << 0 << 0ULL;
    QTest::newRow("one unranked") << 100ULL << 2 << 0ULL << 0 << 2ULL;
    QTest::newRow("both unranked") << 0ULL << 0 << 0ULL << 0 << 0ULL;
    QTest::newRow("position zero against unranked") << 100ULL << 0 << 0ULL << 0 << 0ULL;
}

void TestRoleHierarchy::comparePositions()
{
    QFETCH(quint64, roleA);
    QFETCH(int, positionA);
    QFETCH(quint64, roleB);
    QFETCH(int, positionB);
    QFETCH(quint64, winner);

    // Role ID 0 stands for "no roles at all"
    Guild guild = makeGuild(GUILD_ID, OWNER_ID, 0);
    if (roleA)
        guild.addRole(makeRole(roleA, positionA, 0));
    if (roleB && roleB != roleA)
        guild.addRole(makeRole(roleB, positionB, 0));
    guild.addMember(makeMember(2, roleA ? QList<Snowflake>{roleA} : QList<Snowflake>{}));
    guild.addMember(makeMember(3, roleB ? QList<Snowflake>{roleB} : QList<Snowflake>{}));

    std::optional<Snowflake> result = RoleHierarchy::compareHierarchy(guild, 2, 3);
    QCOMPARE(result.value_or(0), winner);
}

void TestRoleHierarchy::outranks()
{
    Guild guild = makeGuild(GUILD_ID, OWNER_ID, 0);
    guild.addRole(makeRole(10, 2, 0));
    guild.addRole(makeRole(20, 1, 0));
    guild.addMember(makeMember(OWNER_ID));
    guild.addMember(makeMember(2, {10}));
    guild.addMember(makeMember(3, {20}));
    // Role vanished from the snapshot: treated as holding no role
    guild.addMember(makeMember(4, {999}));

    QVERIFY(RoleHierarchy::outranks(guild, 2, 3));
    QVERIFY(!RoleHierarchy::outranks(guild, 3, 2));
    QVERIFY(RoleHierarchy::outranks(guild, OWNER_ID, 2));
    QVERIFY(RoleHierarchy::outranks(guild, 3, 4));
    QVERIFY(!RoleHierarchy::outranks(guild, 2, 2));
}

QTEST_APPLESS_MAIN(TestRoleHierarchy)
#include "tst_rolehierarchy.moc"
