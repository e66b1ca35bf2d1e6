#include <gtest/gtest.h>
#include "core/dsn_resolver.hpp"

#include <sql.h>

using namespace ibarrow::core;

class DsnResolverTest : public ::testing::Test {
protected:
    QueryConfig config;
};

TEST_F(DsnResolverTest, NamedSourceUnchanged) {
    EXPECT_EQ(DsnResolver::resolve("MyFirebird", config), "MyFirebird");
}

TEST_F(DsnResolverTest, KeywordStringUnchanged) {
    const std::string raw = "Driver={PostgreSQL};Server=localhost;Database=db";
    EXPECT_EQ(DsnResolver::resolve(raw, config), raw);
}

TEST_F(DsnResolverTest, PathBecomesDatabaseKeyword) {
    EXPECT_EQ(DsnResolver::resolve("/data/employee.fdb", config), "DBNAME=/data/employee.fdb;");
    EXPECT_EQ(DsnResolver::resolve("C:\\db\\app.fdb", config), "DBNAME=C:\\db\\app.fdb;");
}

TEST_F(DsnResolverTest, PathContainingEqualsSign) {
    EXPECT_FALSE(DsnResolver::is_keyword_string("/data/a=b.fdb"));
    EXPECT_EQ(DsnResolver::resolve("/data/a=b.fdb", config), "DBNAME=/data/a=b.fdb;");
    EXPECT_EQ(DsnResolver::resolve("C:\\db\\x=1.fdb", config), "DBNAME=C:\\db\\x=1.fdb;");

    std::string once = DsnResolver::resolve("/data/a=b.fdb", config);
    EXPECT_EQ(DsnResolver::resolve(once, config), once);
}

TEST_F(DsnResolverTest, KeywordStringWithPathValue) {
    EXPECT_TRUE(DsnResolver::is_keyword_string("DBNAME=/data/a=b.fdb;"));
    EXPECT_TRUE(DsnResolver::is_keyword_string("Driver={X};Database=C:\\db.fdb"));
}

TEST_F(DsnResolverTest, PathWithDriver) {
    QueryConfig::Options options;
    options.driver = "Firebird/InterBase(r) driver";
    QueryConfig with_driver(options);
    EXPECT_EQ(DsnResolver::resolve("/data/employee.fdb", with_driver),
              "DRIVER=Firebird/InterBase(r) driver;DBNAME=/data/employee.fdb;");
}

TEST_F(DsnResolverTest, LongNameBecomesDsnKeyword) {
    std::string longest(SQL_MAX_DSN_LENGTH, 'a');
    EXPECT_EQ(DsnResolver::resolve(longest, config), longest);

    std::string too_long(SQL_MAX_DSN_LENGTH + 1, 'a');
    EXPECT_EQ(DsnResolver::resolve(too_long, config), "DSN=" + too_long + ";");
}

TEST_F(DsnResolverTest, ResolveIsIdempotent) {
    const std::vector<std::string> inputs = {
        "MyDsn",
        "/var/db/x.fdb",
        "relative/x.fdb",
        std::string(SQL_MAX_DSN_LENGTH + 10, 'z'),
        "DSN=Foo;UID=bar",
        "weird;name",
        ""
    };
    for (const auto& input : inputs) {
        std::string once = DsnResolver::resolve(input, config);
        EXPECT_EQ(DsnResolver::resolve(once, config), once) << "input: " << input;
    }
}

TEST_F(DsnResolverTest, BuildAddsCredentials) {
    EXPECT_EQ(DsnResolver::build_connection_string("MyDsn", "sysdba", "masterkey"),
              "DSN=MyDsn;UID=sysdba;PWD=masterkey;");
    EXPECT_EQ(DsnResolver::build_connection_string("DBNAME=/x.fdb;", "", ""),
              "DBNAME=/x.fdb;");
}

TEST_F(DsnResolverTest, BuildKeepsExplicitCredentials) {
    EXPECT_EQ(DsnResolver::build_connection_string("DSN=x;uid=a;pwd=b", "other", "secret"),
              "DSN=x;uid=a;pwd=b;");
}

TEST_F(DsnResolverTest, BuildRespectsPasswordKeyword) {
    EXPECT_EQ(DsnResolver::build_connection_string("DSN=x;PASSWORD=b", "a", "secret"),
              "DSN=x;PASSWORD=b;UID=a;");
}

TEST_F(DsnResolverTest, BuildQuotesSpecialCharacters) {
    EXPECT_EQ(DsnResolver::build_connection_string("MyDsn", "u", "p;w}d"),
              "DSN=MyDsn;UID=u;PWD={p;w}}d};");
}

TEST_F(DsnResolverTest, RedactHidesPasswords) {
    std::string redacted = DsnResolver::redact("DSN=x;UID=a;PWD=secret;Password={s;e}}c};");
    EXPECT_EQ(redacted.find("secret"), std::string::npos);
    EXPECT_EQ(redacted.find("s;e"), std::string::npos);
    EXPECT_NE(redacted.find("PWD=***"), std::string::npos);
    EXPECT_NE(redacted.find("Password=***"), std::string::npos);
    EXPECT_NE(redacted.find("UID=a"), std::string::npos);
}

TEST_F(DsnResolverTest, RedactLeavesNamesAndPathsAlone) {
    EXPECT_EQ(DsnResolver::redact("MyFirebird"), "MyFirebird");
    EXPECT_EQ(DsnResolver::redact("/data/employee.fdb"), "/data/employee.fdb");
    EXPECT_EQ(DsnResolver::redact("DSN=x;PWD=y"), "DSN=x;PWD=***;");
}

TEST_F(DsnResolverTest, ParsePairsUnquotesBraces) {
    auto pairs = DsnResolver::parse_pairs("Driver={My; Driver};PWD={a}}b}");
    ASSERT_EQ(pairs.size(), 2u);
    EXPECT_EQ(pairs[0].first, "Driver");
    EXPECT_EQ(pairs[0].second, "My; Driver");
    EXPECT_EQ(pairs[1].second, "a}b");
}
