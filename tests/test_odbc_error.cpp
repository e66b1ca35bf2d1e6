#include <gtest/gtest.h>
#include "core/odbc_error.hpp"

using namespace ibarrow::core;

namespace {

OdbcDiagnostic make_diag(const std::string& sqlstate, SQLINTEGER native, const std::string& message,
                         SQLSMALLINT record) {
    OdbcDiagnostic diag;
    diag.sqlstate = sqlstate;
    diag.native_error = native;
    diag.message = message;
    diag.record_number = record;
    return diag;
}

} // anonymous namespace

TEST(OdbcErrorTest, ConstructWithMessage) {
    OdbcError error("Test error");
    EXPECT_STREQ(error.what(), "Test error");
}

TEST(OdbcErrorTest, DiagnosticsEmpty) {
    OdbcError error("Test error");
    EXPECT_TRUE(error.diagnostics().empty());
    EXPECT_EQ(error.primary_sqlstate(), "");
    EXPECT_EQ(error.return_code(), SQL_ERROR);
}

TEST(OdbcErrorTest, FormatDiagnostics) {
    std::vector<OdbcDiagnostic> diags;
    diags.push_back(make_diag("08001", 12345, "Connection failed", 1));

    OdbcError error("Connection error", std::move(diags));

    std::string formatted = error.format_diagnostics();
    EXPECT_NE(formatted.find("08001"), std::string::npos);
    EXPECT_NE(formatted.find("12345"), std::string::npos);
    EXPECT_NE(formatted.find("Connection failed"), std::string::npos);
}

TEST(OdbcErrorTest, SqlstateQueries) {
    std::vector<OdbcDiagnostic> diags;
    diags.push_back(make_diag("01004", 0, "String data, right truncated", 1));
    diags.push_back(make_diag("HYT00", 0, "Timeout expired", 2));

    OdbcError error("SQLFetch", std::move(diags), SQL_ERROR);

    EXPECT_EQ(error.primary_sqlstate(), "01004");
    EXPECT_TRUE(error.has_sqlstate("HYT00"));
    EXPECT_FALSE(error.has_sqlstate("HYT01"));
    EXPECT_TRUE(error.has_sqlstate_class("HY"));
    EXPECT_TRUE(error.has_sqlstate_class("01"));
    EXPECT_FALSE(error.has_sqlstate_class("08"));
}

TEST(OdbcErrorTest, ReadDiagnosticsFromNullHandle) {
    EXPECT_TRUE(read_diagnostics(SQL_HANDLE_STMT, SQL_NULL_HANDLE).empty());
}

TEST(OdbcErrorTest, CheckResultAcceptsSuccess) {
    EXPECT_NO_THROW(check_odbc_result(SQL_SUCCESS, SQL_HANDLE_STMT, SQL_NULL_HANDLE, "noop"));
    EXPECT_NO_THROW(check_odbc_result(SQL_SUCCESS_WITH_INFO, SQL_HANDLE_STMT, SQL_NULL_HANDLE, "noop"));
}

TEST(OdbcErrorTest, CheckResultThrowsWithContext) {
    try {
        check_odbc_result(SQL_INVALID_HANDLE, SQL_HANDLE_STMT, SQL_NULL_HANDLE, "SQLExecute");
        FAIL() << "expected OdbcError";
    } catch (const OdbcError& e) {
        EXPECT_NE(std::string(e.what()).find("SQLExecute"), std::string::npos);
        EXPECT_EQ(e.return_code(), SQL_INVALID_HANDLE);
    }
}
