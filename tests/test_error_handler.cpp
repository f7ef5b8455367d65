#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "ErrorHandler.hpp"

using namespace dbbridge;

class ErrorHandlerTest : public ::testing::Test {
};

// Transport error detection
TEST_F(ErrorHandlerTest, ResetByPeerIsTransportError) {
    EXPECT_TRUE(ErrorHandler::isTransportError("read failed: Connection reset by peer"));
}

TEST_F(ErrorHandlerTest, BrokenPipeIsTransportError) {
    EXPECT_TRUE(ErrorHandler::isTransportError("write: Broken pipe"));
}

TEST_F(ErrorHandlerTest, PostgresServerClosedIsTransportError) {
    EXPECT_TRUE(ErrorHandler::isTransportError(
        "server closed the connection unexpectedly\n\tThis probably means the server terminated abnormally"));
    EXPECT_TRUE(ErrorHandler::isTransportError("no connection to the server"));
}

TEST_F(ErrorHandlerTest, RefusedAndClosedAreTransportErrors) {
    EXPECT_TRUE(ErrorHandler::isTransportError("Connection refused"));
    EXPECT_TRUE(ErrorHandler::isTransportError("Server closed the connection"));
    EXPECT_TRUE(ErrorHandler::isTransportError("connection closed"));
    EXPECT_TRUE(ErrorHandler::isTransportError("lost synchronization with server: got message type \"x\""));
}

TEST_F(ErrorHandlerTest, StatementErrorsAreNotTransportErrors) {
    EXPECT_FALSE(ErrorHandler::isTransportError("relation \"users\" does not exist"));
    EXPECT_FALSE(ErrorHandler::isTransportError("syntax error at or near \"SELEC\""));
    EXPECT_FALSE(ErrorHandler::isTransportError("WRONGTYPE Operation against a key holding the wrong kind of value"));
    EXPECT_FALSE(ErrorHandler::isTransportError(""));
}

// Classification
TEST_F(ErrorHandlerTest, KindOfCoreErrors) {
    EXPECT_EQ(ErrorHandler::kindOf(ConnectionError("x")), ErrorKind::Connection);
    EXPECT_EQ(ErrorHandler::kindOf(QueryError("x")), ErrorKind::Query);
    EXPECT_EQ(ErrorHandler::kindOf(ValidationError("x")), ErrorKind::Validation);
    EXPECT_EQ(ErrorHandler::kindOf(TimeoutError("x")), ErrorKind::Timeout);
    EXPECT_EQ(ErrorHandler::kindOf(UnsupportedOperationError("x")), ErrorKind::Unsupported);
}

TEST_F(ErrorHandlerTest, KindOfForeignExceptionIsInternal) {
    EXPECT_EQ(ErrorHandler::kindOf(std::runtime_error("x")), ErrorKind::Internal);
    EXPECT_EQ(ErrorHandler::kindOf(std::out_of_range("x")), ErrorKind::Internal);
}

TEST_F(ErrorHandlerTest, KindNames) {
    EXPECT_STREQ(ErrorHandler::toString(ErrorKind::Connection), "ConnectionError");
    EXPECT_STREQ(ErrorHandler::toString(ErrorKind::Query), "QueryError");
    EXPECT_STREQ(ErrorHandler::toString(ErrorKind::Validation), "ValidationError");
    EXPECT_STREQ(ErrorHandler::toString(ErrorKind::Timeout), "TimeoutError");
    EXPECT_STREQ(ErrorHandler::toString(ErrorKind::Unsupported), "UnsupportedOperationError");
    EXPECT_STREQ(ErrorHandler::toString(ErrorKind::Internal), "InternalError");
}

// ErrorContext tests
class ErrorContextTest : public ::testing::Test {
};

TEST_F(ErrorContextTest, SetAndGetContext) {
    EXPECT_TRUE(ErrorContext::current().empty());

    {
        ErrorContext ctx("list_tables");
        EXPECT_EQ(ErrorContext::current(), "list_tables");
    }

    EXPECT_TRUE(ErrorContext::current().empty());
}

TEST_F(ErrorContextTest, NestedContext) {
    {
        ErrorContext ctx1("level1");
        EXPECT_EQ(ErrorContext::current(), "level1");

        {
            ErrorContext ctx2("level2");
            EXPECT_EQ(ErrorContext::current(), "level1 > level2");

            {
                ErrorContext ctx3("level3");
                EXPECT_EQ(ErrorContext::current(), "level1 > level2 > level3");
            }

            EXPECT_EQ(ErrorContext::current(), "level1 > level2");
        }

        EXPECT_EQ(ErrorContext::current(), "level1");
    }

    EXPECT_TRUE(ErrorContext::current().empty());
}

TEST_F(ErrorContextTest, ContextRestoredOnException) {
    try {
        ErrorContext ctx1("outer");
        {
            ErrorContext ctx2("inner");
            throw QueryError("test");
        }
    } catch (const QueryError& e) {
        EXPECT_STREQ(e.what(), "test");
    }

    EXPECT_TRUE(ErrorContext::current().empty());
}

// Exception hierarchy tests
class DatabaseErrorTest : public ::testing::Test {
};

TEST_F(DatabaseErrorTest, CarriesKindAndMessage) {
    ConnectionError ex("Connection refused");

    EXPECT_EQ(ex.kind(), ErrorKind::Connection);
    EXPECT_STREQ(ex.what(), "Connection refused");
}

TEST_F(DatabaseErrorTest, CanBeCaughtAsDatabaseError) {
    bool caught = false;

    try {
        throw UnsupportedOperationError("Key operations require a Redis connection");
    } catch (const DatabaseError& ex) {
        caught = true;
        EXPECT_EQ(ex.kind(), ErrorKind::Unsupported);
    }

    EXPECT_TRUE(caught);
}

TEST_F(DatabaseErrorTest, CanBeCaughtAsRuntimeError) {
    bool caught = false;

    try {
        throw ValidationError("test");
    } catch (const std::runtime_error& ex) {
        caught = true;
    }

    EXPECT_TRUE(caught);
}
