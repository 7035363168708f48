#include "pgwire/net/messages.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

namespace pgwire::net::test {

TEST(ErrorFieldTest, KnownCodes) {
    const std::vector<std::pair<char, ErrorFieldKind>> table = {
        {'S', ErrorFieldKind::LocalizedSeverity}, {'V', ErrorFieldKind::Severity},
        {'C', ErrorFieldKind::Code},              {'M', ErrorFieldKind::Message},
        {'D', ErrorFieldKind::Detail},            {'H', ErrorFieldKind::Hint},
        {'P', ErrorFieldKind::Position},          {'p', ErrorFieldKind::InternalPosition},
        {'q', ErrorFieldKind::InternalQuery},     {'W', ErrorFieldKind::Where},
        {'s', ErrorFieldKind::SchemaName},        {'t', ErrorFieldKind::TableName},
        {'c', ErrorFieldKind::ColumnName},        {'d', ErrorFieldKind::DataTypeName},
        {'n', ErrorFieldKind::ConstraintName},    {'F', ErrorFieldKind::File},
        {'L', ErrorFieldKind::Line},              {'R', ErrorFieldKind::Routine},
    };

    for (const auto& [code, kind] : table) {
        auto field = ErrorField::from_code(code);
        EXPECT_EQ(field.kind(), kind) << "code " << code;
        EXPECT_EQ(field.code(), code);
        EXPECT_EQ(ErrorField::known(kind), field);
    }
}

TEST(ErrorFieldTest, UnknownCodeKeepsRawByte) {
    auto x = ErrorField::from_code('X');
    auto z = ErrorField::from_code('Z');

    EXPECT_EQ(x.kind(), ErrorFieldKind::Unknown);
    EXPECT_EQ(x.code(), 'X');
    EXPECT_NE(x, z);
    EXPECT_EQ(x, ErrorField::from_code('X'));
}

TEST(ErrorFieldTest, NonAsciiCodeIsUnknown) {
    auto field = ErrorField::from_code(U'\u00E9');

    EXPECT_EQ(field.kind(), ErrorFieldKind::Unknown);
    EXPECT_EQ(field.code(), U'\u00E9');

    ErrorResponse error;
    error.fields[field] = "value";
    EXPECT_EQ(describe(BackendMessage{error}), "ErrorResponse { Unknown(233): \"value\" }");
}

TEST(ErrorFieldTest, CaseMatters) {
    EXPECT_EQ(ErrorField::from_code('P').kind(), ErrorFieldKind::Position);
    EXPECT_EQ(ErrorField::from_code('p').kind(), ErrorFieldKind::InternalPosition);
    EXPECT_EQ(ErrorField::from_code('S').kind(), ErrorFieldKind::LocalizedSeverity);
    EXPECT_EQ(ErrorField::from_code('s').kind(), ErrorFieldKind::SchemaName);
}

TEST(ErrorResponseTest, FieldLookup) {
    ErrorResponse error;
    error.fields[ErrorField::from_code('C')] = "28P01";
    error.fields[ErrorField::from_code('M')] = "password authentication failed";

    EXPECT_EQ(error.field(ErrorFieldKind::Code), "28P01");
    EXPECT_EQ(error.field(ErrorFieldKind::Message), "password authentication failed");
    EXPECT_FALSE(error.field(ErrorFieldKind::Hint).has_value());
}

TEST(DescribeTest, FrontendMessages) {
    EXPECT_EQ(describe(FrontendMessage{RequestSsl{}}), "RequestSsl");
    EXPECT_EQ(describe(FrontendMessage{StartupMessage{"alice", "inventory"}}),
              "StartupMessage { user: \"alice\", database: \"inventory\" }");
    EXPECT_EQ(describe(FrontendMessage{SimpleQuery{"SELECT 1;"}}),
              "SimpleQuery { query: \"SELECT 1;\" }");
}

TEST(DescribeTest, PasswordIsMasked) {
    auto line = describe(FrontendMessage{PasswordMessage{"hunter2"}});

    EXPECT_EQ(line.find("hunter2"), std::string::npos);
    EXPECT_NE(line.find("PasswordMessage"), std::string::npos);
}

TEST(DescribeTest, BackendMessages) {
    EXPECT_EQ(describe(BackendMessage{AuthenticationOk{}}), "AuthenticationOk");
    EXPECT_EQ(describe(BackendMessage{AuthenticationSasl{{"SCRAM-SHA-256", "SCRAM-SHA-256-PLUS"}}}),
              "AuthenticationSasl { mechanisms: [\"SCRAM-SHA-256\", \"SCRAM-SHA-256-PLUS\"] }");
    EXPECT_EQ(describe(BackendMessage{BackendKeyData{12345, -2}}),
              "BackendKeyData { process_id: 12345, secret_key: -2 }");
    EXPECT_EQ(describe(BackendMessage{ReadyForQuery{ReadyForQueryStatus::FailedTransaction}}),
              "ReadyForQuery { status: FailedTransaction }");
    EXPECT_EQ(describe(BackendMessage{ParameterStatus{"TimeZone", "UTC"}}),
              "ParameterStatus { name: \"TimeZone\", value: \"UTC\" }");
    EXPECT_EQ(describe(BackendMessage{UnknownMessage{'T', {0x00, 0x01}}}),
              "Unknown { prefix: 'T', payload: 2 bytes }");
}

TEST(DescribeTest, UnprintableUnknownTagIsEscaped) {
    EXPECT_EQ(describe(BackendMessage{UnknownMessage{'\0', {}}}),
              "Unknown { prefix: 0x00, payload: 0 bytes }");
    EXPECT_EQ(describe(BackendMessage{UnknownMessage{'\n', {0x01}}}),
              "Unknown { prefix: 0x0a, payload: 1 bytes }");
    EXPECT_EQ(describe(BackendMessage{UnknownMessage{static_cast<char>(0xFF), {}}}),
              "Unknown { prefix: 0xff, payload: 0 bytes }");
}

TEST(DescribeTest, ErrorFieldsSortedByCode) {
    ErrorResponse error;
    error.fields[ErrorField::from_code('M')] = "boom";
    error.fields[ErrorField::from_code('C')] = "XX000";
    error.fields[ErrorField::from_code('X')] = "?";

    EXPECT_EQ(describe(BackendMessage{error}),
              "ErrorResponse { Code: \"XX000\", Message: \"boom\", Unknown(88): \"?\" }");
}

TEST(MessagesTest, StatusNames) {
    EXPECT_EQ(to_string(ReadyForQueryStatus::Idle), "Idle");
    EXPECT_EQ(to_string(ReadyForQueryStatus::Transaction), "Transaction");
    EXPECT_EQ(to_string(ErrorFieldKind::InternalQuery), "InternalQuery");
}

}  // namespace pgwire::net::test
