#ifndef PGWIRE_NET_MESSAGES_HPP
#define PGWIRE_NET_MESSAGES_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace pgwire::net {

// ---------------------------------------------------------------------------
// frontend messages (client -> server)
// ---------------------------------------------------------------------------

// asks the server whether it accepts TLS. untagged, sent before anything else
struct RequestSsl {};

// protocol 3.0 startup with the user and database parameters. untagged
struct StartupMessage {
    std::string user;
    std::string database;
};

// answer to AuthenticationCleartextPassword, tag 'p'
struct PasswordMessage {
    std::string password;
};

// simple query protocol, tag 'Q'
struct SimpleQuery {
    std::string query;
};

using FrontendMessage = std::variant<RequestSsl, StartupMessage, PasswordMessage, SimpleQuery>;

// ---------------------------------------------------------------------------
// backend messages (server -> client)
// ---------------------------------------------------------------------------

enum class ReadyForQueryStatus : char {
    Idle = 'I',
    Transaction = 'T',
    FailedTransaction = 'E',
};

// https://www.postgresql.org/docs/current/protocol-error-fields.html
enum class ErrorFieldKind {
    LocalizedSeverity,  // S
    Severity,           // V
    Code,               // C
    Message,            // M
    Detail,             // D
    Hint,               // H
    Position,           // P
    InternalPosition,   // p
    InternalQuery,      // q
    Where,              // W
    SchemaName,         // s
    TableName,          // t
    ColumnName,         // c
    DataTypeName,       // d
    ConstraintName,     // n
    File,               // F
    Line,               // L
    Routine,            // R
    Unknown,
};

/*
    one field code of an ErrorResponse record.
    the code is the first character of the record, a full code point.
    known codes map to exactly one kind; anything else is kept as Unknown with its raw code,
    so two unknown fields with different codes stay distinct map keys.
*/
class ErrorField {
   public:
    static ErrorField from_code(char32_t code);
    static ErrorField known(ErrorFieldKind kind);

    [[nodiscard]] ErrorFieldKind kind() const noexcept {
        return kind_;
    }
    [[nodiscard]] char32_t code() const noexcept {
        return code_;
    }

    bool operator==(const ErrorField& other) const noexcept {
        return kind_ == other.kind_ && code_ == other.code_;
    }
    bool operator!=(const ErrorField& other) const noexcept {
        return !(*this == other);
    }

   private:
    ErrorField(ErrorFieldKind kind, char32_t code) : kind_(kind), code_(code) {}

    ErrorFieldKind kind_;
    char32_t code_;
};

}  // namespace pgwire::net

namespace std {
template <>
struct hash<pgwire::net::ErrorField> {
    size_t operator()(const pgwire::net::ErrorField& field) const noexcept {
        return hash<char32_t>{}(field.code());
    }
};
}  // namespace std

namespace pgwire::net {

struct AuthenticationOk {};

struct AuthenticationCleartextPassword {};

// only the mechanism names are decoded; the SASL exchange itself is not implemented
struct AuthenticationSasl {
    std::vector<std::string> mechanisms;
};

struct ErrorResponse {
    std::unordered_map<ErrorField, std::string> fields;

    [[nodiscard]] std::optional<std::string> field(ErrorFieldKind kind) const;
};

struct BackendKeyData {
    uint32_t process_id = 0;
    int32_t secret_key = 0;
};

struct ReadyForQuery {
    ReadyForQueryStatus status = ReadyForQueryStatus::Idle;
};

struct ParameterStatus {
    std::string name;
    std::string value;
};

// any tag this client does not interpret, kept verbatim
struct UnknownMessage {
    char prefix = 0;
    std::vector<uint8_t> payload;
};

using BackendMessage =
    std::variant<AuthenticationOk, AuthenticationCleartextPassword, AuthenticationSasl,
                 ErrorResponse, BackendKeyData, ReadyForQuery, ParameterStatus, UnknownMessage>;

[[nodiscard]] std::string_view to_string(ReadyForQueryStatus status);
[[nodiscard]] std::string_view to_string(ErrorFieldKind kind);

// one-line rendering for logs. passwords are masked
[[nodiscard]] std::string describe(const FrontendMessage& message);
[[nodiscard]] std::string describe(const BackendMessage& message);

}  // namespace pgwire::net

#endif
