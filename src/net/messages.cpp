#include "pgwire/net/messages.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace pgwire::net {

namespace {

struct FieldCode {
    char32_t code;
    ErrorFieldKind kind;
};

constexpr FieldCode kFieldCodes[] = {
    {'S', ErrorFieldKind::LocalizedSeverity},
    {'V', ErrorFieldKind::Severity},
    {'C', ErrorFieldKind::Code},
    {'M', ErrorFieldKind::Message},
    {'D', ErrorFieldKind::Detail},
    {'H', ErrorFieldKind::Hint},
    {'P', ErrorFieldKind::Position},
    {'p', ErrorFieldKind::InternalPosition},
    {'q', ErrorFieldKind::InternalQuery},
    {'W', ErrorFieldKind::Where},
    {'s', ErrorFieldKind::SchemaName},
    {'t', ErrorFieldKind::TableName},
    {'c', ErrorFieldKind::ColumnName},
    {'d', ErrorFieldKind::DataTypeName},
    {'n', ErrorFieldKind::ConstraintName},
    {'F', ErrorFieldKind::File},
    {'L', ErrorFieldKind::Line},
    {'R', ErrorFieldKind::Routine},
};

std::string quoted(const std::string& s) {
    return "\"" + s + "\"";
}

std::string field_name(const ErrorField& field) {
    if (field.kind() == ErrorFieldKind::Unknown) {
        return "Unknown(" + std::to_string(static_cast<uint32_t>(field.code())) + ")";
    }
    return std::string(to_string(field.kind()));
}

// 'T' for printable tags, 0x1f style otherwise, so control bytes never reach the log
std::string printable_tag(char tag) {
    auto byte = static_cast<unsigned char>(tag);
    if (std::isprint(byte)) {
        return std::string("'") + tag + "'";
    }
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    return oss.str();
}

}  // namespace

ErrorField ErrorField::from_code(char32_t code) {
    for (const auto& entry : kFieldCodes) {
        if (entry.code == code) {
            return ErrorField(entry.kind, code);
        }
    }
    return ErrorField(ErrorFieldKind::Unknown, code);
}

ErrorField ErrorField::known(ErrorFieldKind kind) {
    for (const auto& entry : kFieldCodes) {
        if (entry.kind == kind) {
            return ErrorField(kind, entry.code);
        }
    }
    return ErrorField(ErrorFieldKind::Unknown, '\0');
}

std::optional<std::string> ErrorResponse::field(ErrorFieldKind kind) const {
    auto it = fields.find(ErrorField::known(kind));
    if (it == fields.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string_view to_string(ReadyForQueryStatus status) {
    switch (status) {
        case ReadyForQueryStatus::Idle:
            return "Idle";
        case ReadyForQueryStatus::Transaction:
            return "Transaction";
        case ReadyForQueryStatus::FailedTransaction:
            return "FailedTransaction";
    }
    return "?";
}

std::string_view to_string(ErrorFieldKind kind) {
    switch (kind) {
        case ErrorFieldKind::LocalizedSeverity:
            return "LocalizedSeverity";
        case ErrorFieldKind::Severity:
            return "Severity";
        case ErrorFieldKind::Code:
            return "Code";
        case ErrorFieldKind::Message:
            return "Message";
        case ErrorFieldKind::Detail:
            return "Detail";
        case ErrorFieldKind::Hint:
            return "Hint";
        case ErrorFieldKind::Position:
            return "Position";
        case ErrorFieldKind::InternalPosition:
            return "InternalPosition";
        case ErrorFieldKind::InternalQuery:
            return "InternalQuery";
        case ErrorFieldKind::Where:
            return "Where";
        case ErrorFieldKind::SchemaName:
            return "SchemaName";
        case ErrorFieldKind::TableName:
            return "TableName";
        case ErrorFieldKind::ColumnName:
            return "ColumnName";
        case ErrorFieldKind::DataTypeName:
            return "DataTypeName";
        case ErrorFieldKind::ConstraintName:
            return "ConstraintName";
        case ErrorFieldKind::File:
            return "File";
        case ErrorFieldKind::Line:
            return "Line";
        case ErrorFieldKind::Routine:
            return "Routine";
        case ErrorFieldKind::Unknown:
            return "Unknown";
    }
    return "?";
}

std::string describe(const FrontendMessage& message) {
    return std::visit(
        [](const auto& msg) -> std::string {
            using T = std::decay_t<decltype(msg)>;
            if constexpr (std::is_same_v<T, RequestSsl>) {
                return "RequestSsl";
            } else if constexpr (std::is_same_v<T, StartupMessage>) {
                return "StartupMessage { user: " + quoted(msg.user) +
                       ", database: " + quoted(msg.database) + " }";
            } else if constexpr (std::is_same_v<T, PasswordMessage>) {
                return "PasswordMessage { password: ******** }";
            } else {
                return "SimpleQuery { query: " + quoted(msg.query) + " }";
            }
        },
        message);
}

std::string describe(const BackendMessage& message) {
    return std::visit(
        [](const auto& msg) -> std::string {
            using T = std::decay_t<decltype(msg)>;
            std::ostringstream oss;
            if constexpr (std::is_same_v<T, AuthenticationOk>) {
                oss << "AuthenticationOk";
            } else if constexpr (std::is_same_v<T, AuthenticationCleartextPassword>) {
                oss << "AuthenticationCleartextPassword";
            } else if constexpr (std::is_same_v<T, AuthenticationSasl>) {
                oss << "AuthenticationSasl { mechanisms: [";
                for (size_t i = 0; i < msg.mechanisms.size(); ++i) {
                    oss << (i ? ", " : "") << quoted(msg.mechanisms[i]);
                }
                oss << "] }";
            } else if constexpr (std::is_same_v<T, ErrorResponse>) {
                // map order is unspecified, sort by code so log lines are stable
                std::vector<std::pair<ErrorField, std::string>> sorted(msg.fields.begin(),
                                                                       msg.fields.end());
                std::sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
                    return a.first.code() < b.first.code();
                });
                oss << "ErrorResponse {";
                for (size_t i = 0; i < sorted.size(); ++i) {
                    oss << (i ? ", " : " ") << field_name(sorted[i].first) << ": "
                        << quoted(sorted[i].second);
                }
                oss << " }";
            } else if constexpr (std::is_same_v<T, BackendKeyData>) {
                oss << "BackendKeyData { process_id: " << msg.process_id
                    << ", secret_key: " << msg.secret_key << " }";
            } else if constexpr (std::is_same_v<T, ReadyForQuery>) {
                oss << "ReadyForQuery { status: " << to_string(msg.status) << " }";
            } else if constexpr (std::is_same_v<T, ParameterStatus>) {
                oss << "ParameterStatus { name: " << quoted(msg.name)
                    << ", value: " << quoted(msg.value) << " }";
            } else {
                oss << "Unknown { prefix: " << printable_tag(msg.prefix)
                    << ", payload: " << msg.payload.size() << " bytes }";
            }
            return oss.str();
        },
        message);
}

}  // namespace pgwire::net
