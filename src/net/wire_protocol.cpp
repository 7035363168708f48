#include "pgwire/net/wire_protocol.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include "pgwire/error.hpp"
#include "pgwire/util/binary_io.hpp"
#include "pgwire/util/utf8.hpp"

/*
    wire format (protocol 3.0):
    - frame: [1 byte tag][4 bytes length][payload]
      startup-phase frames (RequestSsl, StartupMessage) have no tag byte
    - length counts itself plus the payload, never the tag
    - integers are big-endian, strings are null terminated
*/

namespace pgwire::net {

namespace {

constexpr uint32_t kAuthOk = 0;
constexpr uint32_t kAuthCleartextPassword = 3;
constexpr uint32_t kAuthSasl = 10;

using Bytes = std::vector<uint8_t>;

Bytes frame(std::optional<char> tag, const Bytes& payload) {
    Bytes result;
    result.reserve(1 + kLengthFieldSize + payload.size());
    if (tag) {
        result.push_back(static_cast<uint8_t>(*tag));
    }
    // derived from the assembled payload, never computed by hand
    util::write_uint32_be(result, static_cast<uint32_t>(payload.size()) + kLengthFieldSize);
    result.insert(result.end(), payload.begin(), payload.end());
    return result;
}

std::string utf8_string(const uint8_t* data, std::size_t len, const char* what) {
    std::string_view view(reinterpret_cast<const char*>(data), len);
    if (!util::is_valid_utf8(view)) {
        throw ParseError(std::string("invalid UTF-8 in ") + what);
    }
    return std::string(view);
}

// split on 0 bytes the way a string split does: "a\0b" -> {a, b}, "" -> {""}
std::vector<std::string> split_nul(const std::string& text) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        std::size_t pos = text.find('\0', start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

bool has_auth_code(const Bytes& payload, uint32_t code) {
    return payload.size() >= 4 && util::read_uint32_be(payload.data()) == code;
}

AuthenticationSasl parse_sasl(const Bytes& payload) {
    // [int32 10][name\0]...[name\0][\0]
    if (payload.size() < 6) {
        throw ParseError("SASL mechanism list is truncated");
    }
    std::string list = utf8_string(payload.data() + 4, payload.size() - 6, "SASL mechanisms");

    AuthenticationSasl sasl;
    if (!list.empty()) {
        sasl.mechanisms = split_nul(list);
    }
    return sasl;
}

ErrorResponse parse_error_response(const Bytes& payload) {
    // records: [code character][value\0], closed by a final \0
    if (payload.size() < 2) {
        throw ParseError("error response is truncated");
    }
    std::string body = utf8_string(payload.data(), payload.size() - 2, "error response");

    ErrorResponse response;
    for (const auto& record : split_nul(body)) {
        if (record.empty()) {
            response.fields[ErrorField::from_code(U'\0')] = "";
            continue;
        }
        // the body is valid UTF-8, so the code may be any character, not just one byte
        std::size_t code_length = 0;
        char32_t code = util::first_code_point(record, code_length);
        response.fields[ErrorField::from_code(code)] = record.substr(code_length);
    }
    return response;
}

BackendKeyData parse_backend_key_data(const Bytes& payload) {
    BackendKeyData key;
    key.process_id = util::read_uint32_be(payload.data());
    key.secret_key = util::read_int32_be(payload.data() + 4);
    return key;
}

ReadyForQuery parse_ready_for_query(const Bytes& payload) {
    ReadyForQuery ready;
    switch (payload[0]) {
        case 'I':
            ready.status = ReadyForQueryStatus::Idle;
            break;
        case 'T':
            ready.status = ReadyForQueryStatus::Transaction;
            break;
        case 'E':
            ready.status = ReadyForQueryStatus::FailedTransaction;
            break;
        default:
            throw ParseError("invalid ReadyForQuery status byte " +
                             std::to_string(static_cast<int>(payload[0])));
    }
    return ready;
}

ParameterStatus parse_parameter_status(const Bytes& payload) {
    // [name\0][value\0]
    auto sep = std::find(payload.begin(), payload.end(), uint8_t{0});
    if (sep == payload.end()) {
        throw ParseError("parameter status has no name terminator");
    }
    auto index = static_cast<std::size_t>(sep - payload.begin());
    if (index + 1 >= payload.size() || payload.back() != 0) {
        throw ParseError("parameter status value is not terminated");
    }

    ParameterStatus status;
    status.name = utf8_string(payload.data(), index, "parameter name");
    status.value =
        utf8_string(payload.data() + index + 1, payload.size() - index - 2, "parameter value");
    return status;
}

}  // namespace

Bytes WireProtocol::encode(const FrontendMessage& message) {
    return std::visit(
        [](const auto& msg) -> Bytes {
            using T = std::decay_t<decltype(msg)>;
            Bytes payload;

            if constexpr (std::is_same_v<T, RequestSsl>) {
                util::write_uint16_be(payload, kSslRequestCodeHigh);
                util::write_uint16_be(payload, kSslRequestCodeLow);
                util::write_cstring(payload, "");
                return frame(std::nullopt, payload);
            } else if constexpr (std::is_same_v<T, StartupMessage>) {
                util::write_uint16_be(payload, kProtocolVersionMajor);
                util::write_uint16_be(payload, kProtocolVersionMinor);
                util::write_cstring(payload, "user");
                util::write_cstring(payload, msg.user);
                util::write_cstring(payload, "database");
                util::write_cstring(payload, msg.database);
                util::write_cstring(payload, "");  // end of parameter list
                return frame(std::nullopt, payload);
            } else if constexpr (std::is_same_v<T, PasswordMessage>) {
                util::write_cstring(payload, msg.password);
                util::write_cstring(payload, "");
                return frame('p', payload);
            } else {
                util::write_cstring(payload, msg.query);
                return frame('Q', payload);
            }
        },
        message);
}

BackendMessage WireProtocol::decode(char tag, uint32_t length, const Bytes& payload) {
    if (length < kLengthFieldSize) {
        throw ParseError("length field " + std::to_string(length) + " is below the header size");
    }
    if (payload.size() != length - kLengthFieldSize) {
        throw ParseError("payload size does not match the length field");
    }

    switch (tag) {
        case 'R':
            if (length == 8 && has_auth_code(payload, kAuthCleartextPassword)) {
                return AuthenticationCleartextPassword{};
            }
            if (length == 8 && has_auth_code(payload, kAuthOk)) {
                return AuthenticationOk{};
            }
            if (has_auth_code(payload, kAuthSasl)) {
                return parse_sasl(payload);
            }
            break;  // md5, gss and friends stay unknown

        case 'E':
            return parse_error_response(payload);

        case 'K':
            if (length == 12) {
                return parse_backend_key_data(payload);
            }
            break;

        case 'Z':
            if (length == 5) {
                return parse_ready_for_query(payload);
            }
            break;

        case 'S':
            return parse_parameter_status(payload);

        default:
            break;
    }

    return UnknownMessage{tag, payload};
}

std::optional<BackendMessage> WireProtocol::decode(const Bytes& data, std::size_t& bytes_consumed) {
    // need the tag and the length first
    if (data.size() < 1 + kLengthFieldSize) {
        return std::nullopt;
    }

    uint32_t length = util::read_uint32_be(data.data() + 1);
    if (length < kLengthFieldSize) {
        throw ParseError("length field " + std::to_string(length) + " is below the header size");
    }
    if (data.size() - 1 < length) {
        return std::nullopt;
    }

    bytes_consumed = 1 + static_cast<std::size_t>(length);

    Bytes payload(data.begin() + 1 + kLengthFieldSize, data.begin() + bytes_consumed);
    return decode(static_cast<char>(data[0]), length, payload);
}

uint32_t WireProtocol::peek_message_length(const Bytes& data) {
    if (data.size() < 1 + kLengthFieldSize) {
        return 0;
    }
    return util::read_uint32_be(data.data() + 1);
}

}  // namespace pgwire::net
