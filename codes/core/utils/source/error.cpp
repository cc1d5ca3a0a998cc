#include "utils/error.hpp"

namespace rpc_snoop {
namespace utils {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "SUCCESS";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::OUT_OF_RANGE: return "OUT_OF_RANGE";
        case ErrorCode::OPERATION_FAILED: return "OPERATION_FAILED";
        case ErrorCode::BUFFER_OVERFLOW: return "BUFFER_OVERFLOW";

        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::FILE_READ_ERROR: return "FILE_READ_ERROR";

        case ErrorCode::CONFIG_PARSE_ERROR: return "CONFIG_PARSE_ERROR";
        case ErrorCode::CONFIG_MISSING_REQUIRED: return "CONFIG_MISSING_REQUIRED";
        case ErrorCode::CONFIG_INVALID_VALUE: return "CONFIG_INVALID_VALUE";
        case ErrorCode::CONFIG_INVALID_PORT: return "CONFIG_INVALID_PORT";
        case ErrorCode::CONFIG_INVALID_LOG_LEVEL: return "CONFIG_INVALID_LOG_LEVEL";
        case ErrorCode::CONFIG_INVALID_URI: return "CONFIG_INVALID_URI";
        case ErrorCode::CONFIG_INVALID_SUPPRESS: return "CONFIG_INVALID_SUPPRESS";

        case ErrorCode::NETWORK_SOCKET_ERROR: return "NETWORK_SOCKET_ERROR";
        case ErrorCode::NETWORK_BIND_ERROR: return "NETWORK_BIND_ERROR";
        case ErrorCode::NETWORK_LISTEN_ERROR: return "NETWORK_LISTEN_ERROR";
        case ErrorCode::NETWORK_ACCEPT_ERROR: return "NETWORK_ACCEPT_ERROR";
        case ErrorCode::NETWORK_CONNECT_ERROR: return "NETWORK_CONNECT_ERROR";
        case ErrorCode::NETWORK_READ_ERROR: return "NETWORK_READ_ERROR";
        case ErrorCode::NETWORK_WRITE_ERROR: return "NETWORK_WRITE_ERROR";
        case ErrorCode::NETWORK_CLOSED: return "NETWORK_CLOSED";
        case ErrorCode::NETWORK_RESOLVE_ERROR: return "NETWORK_RESOLVE_ERROR";

        case ErrorCode::TLS_INIT_ERROR: return "TLS_INIT_ERROR";
        case ErrorCode::TLS_HANDSHAKE_ERROR: return "TLS_HANDSHAKE_ERROR";
        case ErrorCode::TLS_READ_ERROR: return "TLS_READ_ERROR";
        case ErrorCode::TLS_WRITE_ERROR: return "TLS_WRITE_ERROR";

        case ErrorCode::PROTOCOL_INVALID_HEADER: return "PROTOCOL_INVALID_HEADER";
        case ErrorCode::PROTOCOL_BODY_TOO_LARGE: return "PROTOCOL_BODY_TOO_LARGE";
        case ErrorCode::PROTOCOL_INVALID_URI: return "PROTOCOL_INVALID_URI";
        case ErrorCode::PROTOCOL_INVALID_START_LINE: return "PROTOCOL_INVALID_START_LINE";
        case ErrorCode::PROTOCOL_INVALID_CHUNK: return "PROTOCOL_INVALID_CHUNK";
        case ErrorCode::PROTOCOL_INCOMPLETE_MESSAGE: return "PROTOCOL_INCOMPLETE_MESSAGE";

        default: return "UNKNOWN_ERROR_CODE";
    }
}

const char* error_code_to_description(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "Operation completed successfully";
        case ErrorCode::UNKNOWN_ERROR: return "An unknown error occurred";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::OUT_OF_RANGE: return "Out of range";
        case ErrorCode::OPERATION_FAILED: return "Operation failed";
        case ErrorCode::BUFFER_OVERFLOW: return "Buffer overflow";

        case ErrorCode::FILE_NOT_FOUND: return "File not found";
        case ErrorCode::FILE_READ_ERROR: return "File read error";

        case ErrorCode::CONFIG_PARSE_ERROR: return "Config parse error";
        case ErrorCode::CONFIG_MISSING_REQUIRED: return "Missing required config";
        case ErrorCode::CONFIG_INVALID_VALUE: return "Invalid config value";
        case ErrorCode::CONFIG_INVALID_PORT: return "Invalid port number";
        case ErrorCode::CONFIG_INVALID_LOG_LEVEL: return "Invalid log level";
        case ErrorCode::CONFIG_INVALID_URI: return "Invalid endpoint URI";
        case ErrorCode::CONFIG_INVALID_SUPPRESS: return "Invalid suppress value";

        case ErrorCode::NETWORK_SOCKET_ERROR: return "Socket error";
        case ErrorCode::NETWORK_BIND_ERROR: return "Bind error";
        case ErrorCode::NETWORK_LISTEN_ERROR: return "Listen error";
        case ErrorCode::NETWORK_ACCEPT_ERROR: return "Accept error";
        case ErrorCode::NETWORK_CONNECT_ERROR: return "Connect error";
        case ErrorCode::NETWORK_READ_ERROR: return "Network read error";
        case ErrorCode::NETWORK_WRITE_ERROR: return "Network write error";
        case ErrorCode::NETWORK_CLOSED: return "Connection closed";
        case ErrorCode::NETWORK_RESOLVE_ERROR: return "Host resolution failed";

        case ErrorCode::TLS_INIT_ERROR: return "TLS init error";
        case ErrorCode::TLS_HANDSHAKE_ERROR: return "TLS handshake error";
        case ErrorCode::TLS_READ_ERROR: return "TLS read error";
        case ErrorCode::TLS_WRITE_ERROR: return "TLS write error";

        case ErrorCode::PROTOCOL_INVALID_HEADER: return "Invalid HTTP header";
        case ErrorCode::PROTOCOL_BODY_TOO_LARGE: return "HTTP body too large";
        case ErrorCode::PROTOCOL_INVALID_URI: return "Invalid URI";
        case ErrorCode::PROTOCOL_INVALID_START_LINE: return "Invalid HTTP start line";
        case ErrorCode::PROTOCOL_INVALID_CHUNK: return "Invalid chunked encoding";
        case ErrorCode::PROTOCOL_INCOMPLETE_MESSAGE: return "Incomplete HTTP message";

        default: return "Unknown error";
    }
}

} // namespace utils
} // namespace rpc_snoop
