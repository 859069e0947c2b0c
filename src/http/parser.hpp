#pragma once

#include <llhttp.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "http.hpp"

namespace harbor::http {

/// Parse result
enum class ParseResult : uint8_t {
    Complete,      // Message fully parsed
    Incomplete,    // Need more data
    Error          // Parse error or limit exceeded
};

/// Incremental HTTP/1.x parser (wraps llhttp)
///
/// Data may arrive in arbitrary chunks; header names, values and bodies are
/// accumulated into the owned Request/Response. Parsing pauses after each
/// complete message so pipelined bytes are left unconsumed; call reset()
/// before parsing the next message.
class Parser {
public:
    Parser();
    ~Parser() = default;

    // Non-copyable, non-movable (llhttp keeps a pointer to the context)
    Parser(const Parser&) = delete;
    Parser& operator=(const Parser&) = delete;

    /// Feed request bytes. Returns the result and number of bytes consumed.
    [[nodiscard]] std::pair<ParseResult, size_t> parse_request(std::string_view data,
                                                               Request& request);

    /// Feed response bytes. Returns the result and number of bytes consumed.
    [[nodiscard]] std::pair<ParseResult, size_t> parse_response(std::string_view data,
                                                                Response& response);

    /// Signal end of stream; completes responses delimited by connection close
    [[nodiscard]] ParseResult finish();

    /// Response to a HEAD request: headers only, whatever Content-Length says
    void set_skip_body(bool skip) noexcept { skip_body_ = skip; }

    /// Limits; 0 disables the check
    void set_max_header_size(size_t bytes) noexcept { max_header_size_ = bytes; }
    void set_max_body_size(size_t bytes) noexcept { max_body_size_ = bytes; }

    /// Reset parser state for the next message
    void reset();

    /// True if the last error was a header or body size limit
    [[nodiscard]] bool limit_exceeded() const noexcept { return ctx_.limit_exceeded; }

    /// True once any byte of the current message has been seen
    [[nodiscard]] bool message_started() const noexcept { return ctx_.message_started; }

    /// Get last error message
    [[nodiscard]] std::string_view error_message() const noexcept;

    [[nodiscard]] llhttp_errno_t error_code() const noexcept { return ctx_.error; }

private:
    // llhttp callbacks
    static int on_message_begin(llhttp_t* parser);
    static int on_url(llhttp_t* parser, const char* at, size_t length);
    static int on_header_field(llhttp_t* parser, const char* at, size_t length);
    static int on_header_value(llhttp_t* parser, const char* at, size_t length);
    static int on_headers_complete(llhttp_t* parser);
    static int on_body(llhttp_t* parser, const char* at, size_t length);
    static int on_message_complete(llhttp_t* parser);

    [[nodiscard]] std::pair<ParseResult, size_t> execute(std::string_view data);
    void init(llhttp_type_t type);

    struct Context {
        Parser* owner = nullptr;
        Request* request = nullptr;
        Response* response = nullptr;

        std::string url;
        std::string field;
        std::string value;
        bool in_value = false;

        size_t header_bytes = 0;
        bool message_started = false;
        bool message_complete = false;
        bool limit_exceeded = false;
        llhttp_errno_t error = HPE_OK;

        void commit_header();
        size_t body_size() const;
    };

    llhttp_t parser_;
    llhttp_settings_t settings_;
    llhttp_type_t parser_type_ = HTTP_REQUEST;
    Context ctx_;

    bool skip_body_ = false;
    size_t max_header_size_ = 0;
    size_t max_body_size_ = 0;
};

/// Helper: parse a complete request held in one buffer
[[nodiscard]] std::optional<Request> parse_http_request(std::string_view data);

/// Split an origin-form or absolute-form request target into host/path/query
void split_request_target(std::string_view target, Request& request);

}  // namespace harbor::http
