// Harbor HTTP Parser - Implementation

#include "parser.hpp"

namespace harbor::http {

Parser::Parser() {
    llhttp_settings_init(&settings_);

    settings_.on_message_begin = on_message_begin;
    settings_.on_url = on_url;
    settings_.on_header_field = on_header_field;
    settings_.on_header_value = on_header_value;
    settings_.on_headers_complete = on_headers_complete;
    settings_.on_body = on_body;
    settings_.on_message_complete = on_message_complete;

    init(HTTP_REQUEST);
}

void Parser::init(llhttp_type_t type) {
    llhttp_init(&parser_, type, &settings_);
    parser_type_ = type;
    ctx_ = Context{};
    ctx_.owner = this;
    parser_.data = &ctx_;
}

std::pair<ParseResult, size_t> Parser::parse_request(std::string_view data, Request& request) {
    if (parser_type_ != HTTP_REQUEST) {
        init(HTTP_REQUEST);
    }
    ctx_.request = &request;
    ctx_.response = nullptr;
    return execute(data);
}

std::pair<ParseResult, size_t> Parser::parse_response(std::string_view data, Response& response) {
    if (parser_type_ != HTTP_RESPONSE) {
        init(HTTP_RESPONSE);
    }
    ctx_.request = nullptr;
    ctx_.response = &response;
    return execute(data);
}

std::pair<ParseResult, size_t> Parser::execute(std::string_view data) {
    if (ctx_.message_complete) {
        return {ParseResult::Complete, 0};
    }

    llhttp_errno_t err = llhttp_execute(&parser_, data.data(), data.size());

    size_t consumed = data.size();

    if (err == HPE_PAUSED) {
        // Paused by on_message_complete: bytes after the message stay unconsumed
        const char* pos = llhttp_get_error_pos(&parser_);
        if (pos) {
            consumed = static_cast<size_t>(pos - data.data());
        }
        return {ParseResult::Complete, consumed};
    }

    if (err != HPE_OK) {
        const char* pos = llhttp_get_error_pos(&parser_);
        if (pos) {
            consumed = static_cast<size_t>(pos - data.data());
        }
        ctx_.error = err;
        return {ParseResult::Error, consumed};
    }

    if (ctx_.message_complete) {
        return {ParseResult::Complete, consumed};
    }
    return {ParseResult::Incomplete, consumed};
}

ParseResult Parser::finish() {
    if (ctx_.message_complete) {
        return ParseResult::Complete;
    }

    llhttp_errno_t err = llhttp_finish(&parser_);
    if (ctx_.message_complete) {
        return ParseResult::Complete;
    }
    if (err != HPE_OK) {
        ctx_.error = err;
        return ParseResult::Error;
    }
    // Stream ended between messages or mid-headers
    return ctx_.message_started ? ParseResult::Error : ParseResult::Incomplete;
}

void Parser::reset() {
    init(parser_type_);
}

std::string_view Parser::error_message() const noexcept {
    if (ctx_.limit_exceeded) {
        return "size limit exceeded";
    }
    if (ctx_.error == HPE_OK) {
        return "";
    }
    return llhttp_errno_name(ctx_.error);
}

// Context helpers

void Parser::Context::commit_header() {
    if (field.empty()) {
        return;
    }
    Header header{std::move(field), std::move(value)};
    if (request) {
        request->headers.push_back(std::move(header));
    } else if (response) {
        response->headers.push_back(std::move(header));
    }
    field.clear();
    value.clear();
    in_value = false;
}

size_t Parser::Context::body_size() const {
    if (request) return request->body.size();
    if (response) return response->body.size();
    return 0;
}

// Callbacks

int Parser::on_message_begin(llhttp_t* parser) {
    auto* ctx = static_cast<Context*>(parser->data);
    ctx->message_started = true;
    ctx->message_complete = false;
    ctx->error = HPE_OK;
    return 0;
}

int Parser::on_url(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request) return -1;

    ctx->header_bytes += length;
    size_t limit = ctx->owner->max_header_size_;
    if (limit > 0 && ctx->header_bytes > limit) {
        ctx->limit_exceeded = true;
        return -1;
    }

    ctx->url.append(at, length);
    return 0;
}

int Parser::on_header_field(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request && !ctx->response) return -1;

    // A field after a value starts a new header; otherwise it is a continuation chunk
    if (ctx->in_value) {
        ctx->commit_header();
    }

    ctx->header_bytes += length;
    size_t limit = ctx->owner->max_header_size_;
    if (limit > 0 && ctx->header_bytes > limit) {
        ctx->limit_exceeded = true;
        return -1;
    }

    ctx->field.append(at, length);
    return 0;
}

int Parser::on_header_value(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request && !ctx->response) return -1;

    ctx->header_bytes += length;
    size_t limit = ctx->owner->max_header_size_;
    if (limit > 0 && ctx->header_bytes > limit) {
        ctx->limit_exceeded = true;
        return -1;
    }

    ctx->value.append(at, length);
    ctx->in_value = true;
    return 0;
}

int Parser::on_headers_complete(llhttp_t* parser) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request && !ctx->response) return -1;

    ctx->commit_header();

    Version version = Version::UNKNOWN;
    if (parser->http_major == 1 && parser->http_minor == 0) {
        version = Version::HTTP_1_0;
    } else if (parser->http_major == 1 && parser->http_minor == 1) {
        version = Version::HTTP_1_1;
    }

    if (ctx->request) {
        switch (llhttp_get_method(parser)) {
            case HTTP_GET: ctx->request->method = Method::GET; break;
            case HTTP_POST: ctx->request->method = Method::POST; break;
            case HTTP_PUT: ctx->request->method = Method::PUT; break;
            case HTTP_DELETE: ctx->request->method = Method::DELETE; break;
            case HTTP_HEAD: ctx->request->method = Method::HEAD; break;
            case HTTP_OPTIONS: ctx->request->method = Method::OPTIONS; break;
            case HTTP_PATCH: ctx->request->method = Method::PATCH; break;
            case HTTP_CONNECT: ctx->request->method = Method::CONNECT; break;
            case HTTP_TRACE: ctx->request->method = Method::TRACE; break;
            default: ctx->request->method = Method::UNKNOWN; break;
        }
        ctx->request->version = version;

        split_request_target(ctx->url, *ctx->request);
        if (ctx->request->host.empty()) {
            ctx->request->host = std::string(ctx->request->get_header("Host"));
        }
        return 0;
    }

    ctx->response->status = static_cast<StatusCode>(parser->status_code);
    ctx->response->version = version;

    // 1 tells llhttp the response has no body
    return ctx->owner->skip_body_ ? 1 : 0;
}

int Parser::on_body(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request && !ctx->response) return -1;

    size_t limit = ctx->owner->max_body_size_;
    if (limit > 0 && ctx->body_size() + length > limit) {
        ctx->limit_exceeded = true;
        return -1;
    }

    if (ctx->request) {
        ctx->request->body.append(at, length);
    } else {
        ctx->response->body.append(at, length);
    }
    return 0;
}

int Parser::on_message_complete(llhttp_t* parser) {
    auto* ctx = static_cast<Context*>(parser->data);
    ctx->message_complete = true;
    return HPE_PAUSED;
}

// Free helpers

void split_request_target(std::string_view target, Request& request) {
    // Absolute form: http://host[:port]/path?query
    size_t scheme_end = target.find("://");
    if (scheme_end != std::string_view::npos && target.front() != '/') {
        request.scheme = std::string(target.substr(0, scheme_end));
        target.remove_prefix(scheme_end + 3);

        size_t path_start = target.find_first_of("/?");
        request.host = std::string(target.substr(0, path_start));
        target = path_start == std::string_view::npos ? std::string_view{"/"}
                                                      : target.substr(path_start);
    }

    size_t query_pos = target.find('?');
    if (query_pos != std::string_view::npos) {
        request.path = std::string(target.substr(0, query_pos));
        request.query = std::string(target.substr(query_pos + 1));
    } else {
        request.path = std::string(target);
        request.query.clear();
    }

    if (request.path.empty()) {
        request.path = "/";
    }
}

std::optional<Request> parse_http_request(std::string_view data) {
    Parser parser;
    Request request;

    auto [result, consumed] = parser.parse_request(data, request);
    if (result == ParseResult::Complete) {
        return request;
    }
    return std::nullopt;
}

}  // namespace harbor::http
