// Harbor HTTP Layer Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <string>

#include "../../src/gateway/upstream.hpp"
#include "../../src/gateway/upstream_client.hpp"
#include "../../src/http/http.hpp"
#include "../../src/http/parser.hpp"

using namespace harbor::http;

TEST_CASE("HTTP method conversion", "[http][method]") {
    REQUIRE(to_string(Method::GET) == "GET");
    REQUIRE(to_string(Method::POST) == "POST");
    REQUIRE(to_string(Method::DELETE) == "DELETE");

    REQUIRE(parse_method("GET") == Method::GET);
    REQUIRE(parse_method("HEAD") == Method::HEAD);
    REQUIRE(parse_method("BREW") == Method::UNKNOWN);
}

TEST_CASE("Idempotent methods", "[http][method]") {
    REQUIRE(is_idempotent(Method::GET));
    REQUIRE(is_idempotent(Method::PUT));
    REQUIRE(is_idempotent(Method::DELETE));
    REQUIRE_FALSE(is_idempotent(Method::POST));
    REQUIRE_FALSE(is_idempotent(Method::PATCH));
    REQUIRE_FALSE(is_idempotent(Method::CONNECT));
}

TEST_CASE("Header name comparison (case-insensitive)", "[http][headers]") {
    REQUIRE(header_name_equals("Content-Type", "content-type"));
    REQUIRE(header_name_equals("CONTENT-TYPE", "content-type"));
    REQUIRE_FALSE(header_name_equals("Content-Type", "Content-Length"));

    REQUIRE(is_hop_by_hop_header("connection"));
    REQUIRE(is_hop_by_hop_header("Transfer-Encoding"));
    REQUIRE(is_hop_by_hop_header("Keep-Alive"));
    REQUIRE_FALSE(is_hop_by_hop_header("Content-Type"));
}

TEST_CASE("Parse simple GET request", "[http][parser]") {
    std::string raw =
        "GET /hello?b=2&a=1 HTTP/1.1\r\n"
        "Host: example.com\r\n"
        "Cookie: session=abc; theme=dark\r\n"
        "\r\n";

    Parser parser;
    Request request;
    auto [result, consumed] = parser.parse_request(raw, request);

    REQUIRE(result == ParseResult::Complete);
    REQUIRE(consumed == raw.size());
    REQUIRE(request.method == Method::GET);
    REQUIRE(request.version == Version::HTTP_1_1);
    REQUIRE(request.path == "/hello");
    REQUIRE(request.query == "b=2&a=1");
    REQUIRE(request.host == "example.com");
    REQUIRE(request.get_cookie("session") == "abc");
    REQUIRE(request.get_cookie("theme") == "dark");
    REQUIRE(request.get_cookie("missing").empty());
    REQUIRE(request.keep_alive());
}

TEST_CASE("Parse request delivered in pieces", "[http][parser]") {
    std::string part1 = "POST /submit HTTP/1.1\r\nHost: a\r\nContent-Le";
    std::string part2 = "ngth: 5\r\n\r\nhel";
    std::string part3 = "lo";

    Parser parser;
    Request request;
    REQUIRE(parser.parse_request(part1, request).first == ParseResult::Incomplete);
    REQUIRE(parser.message_started());
    REQUIRE(parser.parse_request(part2, request).first == ParseResult::Incomplete);
    REQUIRE(parser.parse_request(part3, request).first == ParseResult::Complete);
    REQUIRE(request.body == "hello");
}

TEST_CASE("Pipelined requests leave the second request unconsumed", "[http][parser]") {
    std::string raw =
        "GET /one HTTP/1.1\r\nHost: a\r\n\r\n"
        "GET /two HTTP/1.1\r\nHost: a\r\n\r\n";

    Parser parser;
    Request first;
    auto [result, consumed] = parser.parse_request(raw, first);
    REQUIRE(result == ParseResult::Complete);
    REQUIRE(first.path == "/one");
    REQUIRE(consumed < raw.size());

    Parser next;
    Request second;
    auto [result2, consumed2] = next.parse_request(std::string_view(raw).substr(consumed), second);
    REQUIRE(result2 == ParseResult::Complete);
    REQUIRE(second.path == "/two");
}

TEST_CASE("Parser enforces limits", "[http][parser]") {
    SECTION("body too large") {
        std::string raw = "POST /x HTTP/1.1\r\nHost: a\r\nContent-Length: 10\r\n\r\n0123456789";
        Parser parser;
        parser.set_max_body_size(4);
        Request request;
        REQUIRE(parser.parse_request(raw, request).first == ParseResult::Error);
        REQUIRE(parser.limit_exceeded());
    }

    SECTION("headers too large") {
        std::string raw = "GET /x HTTP/1.1\r\nHost: a\r\nX-Big: " + std::string(512, 'v') +
                          "\r\n\r\n";
        Parser parser;
        parser.set_max_header_size(128);
        Request request;
        REQUIRE(parser.parse_request(raw, request).first == ParseResult::Error);
        REQUIRE(parser.limit_exceeded());
    }

    SECTION("malformed request line") {
        Parser parser;
        Request request;
        REQUIRE(parser.parse_request("NOT A REQUEST\r\n\r\n", request).first == ParseResult::Error);
        REQUIRE_FALSE(parser.limit_exceeded());
    }
}

TEST_CASE("Parse response with chunked body", "[http][parser]") {
    std::string raw =
        "HTTP/1.1 200 OK\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "5\r\nhello\r\n"
        "6\r\n world\r\n"
        "0\r\n\r\n";

    Parser parser;
    Response response;
    auto [result, consumed] = parser.parse_response(raw, response);
    REQUIRE(result == ParseResult::Complete);
    REQUIRE(response.status_code() == 200);
    REQUIRE(response.body == "hello world");
}

TEST_CASE("Close-delimited response completes on finish", "[http][parser]") {
    std::string raw = "HTTP/1.0 200 OK\r\n\r\npartial body";

    Parser parser;
    Response response;
    REQUIRE(parser.parse_response(raw, response).first == ParseResult::Incomplete);
    REQUIRE(parser.finish() == ParseResult::Complete);
    REQUIRE(response.body == "partial body");
    REQUIRE_FALSE(response.keep_alive());
}

TEST_CASE("Serialize response", "[http][response]") {
    Response response;
    response.status = StatusCode::OK;
    response.add_header("Content-Type", "text/plain");
    response.add_header("Connection", "upgrade");  // hop-by-hop, dropped
    response.body = "hi";

    SECTION("keep-alive") {
        std::string wire = serialize_response(response, true);
        REQUIRE(wire.starts_with("HTTP/1.1 200 OK\r\n"));
        REQUIRE(wire.find("Content-Length: 2\r\n") != std::string::npos);
        REQUIRE(wire.find("Connection: keep-alive\r\n") != std::string::npos);
        REQUIRE(wire.find("upgrade") == std::string::npos);
        REQUIRE(wire.ends_with("\r\n\r\nhi"));
    }

    SECTION("HEAD omits the body") {
        std::string wire = serialize_response(response, false, true);
        REQUIRE(wire.find("Connection: close\r\n") != std::string::npos);
        REQUIRE(wire.ends_with("\r\n\r\n"));
    }
}

TEST_CASE("Error responses carry only a reason phrase", "[http][response]") {
    Response response = make_error_response(StatusCode::BadGateway);
    REQUIRE(response.status_code() == 502);
    REQUIRE(response.body == "Bad Gateway\n");
    REQUIRE(response.get_header("Content-Type") == "text/plain");
}

TEST_CASE("Upstream request rewriting", "[http][forwarding]") {
    using namespace harbor::gateway;

    UpstreamServer server(UpstreamServerSpec{.host = "10.0.0.5", .port = 8080}, HealthParams{});

    Request request;
    request.method = Method::POST;
    request.path = "/api";
    request.query = "x=1";
    request.host = "shop.example.com";
    request.client_ip = "192.168.1.20";
    request.body = "payload";
    request.headers = {{"Host", "shop.example.com"},
                       {"Connection", "keep-alive, X-Trace"},
                       {"X-Trace", "drop-me"},
                       {"Keep-Alive", "timeout=5"},
                       {"Transfer-Encoding", "chunked"},
                       {"X-Forwarded-For", "1.1.1.1"},
                       {"Content-Length", "7"},
                       {"Accept", "application/json"}};

    SECTION("forwarded headers enabled") {
        std::string wire = build_upstream_request(request, server, ForwardingOptions{});

        REQUIRE(wire.starts_with("POST /api?x=1 HTTP/1.1\r\nHost: shop.example.com\r\n"));
        REQUIRE(wire.find("X-Trace") == std::string::npos);
        REQUIRE(wire.find("Keep-Alive") == std::string::npos);
        REQUIRE(wire.find("Transfer-Encoding") == std::string::npos);
        REQUIRE(wire.find("Accept: application/json\r\n") != std::string::npos);
        REQUIRE(wire.find("X-Forwarded-For: 1.1.1.1, 192.168.1.20\r\n") != std::string::npos);
        REQUIRE(wire.find("X-Real-IP: 192.168.1.20\r\n") != std::string::npos);
        REQUIRE(wire.find("X-Forwarded-Proto: http\r\n") != std::string::npos);
        REQUIRE(wire.find("Content-Length: 7\r\n") != std::string::npos);
        REQUIRE(wire.find("Connection: keep-alive\r\n\r\npayload") != std::string::npos);
    }

    SECTION("forwarded headers disabled") {
        ForwardingOptions options;
        options.add_forwarded_for = false;
        options.add_real_ip = false;
        options.add_forwarded_proto = false;
        std::string wire = build_upstream_request(request, server, options);

        REQUIRE(wire.find("X-Forwarded-For: 1.1.1.1\r\n") != std::string::npos);
        REQUIRE(wire.find("X-Real-IP") == std::string::npos);
        REQUIRE(wire.find("X-Forwarded-Proto") == std::string::npos);
    }

    SECTION("missing host falls back to the server address") {
        request.host.clear();
        std::string wire = build_upstream_request(request, server, ForwardingOptions{});
        REQUIRE(wire.find("Host: 10.0.0.5:8080\r\n") != std::string::npos);
    }
}
