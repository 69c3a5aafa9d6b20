#include "harvest/network/curl_http_client.hpp"

#include "support/loopback_server.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using harvest::CancellationToken;
using harvest::ErrorCode;
using harvest::network::CurlHttpClient;
using harvest::session::CookieList;
using harvest::test_support::LoopbackHttpServer;
using namespace std::chrono_literals;

namespace {

const std::string kLoopbackCookie = "127.0.0.1\tFALSE\t/\tFALSE\t0\tsid\tabc123";

std::string body_of(const std::vector<std::uint8_t>& body) {
    return std::string(body.begin(), body.end());
}

CurlHttpClient::Options test_options() {
    CurlHttpClient::Options options;
    options.user_agent = "harvest-test/1.0";
    options.timeout = 10s;
    options.connect_timeout = 5s;
    return options;
}

} // namespace

TEST(CurlHttpClientTest, SendsSessionCookiesAndUserAgent) {
    LoopbackHttpServer server([](const std::string&) {
        return LoopbackHttpServer::response(200, "OK", "%PDF-1.4 body", {"Content-Type: application/pdf"});
    });

    CurlHttpClient client(test_options());
    CancellationToken cancel;
    auto fetched = client.get(server.url("/files/a.pdf"), CookieList{kLoopbackCookie}, cancel);

    ASSERT_TRUE(fetched.is_ok()) << fetched.error().message;
    EXPECT_EQ(fetched.value().status, 200);
    EXPECT_EQ(body_of(fetched.value().body), "%PDF-1.4 body");
    EXPECT_EQ(fetched.value().content_type, "application/pdf");

    const auto requests = server.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].rfind("GET /files/a.pdf HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(requests[0].find("Cookie: sid=abc123"), std::string::npos);
    EXPECT_NE(requests[0].find("User-Agent: harvest-test/1.0"), std::string::npos);
}

TEST(CurlHttpClientTest, CookiesForOtherHostsAreNotSent) {
    LoopbackHttpServer server([](const std::string&) {
        return LoopbackHttpServer::response(200, "OK", "ok");
    });

    CurlHttpClient client(test_options());
    CancellationToken cancel;
    auto fetched = client.get(server.url("/"), CookieList{"example.test\tFALSE\t/\tFALSE\t0\tsid\tx"}, cancel);

    ASSERT_TRUE(fetched.is_ok()) << fetched.error().message;
    const auto requests = server.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].find("Cookie:"), std::string::npos);
}

TEST(CurlHttpClientTest, FollowsRedirectsWithCookies) {
    LoopbackHttpServer server([](const std::string& target) {
        if (target == "/old/a.pdf") {
            return LoopbackHttpServer::response(302, "Found", "", {"Location: /new/a.pdf"});
        }
        return LoopbackHttpServer::response(200, "OK", "%PDF-1.4 moved");
    });

    CurlHttpClient client(test_options());
    CancellationToken cancel;
    auto fetched = client.get(server.url("/old/a.pdf"), CookieList{kLoopbackCookie}, cancel);

    ASSERT_TRUE(fetched.is_ok()) << fetched.error().message;
    EXPECT_EQ(fetched.value().status, 200);
    EXPECT_EQ(body_of(fetched.value().body), "%PDF-1.4 moved");
    EXPECT_EQ(fetched.value().final_url, server.url("/new/a.pdf"));

    const auto requests = server.requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[1].rfind("GET /new/a.pdf HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(requests[1].find("Cookie: sid=abc123"), std::string::npos);
}

TEST(CurlHttpClientTest, RedirectLoopIsAnError) {
    LoopbackHttpServer server([](const std::string&) {
        return LoopbackHttpServer::response(302, "Found", "", {"Location: /loop"});
    });

    auto options = test_options();
    options.max_redirects = 2;
    CurlHttpClient client(options);
    CancellationToken cancel;
    auto fetched = client.get(server.url("/loop"), CookieList{}, cancel);

    ASSERT_TRUE(fetched.is_error());
    EXPECT_EQ(fetched.error().code, ErrorCode::NetworkError);
    EXPECT_EQ(server.requests().size(), 3u);
}

TEST(CurlHttpClientTest, ErrorStatusIsAResponse) {
    LoopbackHttpServer server([](const std::string&) {
        return LoopbackHttpServer::response(404, "Not Found", "missing");
    });

    CurlHttpClient client(test_options());
    CancellationToken cancel;
    auto fetched = client.get(server.url("/gone.pdf"), CookieList{}, cancel);

    ASSERT_TRUE(fetched.is_ok()) << fetched.error().message;
    EXPECT_EQ(fetched.value().status, 404);
    EXPECT_FALSE(fetched.value().is_success());
}

TEST(CurlHttpClientTest, OversizedBodyIsRejected) {
    LoopbackHttpServer server([](const std::string&) {
        return LoopbackHttpServer::response(200, "OK", std::string(4096, 'x'));
    });

    auto options = test_options();
    options.max_body_bytes = 16;
    CurlHttpClient client(options);
    CancellationToken cancel;
    auto fetched = client.get(server.url("/big.pdf"), CookieList{}, cancel);

    ASSERT_TRUE(fetched.is_error());
    EXPECT_EQ(fetched.error().code, ErrorCode::NetworkError);
    EXPECT_NE(fetched.error().message.find("limit"), std::string::npos);
}

TEST(CurlHttpClientTest, RefusedConnectionIsNetworkError) {
    std::string url;
    {
        LoopbackHttpServer closed([](const std::string&) { return std::string(); });
        url = closed.url("/a.pdf");
    }

    CurlHttpClient client(test_options());
    CancellationToken cancel;
    auto fetched = client.get(url, CookieList{}, cancel);

    ASSERT_TRUE(fetched.is_error());
    EXPECT_EQ(fetched.error().code, ErrorCode::NetworkError);
}

TEST(CurlHttpClientTest, CancelledTokenSkipsRequest) {
    LoopbackHttpServer server([](const std::string&) {
        return LoopbackHttpServer::response(200, "OK", "ok");
    });

    CurlHttpClient client(test_options());
    CancellationToken cancel;
    cancel.cancel();
    auto fetched = client.get(server.url("/a.pdf"), CookieList{}, cancel);

    ASSERT_TRUE(fetched.is_error());
    EXPECT_EQ(fetched.error().code, ErrorCode::Cancelled);
    EXPECT_TRUE(server.requests().empty());
}

TEST(CurlHttpClientTest, UnsupportedSchemeIsRejected) {
    CurlHttpClient client(test_options());
    CancellationToken cancel;
    auto fetched = client.get("ftp://127.0.0.1/a.pdf", CookieList{}, cancel);

    ASSERT_TRUE(fetched.is_error());
    EXPECT_EQ(fetched.error().code, ErrorCode::NetworkError);
}
