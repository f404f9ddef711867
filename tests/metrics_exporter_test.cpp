#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <pagix/pagination/Metrics.hpp>

#include "RecordingTarget.hpp"

namespace pg = pagix::pagination;
namespace net = boost::asio;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;
using namespace std::chrono_literals;
using pagix::pagination::test::IoThread;

namespace
{
    struct Reply
    {
        unsigned status = 0;
        std::string contentType;
        std::string body;
    };

    Reply request(std::uint16_t port, http::verb method, const std::string &target)
    {
        net::io_context ioc;
        tcp::socket socket{ioc};
        socket.connect(tcp::endpoint{net::ip::make_address("127.0.0.1"), port});

        http::request<http::empty_body> req{method, target, 11};
        req.set(http::field::host, "127.0.0.1");
        http::write(socket, req);

        boost::beast::flat_buffer buffer;
        http::response<http::string_body> res;
        http::read(socket, buffer, res);

        boost::system::error_code ignore;
        socket.shutdown(tcp::socket::shutdown_both, ignore);

        const auto contentType = res[http::field::content_type];

        return Reply{
            .status = res.result_int(),
            .contentType = std::string(contentType.data(), contentType.size()),
            .body = res.body(),
        };
    }

    class MetricsExporterTest : public ::testing::Test
    {
    protected:
        pg::PaginationMetrics metrics;
        IoThread io;
    };
} // namespace

TEST_F(MetricsExporterTest, ServesCountersOnMetricsPath)
{
    metrics.sessions_total = 4;
    metrics.abandoned_total = 1;

    auto exporter = pg::MetricsExporter::create(io.executor(), metrics);
    ASSERT_FALSE(exporter->listen("127.0.0.1", 0));
    ASSERT_NE(exporter->port(), 0);
    EXPECT_TRUE(exporter->is_listening());

    const auto reply = request(exporter->port(), http::verb::get, "/metrics");

    EXPECT_EQ(reply.status, 200u);
    EXPECT_NE(reply.contentType.find("text/plain"), std::string::npos);
    EXPECT_NE(reply.body.find("pagix_pagination_sessions_total 4\n"), std::string::npos);
    EXPECT_NE(reply.body.find("pagix_pagination_abandoned_total 1\n"), std::string::npos);

    // live values, not a snapshot taken at listen()
    metrics.sessions_total = 5;
    EXPECT_NE(request(exporter->port(), http::verb::get, "/metrics").body.find("pagix_pagination_sessions_total 5\n"),
              std::string::npos);

    exporter->stop();
}

TEST_F(MetricsExporterTest, OtherRequestsGetNotFound)
{
    auto exporter = pg::MetricsExporter::create(io.executor(), metrics);
    ASSERT_FALSE(exporter->listen("127.0.0.1", 0));

    const auto other = request(exporter->port(), http::verb::get, "/health");
    EXPECT_EQ(other.status, 404u);
    EXPECT_EQ(other.body, "Not Found\n");

    EXPECT_EQ(request(exporter->port(), http::verb::post, "/metrics").status, 404u);

    exporter->stop();
}

TEST_F(MetricsExporterTest, StopClosesTheListener)
{
    auto exporter = pg::MetricsExporter::create(io.executor(), metrics);
    ASSERT_FALSE(exporter->listen("127.0.0.1", 0));
    const auto port = exporter->port();

    exporter->stop();
    exporter->stop();
    EXPECT_FALSE(exporter->is_listening());

    bool refused = false;
    const auto until = std::chrono::steady_clock::now() + 2s;
    while (!refused && std::chrono::steady_clock::now() < until)
    {
        net::io_context ioc;
        tcp::socket socket{ioc};
        boost::system::error_code ec;
        socket.connect(tcp::endpoint{net::ip::make_address("127.0.0.1"), port}, ec);
        refused = static_cast<bool>(ec);
        if (!refused)
            std::this_thread::sleep_for(5ms);
    }
    EXPECT_TRUE(refused);
}

TEST_F(MetricsExporterTest, ListenReportsBindErrors)
{
    auto first = pg::MetricsExporter::create(io.executor(), metrics);
    ASSERT_FALSE(first->listen("127.0.0.1", 0));

    auto second = pg::MetricsExporter::create(io.executor(), metrics);
    EXPECT_TRUE(second->listen("127.0.0.1", first->port()));
    EXPECT_FALSE(second->is_listening());

    EXPECT_TRUE(second->listen("not-an-address", 0));

    first->stop();
}
