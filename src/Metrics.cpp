#include <pagix/pagination/Metrics.hpp>

#include <sstream>

#include <vix/utils/Logger.hpp>

#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace pagix::pagination
{
    using tcp = boost::asio::ip::tcp;
    namespace bb = boost::beast;
    namespace http = bb::http;
    namespace net = boost::asio;

    using Logger = vix::utils::Logger;

    static Logger &logger = Logger::getInstance();

    namespace
    {
        /// One request/response on an accepted connection.
        struct Exchange
        {
            explicit Exchange(tcp::socket s) : socket(std::move(s)) {}

            tcp::socket socket;
            bb::flat_buffer buffer;
            http::request<http::string_body> req;
            http::response<http::string_body> res;
        };

        void close_socket(tcp::socket &socket, tcp::socket::shutdown_type how)
        {
            boost::system::error_code ignore;
            socket.shutdown(how, ignore);
            socket.close(ignore);
        }

        [[nodiscard]] bool is_metrics_request(const http::request<http::string_body> &req) noexcept
        {
            return (req.method() == http::verb::get && req.target() == "/metrics");
        }

        void set_common_headers(http::response<http::string_body> &res, unsigned version)
        {
            res.version(version);
            res.set(http::field::server, "pagix-pagination-metrics");
            res.set(http::field::cache_control, "no-store");
            res.set(http::field::connection, "close");
        }

        void write_metric(std::ostringstream &os,
                          const char *name,
                          const char *help,
                          const char *type,
                          std::uint64_t value)
        {
            os << "# HELP " << name << ' ' << help << "\n"
               << "# TYPE " << name << ' ' << type << "\n"
               << name << ' ' << value << "\n\n";
        }
    } // namespace

    std::string PaginationMetrics::render_prometheus() const
    {
        std::ostringstream os;

        write_metric(os, "pagix_pagination_sessions_total",
                     "Total pagination sessions created", "counter", sessions_total.load());
        write_metric(os, "pagix_pagination_sessions_active",
                     "Pagination sessions not yet disposed", "gauge", sessions_active.load());
        write_metric(os, "pagix_pagination_controls_total",
                     "Controls applied to a live session", "counter", controls_total.load());
        write_metric(os, "pagix_pagination_controls_rejected_total",
                     "Controls rejected (inactive session, unknown or unsupported token)",
                     "counter", controls_rejected_total.load());
        write_metric(os, "pagix_pagination_timeouts_total",
                     "Sessions completed by timeout", "counter", timeouts_total.load());
        write_metric(os, "pagix_pagination_stops_total",
                     "Sessions completed by an explicit stop", "counter", stops_total.load());
        write_metric(os, "pagix_pagination_abandoned_total",
                     "Sessions disposed or released while still active", "counter", abandoned_total.load());
        write_metric(os, "pagix_pagination_cleanups_total",
                     "Cleanup policies executed", "counter", cleanups_total.load());
        write_metric(os, "pagix_pagination_cleanup_failures_total",
                     "Cleanup remote calls that failed", "counter", cleanup_failures_total.load());

        return os.str();
    }

    std::shared_ptr<MetricsExporter> MetricsExporter::create(net::any_io_executor executor,
                                                             PaginationMetrics &metrics)
    {
        return std::make_shared<MetricsExporter>(PrivateTag{}, std::move(executor), metrics);
    }

    MetricsExporter::MetricsExporter(PrivateTag, net::any_io_executor executor, PaginationMetrics &metrics)
        : strand_(net::make_strand(std::move(executor))),
          acceptor_(strand_),
          metrics_(metrics)
    {
    }

    boost::system::error_code MetricsExporter::listen(const std::string &address, std::uint16_t port)
    {
        boost::system::error_code ec;

        const auto ip = net::ip::make_address(address, ec);
        if (ec)
        {
            logger.log(Logger::Level::ERROR,
                       "[Pagination][Metrics] invalid address '{}' ({})", address, ec.message());
            return ec;
        }

        const tcp::endpoint ep{ip, port};

        const auto fail = [&](const char *stage)
        {
            logger.log(Logger::Level::ERROR,
                       "[Pagination][Metrics] {} {}:{} failed ({})",
                       stage, address, port, ec.message());
            boost::system::error_code ignore;
            acceptor_.close(ignore);
            return ec;
        };

        acceptor_.open(ep.protocol(), ec);
        if (ec)
            return fail("open");

        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec)
            return fail("reuse_address");

        acceptor_.bind(ep, ec);
        if (ec)
            return fail("bind");

        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec)
            return fail("listen");

        const auto bound = acceptor_.local_endpoint(ec);
        if (ec)
            return fail("local_endpoint");

        port_.store(bound.port());
        listening_.store(true);

        logger.log(Logger::Level::INFO,
                   "[Pagination][Metrics] listening {}:{}  (GET /metrics)",
                   address, port_.load());

        net::post(strand_, [self = shared_from_this()]()
                  { self->start_accept(); });
        return {};
    }

    void MetricsExporter::stop()
    {
        if (!listening_.exchange(false))
            return;

        net::post(strand_,
                  [self = shared_from_this()]()
                  {
                      boost::system::error_code ec;
                      self->acceptor_.close(ec);
                      logger.log(Logger::Level::INFO, "[Pagination][Metrics] stopped");
                  });
    }

    void MetricsExporter::start_accept()
    {
        if (!listening_.load())
            return;

        auto self = shared_from_this();

        acceptor_.async_accept(
            [this, self](const boost::system::error_code &ec, tcp::socket socket)
            {
                if (!listening_.load())
                    return;

                if (ec)
                {
                    logger.log(Logger::Level::DEBUG,
                               "[Pagination][Metrics] accept error ({})", ec.message());
                }
                else
                {
                    serve(std::move(socket));
                }

                start_accept();
            });
    }

    void MetricsExporter::serve(tcp::socket socket)
    {
        auto exchange = std::make_shared<Exchange>(std::move(socket));
        auto self = shared_from_this();

        http::async_read(
            exchange->socket, exchange->buffer, exchange->req,
            [this, self, exchange](const boost::system::error_code &ec, std::size_t)
            {
                if (ec)
                {
                    logger.log(Logger::Level::DEBUG,
                               "[Pagination][Metrics] read error ({})", ec.message());
                    close_socket(exchange->socket, tcp::socket::shutdown_both);
                    return;
                }

                auto &req = exchange->req;
                auto &res = exchange->res;

                if (is_metrics_request(req))
                {
                    res.result(http::status::ok);
                    set_common_headers(res, req.version());
                    res.set(http::field::content_type, "text/plain; version=0.0.4; charset=utf-8");
                    res.body() = metrics_.render_prometheus();
                }
                else
                {
                    res.result(http::status::not_found);
                    set_common_headers(res, req.version());
                    res.set(http::field::content_type, "text/plain; charset=utf-8");
                    res.body() = "Not Found\n";
                }
                res.prepare_payload();

                http::async_write(
                    exchange->socket, exchange->res,
                    [exchange](const boost::system::error_code &writeEc, std::size_t)
                    {
                        if (writeEc)
                        {
                            logger.log(Logger::Level::DEBUG,
                                       "[Pagination][Metrics] write error ({})", writeEc.message());
                        }
                        close_socket(exchange->socket, tcp::socket::shutdown_send);
                    });
            });
    }

} // namespace pagix::pagination
