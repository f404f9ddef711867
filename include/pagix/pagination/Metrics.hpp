#ifndef PAGIX_PAGINATION_METRICS_HPP
#define PAGIX_PAGINATION_METRICS_HPP

/**
 * @file Metrics.hpp
 * @brief Lightweight Prometheus-style counters for pagination sessions.
 *
 * Metrics are opt-in: sessions, the cleanup executor and the paginator take
 * an optional `PaginationMetrics *` and skip every update when it is null.
 *
 * Typical usage
 * -------------
 * @code{.cpp}
 * pagix::pagination::PaginationMetrics metrics;
 * pagix::pagination::Paginator paginator{ioc.get_executor(), cfg, &metrics};
 *
 * auto exporter = pagix::pagination::MetricsExporter::create(ioc.get_executor(), metrics);
 * if (auto ec = exporter->listen("0.0.0.0", 9100))
 *     ...;
 * // on shutdown
 * exporter->stop();
 * @endcode
 */

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/system/error_code.hpp>

namespace pagix::pagination
{
    /**
     * @struct PaginationMetrics
     * @brief Aggregated counters for pagination activity.
     *
     * All fields are 64-bit atomics and can be updated from timer callbacks
     * and collector threads without external synchronization.
     */
    struct PaginationMetrics
    {
        std::atomic<std::uint64_t> sessions_total{0};
        std::atomic<std::uint64_t> sessions_active{0};
        std::atomic<std::uint64_t> controls_total{0};
        std::atomic<std::uint64_t> controls_rejected_total{0};
        std::atomic<std::uint64_t> timeouts_total{0};
        std::atomic<std::uint64_t> stops_total{0};
        std::atomic<std::uint64_t> abandoned_total{0};
        std::atomic<std::uint64_t> cleanups_total{0};
        std::atomic<std::uint64_t> cleanup_failures_total{0};

        /// Render all counters in Prometheus text exposition format (v0.0.4).
        [[nodiscard]] std::string render_prometheus() const;
    };

    /**
     * @class MetricsExporter
     * @brief Minimal HTTP endpoint exposing `GET /metrics`.
     *
     * Runs on the caller's executor: accept, read and write are all
     * asynchronous, so the exporter lives as long as the io_context runs it
     * and stops with stop(). Any request other than `GET /metrics` gets 404.
     */
    class MetricsExporter : public std::enable_shared_from_this<MetricsExporter>
    {
        struct PrivateTag
        {
            explicit PrivateTag() = default;
        };

    public:
        static std::shared_ptr<MetricsExporter> create(boost::asio::any_io_executor executor,
                                                       PaginationMetrics &metrics);

        MetricsExporter(PrivateTag, boost::asio::any_io_executor executor, PaginationMetrics &metrics);

        MetricsExporter(const MetricsExporter &) = delete;
        MetricsExporter &operator=(const MetricsExporter &) = delete;

        /**
         * @brief Bind, listen and start accepting.
         *
         * Port 0 picks an ephemeral port, see port().
         */
        boost::system::error_code listen(const std::string &address, std::uint16_t port);

        /// Port actually bound (0 before listen()).
        std::uint16_t port() const noexcept { return port_.load(); }

        /// Close the acceptor; in-flight responses finish. Idempotent.
        void stop();

        bool is_listening() const noexcept { return listening_.load(); }

    private:
        void start_accept();
        void serve(boost::asio::ip::tcp::socket socket);

        boost::asio::strand<boost::asio::any_io_executor> strand_;
        boost::asio::ip::tcp::acceptor acceptor_;
        PaginationMetrics &metrics_;
        std::atomic<std::uint16_t> port_{0};
        std::atomic<bool> listening_{false};
    };

} // namespace pagix::pagination

#endif // PAGIX_PAGINATION_METRICS_HPP
