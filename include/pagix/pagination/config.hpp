#ifndef PAGIX_PAGINATION_CONFIG_HPP
#define PAGIX_PAGINATION_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Pagination-specific configuration.
 *
 * @details
 * Wraps the core `vix::config::Config` into a strongly-typed structure used
 * by the Paginator as defaults for the sessions it creates.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

#include <vix/config/Config.hpp>

#include <pagix/pagination/cleanup.hpp>
#include <pagix/pagination/controls.hpp>
#include <pagix/pagination/navigator.hpp>

namespace pagix::pagination
{
    /**
     * @struct PaginationConfig
     * @brief Defaults applied to new pagination sessions.
     */
    struct PaginationConfig
    {
        /// Time a session stays interactive.
        std::chrono::seconds timeout{300};

        /// Boundary handling on next / previous.
        PaginationBehaviour behaviour = PaginationBehaviour::Clamp;

        /// What happens to the message when the session ends.
        PaginationDeletion deletion = PaginationDeletion::DeleteControlMarks;

        /// Reaction (emoji) or button controls.
        ControlKind controls = ControlKind::Reaction;

        /// Port of the Prometheus exporter (0 = disabled).
        std::uint16_t metricsPort = 0;

        /// Binding set matching `controls`.
        ControlBindingSet default_bindings() const;

        /**
         * @brief Build a PaginationConfig from the core Vix config.
         *
         * Expected keys (optional):
         *  - pagination.timeout      (int, seconds, min 1)
         *  - pagination.behaviour    ("clamp" | "wrap_around")
         *  - pagination.deletion     ("delete_emojis" | "delete_message" | "keep_emojis")
         *  - pagination.controls     ("reactions" | "buttons")
         *  - pagination.metrics_port (int, 0 disables)
         *
         * Unknown values are logged and the default is kept.
         */
        static PaginationConfig from_core(const vix::config::Config &core);
    };

    std::optional<PaginationBehaviour> parse_behaviour(std::string_view value) noexcept;
    std::optional<PaginationDeletion> parse_deletion(std::string_view value) noexcept;
    std::optional<ControlKind> parse_control_kind(std::string_view value) noexcept;

} // namespace pagix::pagination

#endif // PAGIX_PAGINATION_CONFIG_HPP
