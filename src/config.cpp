#include <pagix/pagination/config.hpp>

#include <algorithm>
#include <string>

#include <vix/utils/Logger.hpp>

namespace pagix::pagination
{
    using Logger = vix::utils::Logger;

    static Logger &logger = Logger::getInstance();

    std::optional<PaginationBehaviour> parse_behaviour(std::string_view value) noexcept
    {
        if (value == "clamp" || value == "ignore")
            return PaginationBehaviour::Clamp;
        if (value == "wrap_around" || value == "wrap")
            return PaginationBehaviour::WrapAround;
        return std::nullopt;
    }

    std::optional<PaginationDeletion> parse_deletion(std::string_view value) noexcept
    {
        if (value == "delete_emojis")
            return PaginationDeletion::DeleteControlMarks;
        if (value == "delete_message")
            return PaginationDeletion::DeleteRenderedArtifact;
        if (value == "keep_emojis")
            return PaginationDeletion::KeepControlMarks;
        return std::nullopt;
    }

    std::optional<ControlKind> parse_control_kind(std::string_view value) noexcept
    {
        if (value == "reactions")
            return ControlKind::Reaction;
        if (value == "buttons")
            return ControlKind::Button;
        return std::nullopt;
    }

    ControlBindingSet PaginationConfig::default_bindings() const
    {
        return controls == ControlKind::Button
                   ? ControlBindingSet::default_buttons()
                   : ControlBindingSet::default_emojis();
    }

    PaginationConfig PaginationConfig::from_core(const vix::config::Config &core)
    {
        PaginationConfig cfg;

        if (core.has("pagination.timeout"))
        {
            auto v = core.getInt("pagination.timeout", static_cast<int>(cfg.timeout.count()));
            cfg.timeout = std::chrono::seconds(std::max(1, v)); // min 1s
        }

        if (core.has("pagination.behaviour"))
        {
            const auto raw = core.getString("pagination.behaviour", std::string{to_string(cfg.behaviour)});
            if (auto parsed = parse_behaviour(raw))
                cfg.behaviour = *parsed;
            else
                logger.log(Logger::Level::WARN,
                           "[Pagination][Config] unknown pagination.behaviour '{}', keeping {}",
                           raw, to_string(cfg.behaviour));
        }

        if (core.has("pagination.deletion"))
        {
            const auto raw = core.getString("pagination.deletion", std::string{to_string(cfg.deletion)});
            if (auto parsed = parse_deletion(raw))
                cfg.deletion = *parsed;
            else
                logger.log(Logger::Level::WARN,
                           "[Pagination][Config] unknown pagination.deletion '{}', keeping {}",
                           raw, to_string(cfg.deletion));
        }

        if (core.has("pagination.controls"))
        {
            const auto raw = core.getString("pagination.controls", std::string{"reactions"});
            if (auto parsed = parse_control_kind(raw))
                cfg.controls = *parsed;
            else
                logger.log(Logger::Level::WARN,
                           "[Pagination][Config] unknown pagination.controls '{}', keeping reactions",
                           raw);
        }

        if (core.has("pagination.metrics_port"))
        {
            auto v = core.getInt("pagination.metrics_port", 0);
            if (v <= 0 || v > 65535)
                cfg.metricsPort = 0;
            else
                cfg.metricsPort = static_cast<std::uint16_t>(v);
        }

        return cfg;
    }

} // namespace pagix::pagination
