#include <pagix/pagination/controls.hpp>
#include <pagix/pagination/error.hpp>

#include <stdexcept>

namespace pagix::pagination
{
    namespace
    {
        constexpr std::array<ControlAction, kControlActionCount> kActions{
            ControlAction::SkipToFirst,
            ControlAction::Previous,
            ControlAction::Stop,
            ControlAction::Next,
            ControlAction::SkipToLast,
        };

        void validate_tokens(const ControlBindingSet::Tokens &tokens)
        {
            for (std::size_t i = 0; i < tokens.size(); ++i)
            {
                if (tokens[i].empty())
                    throw std::invalid_argument("[Pagination][Controls] control token must not be empty");

                for (std::size_t j = i + 1; j < tokens.size(); ++j)
                {
                    if (tokens[i] == tokens[j])
                        throw std::invalid_argument("[Pagination][Controls] duplicate control token: " + tokens[i]);
                }
            }
        }
    } // namespace

    std::string_view to_string(ControlAction action) noexcept
    {
        switch (action)
        {
        case ControlAction::SkipToFirst:
            return "skip_to_first";
        case ControlAction::Previous:
            return "previous";
        case ControlAction::Stop:
            return "stop";
        case ControlAction::Next:
            return "next";
        case ControlAction::SkipToLast:
            return "skip_to_last";
        }
        return "unknown";
    }

    ControlBindingSet::ControlBindingSet(ControlKind kind, Tokens tokens, Tokens labels)
        : kind_(kind), tokens_(std::move(tokens)), labels_(std::move(labels))
    {
        validate_tokens(tokens_);
    }

    ControlBindingSet ControlBindingSet::default_emojis()
    {
        return emojis({"⏮", "◀", "⏹", "▶", "⏭"});
    }

    ControlBindingSet ControlBindingSet::default_buttons()
    {
        return buttons({"leftskip", "left", "stop", "right", "rightskip"},
                       {"First", "Previous", "Stop", "Next", "Last"});
    }

    ControlBindingSet ControlBindingSet::emojis(Tokens emoji)
    {
        Tokens labels = emoji;
        return ControlBindingSet{ControlKind::Reaction, std::move(emoji), std::move(labels)};
    }

    ControlBindingSet ControlBindingSet::buttons(Tokens customIds, Tokens labels)
    {
        return ControlBindingSet{ControlKind::Button, std::move(customIds), std::move(labels)};
    }

    std::optional<ControlAction> ControlBindingSet::resolve(const ControlToken &token,
                                                            boost::system::error_code &ec) const
    {
        if (!supports(token.kind))
        {
            ec = make_error_code(errc::capability_mismatch);
            return std::nullopt;
        }

        for (std::size_t i = 0; i < tokens_.size(); ++i)
        {
            if (tokens_[i] == token.value)
            {
                ec.clear();
                return kActions[i];
            }
        }

        ec = make_error_code(errc::unknown_control);
        return std::nullopt;
    }

    const std::string &ControlBindingSet::token_for(ControlAction action) const noexcept
    {
        return tokens_[static_cast<std::size_t>(action)];
    }

    std::vector<ButtonControl> ControlBindingSet::button_controls(boost::system::error_code &ec) const
    {
        if (kind_ != ControlKind::Button)
        {
            ec = make_error_code(errc::capability_mismatch);
            return {};
        }

        ec.clear();

        std::vector<ButtonControl> out;
        out.reserve(kActions.size());
        for (std::size_t i = 0; i < kActions.size(); ++i)
        {
            out.push_back(ButtonControl{
                .action = kActions[i],
                .customId = tokens_[i],
                .label = labels_[i],
            });
        }
        return out;
    }

} // namespace pagix::pagination
