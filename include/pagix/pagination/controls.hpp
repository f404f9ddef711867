#ifndef PAGIX_PAGINATION_CONTROLS_HPP
#define PAGIX_PAGINATION_CONTROLS_HPP

/**
 * @file controls.hpp
 * @brief Mapping between the five pagination actions and transport tokens.
 *
 * A ControlBindingSet is either reaction-based (tokens are emoji) or
 * button-based (tokens are component custom ids). Sessions resolve incoming
 * tokens through their binding set; a token of the other kind is reported as
 * errc::capability_mismatch.
 *
 * Default emoji:   ⏮ ◀ ⏹ ▶ ⏭
 * Default buttons: leftskip left stop right rightskip
 */

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/system/error_code.hpp>

namespace pagix::pagination
{
    enum class ControlAction
    {
        SkipToFirst = 0,
        Previous,
        Stop,
        Next,
        SkipToLast
    };

    inline constexpr std::size_t kControlActionCount = 5;

    std::string_view to_string(ControlAction action) noexcept;

    enum class ControlKind
    {
        Reaction,
        Button
    };

    /// Normalized input coming from the transport.
    struct ControlToken
    {
        ControlKind kind = ControlKind::Reaction;
        std::string value;

        static ControlToken reaction(std::string emoji)
        {
            return ControlToken{ControlKind::Reaction, std::move(emoji)};
        }

        static ControlToken button(std::string customId)
        {
            return ControlToken{ControlKind::Button, std::move(customId)};
        }
    };

    /// Description of one button, used by the transport to build components.
    struct ButtonControl
    {
        ControlAction action;
        std::string customId;
        std::string label;
    };

    class ControlBindingSet
    {
    public:
        /// Tokens in display order: first, previous, stop, next, last.
        using Tokens = std::array<std::string, kControlActionCount>;

        static ControlBindingSet default_emojis();
        static ControlBindingSet default_buttons();

        static ControlBindingSet emojis(Tokens emoji);
        static ControlBindingSet buttons(Tokens customIds, Tokens labels);

        ControlKind kind() const noexcept { return kind_; }
        bool supports(ControlKind kind) const noexcept { return kind_ == kind; }

        /**
         * @brief Resolve a transport token to an action.
         *
         * On failure @p ec is set to errc::capability_mismatch (wrong kind)
         * or errc::unknown_control (no binding) and std::nullopt is returned.
         */
        std::optional<ControlAction> resolve(const ControlToken &token,
                                             boost::system::error_code &ec) const;

        const std::string &token_for(ControlAction action) const noexcept;

        /// All tokens in display order (reactions are attached in this order).
        const Tokens &tokens() const noexcept { return tokens_; }

        /// Button descriptions. errc::capability_mismatch on a reaction set.
        std::vector<ButtonControl> button_controls(boost::system::error_code &ec) const;

    private:
        ControlBindingSet(ControlKind kind, Tokens tokens, Tokens labels);

        ControlKind kind_;
        Tokens tokens_;
        Tokens labels_;
    };

} // namespace pagix::pagination

#endif // PAGIX_PAGINATION_CONTROLS_HPP
