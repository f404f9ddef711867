#ifndef PAGIX_PAGINATION_PAGE_HPP
#define PAGIX_PAGINATION_PAGE_HPP

/**
 * @file page.hpp
 * @brief Displayable content of one pagination step.
 *
 * A Page is a text body plus an optional embed. Pages are immutable once
 * constructed: sessions only ever read them.
 *
 * Typical usage:
 *
 *   pagix::pagination::EmbedBuilder eb;
 *   eb.title("Inventory").description("Slot 1..10").color(0x5865F2);
 *
 *   pagix::pagination::Page page{"", eb};
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pagix::pagination
{
    struct EmbedField
    {
        std::string name;
        std::string value;
        bool isInline = false;
    };

    struct EmbedFooter
    {
        std::string text;
        std::string iconUrl;
    };

    struct EmbedAuthor
    {
        std::string name;
        std::string url;
        std::string iconUrl;
    };

    /// Structured visual attachment carried by a page.
    struct Embed
    {
        std::string title;
        std::string description;
        std::string url;
        std::optional<std::uint32_t> color;
        std::optional<std::chrono::system_clock::time_point> timestamp;
        std::optional<EmbedFooter> footer;
        std::optional<EmbedAuthor> author;
        std::string imageUrl;
        std::string thumbnailUrl;
        std::vector<EmbedField> fields;
    };

    /**
     * @brief Fluent builder producing a frozen Embed.
     *
     * Setters throw std::invalid_argument when a value exceeds the limits the
     * messaging platform accepts.
     */
    class EmbedBuilder
    {
    public:
        static constexpr std::size_t kMaxTitle = 256;
        static constexpr std::size_t kMaxDescription = 4096;
        static constexpr std::size_t kMaxFields = 25;
        static constexpr std::size_t kMaxFieldName = 256;
        static constexpr std::size_t kMaxFieldValue = 1024;
        static constexpr std::size_t kMaxFooter = 2048;
        static constexpr std::size_t kMaxAuthorName = 256;

        EmbedBuilder() = default;

        EmbedBuilder &title(std::string value);
        EmbedBuilder &description(std::string value);
        EmbedBuilder &url(std::string value);
        EmbedBuilder &color(std::uint32_t rgb);
        EmbedBuilder &timestamp(std::chrono::system_clock::time_point ts);
        EmbedBuilder &footer(std::string text, std::string iconUrl = {});
        EmbedBuilder &author(std::string name, std::string url = {}, std::string iconUrl = {});
        EmbedBuilder &image(std::string url);
        EmbedBuilder &thumbnail(std::string url);
        EmbedBuilder &add_field(std::string name, std::string value, bool isInline = false);
        EmbedBuilder &clear_fields() noexcept;

        const std::string &current_description() const noexcept { return embed_.description; }

        [[nodiscard]] Embed build() const { return embed_; }

    private:
        Embed embed_;
    };

    class Page
    {
    public:
        explicit Page(std::string content = {}, std::optional<Embed> embed = std::nullopt)
            : content_(std::move(content)), embed_(std::move(embed))
        {
        }

        Page(std::string content, const EmbedBuilder &embed)
            : content_(std::move(content)), embed_(embed.build())
        {
        }

        const std::string &content() const noexcept { return content_; }
        const std::optional<Embed> &embed() const noexcept { return embed_; }
        bool has_embed() const noexcept { return embed_.has_value(); }

    private:
        std::string content_;
        std::optional<Embed> embed_;
    };

} // namespace pagix::pagination

#endif // PAGIX_PAGINATION_PAGE_HPP
