#include <pagix/pagination/page.hpp>

#include <stdexcept>

namespace pagix::pagination
{
    namespace
    {
        void check_length(const std::string &value, std::size_t max, const char *what)
        {
            if (value.size() > max)
            {
                std::string msg = "[Pagination][Embed] ";
                msg += what;
                msg += " exceeds ";
                msg += std::to_string(max);
                msg += " characters";
                throw std::invalid_argument(msg);
            }
        }
    } // namespace

    EmbedBuilder &EmbedBuilder::title(std::string value)
    {
        check_length(value, kMaxTitle, "title");
        embed_.title = std::move(value);
        return *this;
    }

    EmbedBuilder &EmbedBuilder::description(std::string value)
    {
        check_length(value, kMaxDescription, "description");
        embed_.description = std::move(value);
        return *this;
    }

    EmbedBuilder &EmbedBuilder::url(std::string value)
    {
        embed_.url = std::move(value);
        return *this;
    }

    EmbedBuilder &EmbedBuilder::color(std::uint32_t rgb)
    {
        if (rgb > 0xFFFFFFu)
            throw std::invalid_argument("[Pagination][Embed] color must be a 24-bit RGB value");
        embed_.color = rgb;
        return *this;
    }

    EmbedBuilder &EmbedBuilder::timestamp(std::chrono::system_clock::time_point ts)
    {
        embed_.timestamp = ts;
        return *this;
    }

    EmbedBuilder &EmbedBuilder::footer(std::string text, std::string iconUrl)
    {
        check_length(text, kMaxFooter, "footer");
        embed_.footer = EmbedFooter{
            .text = std::move(text),
            .iconUrl = std::move(iconUrl),
        };
        return *this;
    }

    EmbedBuilder &EmbedBuilder::author(std::string name, std::string url, std::string iconUrl)
    {
        check_length(name, kMaxAuthorName, "author name");
        embed_.author = EmbedAuthor{
            .name = std::move(name),
            .url = std::move(url),
            .iconUrl = std::move(iconUrl),
        };
        return *this;
    }

    EmbedBuilder &EmbedBuilder::image(std::string url)
    {
        embed_.imageUrl = std::move(url);
        return *this;
    }

    EmbedBuilder &EmbedBuilder::thumbnail(std::string url)
    {
        embed_.thumbnailUrl = std::move(url);
        return *this;
    }

    EmbedBuilder &EmbedBuilder::add_field(std::string name, std::string value, bool isInline)
    {
        if (embed_.fields.size() >= kMaxFields)
            throw std::invalid_argument("[Pagination][Embed] too many fields");

        if (name.empty() || value.empty())
            throw std::invalid_argument("[Pagination][Embed] field name and value must not be empty");

        check_length(name, kMaxFieldName, "field name");
        check_length(value, kMaxFieldValue, "field value");

        embed_.fields.push_back(EmbedField{
            .name = std::move(name),
            .value = std::move(value),
            .isInline = isInline,
        });
        return *this;
    }

    EmbedBuilder &EmbedBuilder::clear_fields() noexcept
    {
        embed_.fields.clear();
        return *this;
    }

} // namespace pagix::pagination
