#include <pagix/pagination/page_store.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace pagix::pagination
{
    PageStore::PageStore(std::vector<Page> pages)
        : pages_(std::move(pages))
    {
        if (pages_.empty())
            throw std::invalid_argument("[Pagination][PageStore] a session needs at least one page");
    }

    const Page &PageStore::page_at(std::size_t index) const
    {
        if (index >= pages_.size())
        {
            throw std::out_of_range("[Pagination][PageStore] page index " + std::to_string(index) +
                                    " out of range (count " + std::to_string(pages_.size()) + ")");
        }
        return pages_[index];
    }

    namespace
    {
        bool is_continuation_byte(char c) noexcept
        {
            return (static_cast<unsigned char>(c) & 0xC0u) == 0x80u;
        }

        std::vector<std::string_view> split_by_characters(std::string_view text, std::size_t limit)
        {
            std::vector<std::string_view> chunks;
            if (limit == 0)
                limit = 1;

            std::size_t pos = 0;
            while (pos < text.size())
            {
                std::size_t end = std::min(text.size(), pos + limit);

                // back up to a code point boundary
                while (end < text.size() && end > pos && is_continuation_byte(text[end]))
                    --end;

                if (end == pos)
                    end = std::min(text.size(), pos + limit);

                chunks.push_back(text.substr(pos, end - pos));
                pos = end;
            }
            return chunks;
        }

        std::vector<std::string_view> split_by_lines(std::string_view text, std::size_t limit)
        {
            std::vector<std::string_view> chunks;
            if (limit == 0)
                limit = 1;

            std::size_t start = 0;
            std::size_t lines = 0;
            for (std::size_t i = 0; i < text.size(); ++i)
            {
                if (text[i] != '\n')
                    continue;

                if (++lines == limit)
                {
                    chunks.push_back(text.substr(start, i - start));
                    start = i + 1;
                    lines = 0;
                }
            }

            if (start < text.size())
                chunks.push_back(text.substr(start));

            return chunks;
        }

        std::vector<std::string_view> split_text(std::string_view text,
                                                 SplitType split,
                                                 std::size_t characterLimit,
                                                 std::size_t lineLimit)
        {
            if (text.empty())
                throw std::invalid_argument("[Pagination][PageStore] cannot paginate empty text");

            if (split == SplitType::Character)
                return split_by_characters(text, characterLimit);

            // line chunks still honour the character limit
            std::vector<std::string_view> chunks;
            for (const auto chunk : split_by_lines(text, lineLimit))
            {
                if (chunk.size() <= characterLimit)
                {
                    chunks.push_back(chunk);
                    continue;
                }

                const auto pieces = split_by_characters(chunk, characterLimit);
                chunks.insert(chunks.end(), pieces.begin(), pieces.end());
            }
            return chunks;
        }
    } // namespace

    std::vector<Page> pages_from_content(std::string_view text,
                                         SplitType split,
                                         std::size_t characterLimit,
                                         std::size_t lineLimit)
    {
        const auto chunks = split_text(text, split, characterLimit, lineLimit);

        std::vector<Page> pages;
        pages.reserve(chunks.size());

        std::size_t n = 1;
        for (const auto chunk : chunks)
        {
            std::string content = "Page " + std::to_string(n++) + ":\n";
            content.append(chunk);
            pages.emplace_back(std::move(content));
        }
        return pages;
    }

    std::vector<Page> pages_from_embed(std::string_view text,
                                       const EmbedBuilder &templ,
                                       SplitType split,
                                       std::size_t characterLimit,
                                       std::size_t lineLimit)
    {
        characterLimit = std::min(characterLimit, EmbedBuilder::kMaxDescription);
        const auto chunks = split_text(text, split, characterLimit, lineLimit);

        std::vector<Page> pages;
        pages.reserve(chunks.size());

        const std::string total = std::to_string(chunks.size());
        std::size_t n = 1;
        for (const auto chunk : chunks)
        {
            EmbedBuilder eb = templ;
            eb.description(std::string{chunk});
            eb.footer("Page " + std::to_string(n++) + "/" + total);
            pages.emplace_back(std::string{}, eb);
        }
        return pages;
    }

} // namespace pagix::pagination
