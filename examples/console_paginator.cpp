/**
 * @file console_paginator.cpp
 * @brief Drive a pagination session from the terminal.
 *
 * The "message" is stdout: every render prints the page as JSON. Each line
 * read from stdin is an input event from the owner:
 *
 *   <<  first page      <   previous     x   stop
 *   >   next page       >>  last page
 *
 * Any other line is forwarded as-is (e.g. the raw emoji "▶").
 *
 * Usage:
 *   console_paginator [pages.json]
 *
 * pages.json:
 *   [ { "content": "...", "embed": { "title": "...", "description": "...",
 *       "color": 5793266, "fields": [ { "name": "a", "value": "b", "inline": true } ] } } ]
 *
 * Settings come from ./config/config.json (pagination.* keys).
 */

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <nlohmann/json.hpp>

#include <vix/config/Config.hpp>
#include <vix/utils/Logger.hpp>

#include <pagix/pagination.hpp>

namespace pg = pagix::pagination;
namespace net = boost::asio;

namespace
{
    constexpr pg::UserId kOwner = 42;
    constexpr pg::TargetId kConsoleTarget = 1;

    constexpr const char *kDemoText =
        "Pagination turns a long answer into a browsable message.\n"
        "Each page is rendered in place of the previous one.\n"
        "Controls are reactions or buttons under the message.\n"
        "Only the user who asked can turn the pages.\n"
        "After the timeout the controls disappear.\n"
        "Stop ends the session immediately.\n"
        "Wrap around mode loops from the last page to the first.\n"
        "Clamp mode stays on the boundary page.\n"
        "That is all there is to it.\n";

    nlohmann::json page_to_json(const pg::Page &page)
    {
        nlohmann::json j = nlohmann::json::object();
        j["content"] = page.content();

        if (const auto &embed = page.embed())
        {
            nlohmann::json e = nlohmann::json::object();
            if (!embed->title.empty())
                e["title"] = embed->title;
            if (!embed->description.empty())
                e["description"] = embed->description;
            if (embed->color)
                e["color"] = *embed->color;
            if (embed->footer)
                e["footer"] = {{"text", embed->footer->text}};

            if (!embed->fields.empty())
            {
                e["fields"] = nlohmann::json::array();
                for (const auto &f : embed->fields)
                {
                    e["fields"].push_back({
                        {"name", f.name},
                        {"value", f.value},
                        {"inline", f.isInline},
                    });
                }
            }
            j["embed"] = std::move(e);
        }
        return j;
    }

    std::vector<pg::Page> load_pages(const std::string &path)
    {
        std::ifstream in{path};
        if (!in)
            throw std::runtime_error("cannot open " + path);

        const auto doc = nlohmann::json::parse(in);
        if (!doc.is_array())
            throw std::runtime_error(path + ": expected a JSON array of pages");

        std::vector<pg::Page> pages;
        for (const auto &item : doc)
        {
            const std::string content = item.value("content", std::string{});

            if (!item.contains("embed"))
            {
                pages.emplace_back(content);
                continue;
            }

            const auto &e = item["embed"];
            pg::EmbedBuilder eb;
            eb.title(e.value("title", std::string{}));
            eb.description(e.value("description", std::string{}));
            if (e.contains("color"))
                eb.color(e["color"].get<std::uint32_t>());

            if (e.contains("fields"))
            {
                for (const auto &f : e["fields"])
                {
                    eb.add_field(f.value("name", std::string{}),
                                 f.value("value", std::string{}),
                                 f.value("inline", false));
                }
            }

            pages.emplace_back(content, eb);
        }
        return pages;
    }

    /// stdout stands in for the chat message.
    class ConsoleTarget final : public pg::IRenderTarget
    {
    public:
        explicit ConsoleTarget(pg::TargetId id) : id_(id) {}

        pg::TargetId id() const noexcept override { return id_; }

        boost::system::error_code render(const pg::Page &page) override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::cout << page_to_json(page).dump(2) << std::endl;
            return {};
        }

        boost::system::error_code attach_controls(const pg::ControlBindingSet &bindings) override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::cout << "[controls]";
            for (const auto &token : bindings.tokens())
                std::cout << ' ' << token;
            std::cout << std::endl;
            return {};
        }

        boost::system::error_code remove_all_control_marks() override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::cout << "[controls removed]" << std::endl;
            return {};
        }

        boost::system::error_code delete_artifact() override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::cout << "[message deleted]" << std::endl;
            return {};
        }

    private:
        pg::TargetId id_;
        std::mutex mutex_;
    };

    pg::ControlToken to_token(const std::string &line, const pg::ControlBindingSet &bindings)
    {
        static const std::unordered_map<std::string, pg::ControlAction> aliases{
            {"<<", pg::ControlAction::SkipToFirst},
            {"<", pg::ControlAction::Previous},
            {"x", pg::ControlAction::Stop},
            {">", pg::ControlAction::Next},
            {">>", pg::ControlAction::SkipToLast},
        };

        std::string value = line;
        if (auto it = aliases.find(line); it != aliases.end())
            value = bindings.token_for(it->second);

        return pg::ControlToken{bindings.kind(), std::move(value)};
    }
} // namespace

int main(int argc, char **argv)
{
    using Logger = vix::utils::Logger;
    auto &logger = Logger::getInstance();

    try
    {
        vix::config::Config core{"./config/config.json"};
        const auto cfg = pg::PaginationConfig::from_core(core);

        pg::PaginationMetrics metrics;

        net::io_context ioc;
        auto work = net::make_work_guard(ioc);
        std::thread ioThread([&ioc]()
                             { ioc.run(); });

        auto exporter = pg::MetricsExporter::create(ioc.get_executor(), metrics);
        if (cfg.metricsPort != 0)
        {
            if (const auto ec = exporter->listen("0.0.0.0", cfg.metricsPort))
                logger.log(Logger::Level::WARN, "[console] metrics exporter disabled: {}", ec.message());
        }

        pg::Paginator paginator{ioc.get_executor(), cfg, &metrics};

        auto pages = (argc > 1)
                         ? load_pages(argv[1])
                         : pg::pages_from_content(kDemoText, pg::SplitType::Line, 1900, 3);

        auto session = paginator.create_session(std::move(pages),
                                                kOwner,
                                                std::make_shared<ConsoleTarget>(kConsoleTarget));

        std::thread collector([&paginator, session, &logger]()
                              {
            const auto ec = paginator.paginate(session);
            if (ec)
                logger.log(Logger::Level::WARN, "[console] pagination ended with: {}", ec.message()); });

        for (std::string line; session->is_active() && std::getline(std::cin, line);)
        {
            const auto ec = paginator.handle_event(pg::InputEvent{
                .actor = kOwner,
                .token = to_token(line, session->bindings()),
                .target = kConsoleTarget,
            });

            if (ec)
                std::cerr << "[console] " << ec.message() << std::endl;
        }

        session->stop();
        collector.join();

        exporter->stop();
        work.reset();
        ioc.stop();
        ioThread.join();

        std::cout << metrics.render_prometheus();
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "[console] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
