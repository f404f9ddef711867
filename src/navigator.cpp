#include <pagix/pagination/navigator.hpp>

namespace pagix::pagination
{
    std::string_view to_string(PaginationBehaviour behaviour) noexcept
    {
        switch (behaviour)
        {
        case PaginationBehaviour::Clamp:
            return "clamp";
        case PaginationBehaviour::WrapAround:
            return "wrap_around";
        }
        return "unknown";
    }

    void Navigator::advance() noexcept
    {
        if (index_ < pages_.last_index())
        {
            ++index_;
            return;
        }

        if (behaviour_ == PaginationBehaviour::WrapAround)
            index_ = 0;
    }

    void Navigator::retreat() noexcept
    {
        if (index_ > 0)
        {
            --index_;
            return;
        }

        if (behaviour_ == PaginationBehaviour::WrapAround)
            index_ = pages_.last_index();
    }

} // namespace pagix::pagination
