//
// Frozen.hpp — shared immutable value holder for Model collections
//

#ifndef POKERPRO_FROZEN_HPP
#define POKERPRO_FROZEN_HPP

#include <memory>
#include <utility>

namespace pokerpro::core
{
    // Copying a Frozen shares the instance; edits go through With() and produce a new one.
    // Equality short-circuits on identity and otherwise compares the held values.
    template <typename T>
    class Frozen
    {
    public:
        Frozen() : ptr_{Empty()} {}

        explicit Frozen(T value) : ptr_{std::make_shared<T const>(std::move(value))} {}

        auto operator*() const noexcept -> T const& { return *ptr_; }
        auto operator->() const noexcept -> T const* { return ptr_.get(); }

        [[nodiscard]]
        auto get() const noexcept -> T const& { return *ptr_; }

        [[nodiscard]]
        auto SameAs(Frozen const& other) const noexcept -> bool { return ptr_ == other.ptr_; }

        template <typename Fn>
        [[nodiscard]]
        auto With(Fn&& edit) const -> Frozen
        {
            T copy = *ptr_;
            std::forward<Fn>(edit)(copy);
            return Frozen{std::move(copy)};
        }

        friend auto operator==(Frozen const& a, Frozen const& b) -> bool
        {
            return a.ptr_ == b.ptr_ || *a.ptr_ == *b.ptr_;
        }

    private:
        static auto Empty() -> std::shared_ptr<T const> const&
        {
            static std::shared_ptr<T const> const empty = std::make_shared<T const>();
            return empty;
        }

        std::shared_ptr<T const> ptr_;
    };
}

#endif //POKERPRO_FROZEN_HPP
