//
// Update.hpp — pure transition function over (Model, Msg)
//

#ifndef POKERPRO_UPDATE_HPP
#define POKERPRO_UPDATE_HPP

#include <optional>
#include <vector>

#include "Commands.hpp"
#include "Exception.hpp"
#include "Messages.hpp"
#include "Model.hpp"

namespace pokerpro::core
{
    // A refused message yields the input Model, no Commands, and the reason.
    struct Transition
    {
        Model model;
        std::vector<Cmd> commands;
        std::optional<error::Rejection> rejection;
    };

    // Deterministic; no I/O, clocks or randomness. Fields not touched by a message are
    // copied through, so shared collections stay the same instance.
    [[nodiscard]]
    auto Update(Model const& model, Msg const& message) -> Transition;
}

#endif //POKERPRO_UPDATE_HPP
