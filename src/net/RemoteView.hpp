//
// RemoteView.hpp — WebSocket++ bridge: Props frames out, viewer intents in
//

#ifndef POKERPRO_REMOTEVIEW_HPP
#define POKERPRO_REMOTEVIEW_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/Props.hpp"
#include "core/Store.hpp"

#include "net/codec.hpp"

namespace pokerpro::net
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using Hdl      = websocketpp::connection_hdl;

    // Every connected viewer sees the same table; any of them may send intents.
    class RemoteView
    {
    public:
        explicit RemoteView(std::shared_ptr<core::Store> store);
        ~RemoteView();

        RemoteView(RemoteView const&) = delete;
        auto operator=(RemoteView const&) -> RemoteView& = delete;

        // Throws Network when the port cannot be bound.
        auto Start(std::uint16_t port) -> void;
        auto Stop() -> void;

        [[nodiscard]] auto ViewerCount() const -> std::size_t;

    private:
        auto OnOpen(Hdl hdl) -> void;
        auto OnClose(Hdl hdl) -> void;
        auto OnMessage(Hdl hdl, WsServer::message_ptr msg) -> void;

        auto Broadcast(core::TableProps const& props) -> void;
        auto SendTo(Hdl hdl, flatbuffers::DetachedBuffer const& buf) -> bool;

        std::shared_ptr<core::Store>            store_;
        WsServer                                server_;
        std::thread                             net_thr_;

        mutable std::mutex                      mtx_;
        std::set<Hdl, std::owner_less<Hdl>>     viewers_;
        bool                                    running_{false};

        std::shared_ptr<core::PropsGate>        gate_;
        core::Store::Unsubscribe                unsubscribe_;
        std::atomic<std::uint64_t>              next_msg_id_{1};
    };
}

#endif // POKERPRO_REMOTEVIEW_HPP
