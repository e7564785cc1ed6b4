//
// RemoteView.cpp
//

#include "net/RemoteView.hpp"

#include <cstdio>
#include <format>
#include <print>
#include <span>
#include <vector>

namespace pokerpro::net
{
    RemoteView::RemoteView(std::shared_ptr<core::Store> store)
        : store_{std::move(store)}
    {
        server_.clear_access_channels(websocketpp::log::alevel::all);
        server_.set_access_channels(websocketpp::log::alevel::connect |
            websocketpp::log::alevel::disconnect);
        server_.init_asio();
        server_.set_reuse_addr(true);

        server_.set_open_handler([this](Hdl hdl) { OnOpen(hdl); });
        server_.set_close_handler([this](Hdl hdl) { OnClose(hdl); });
        server_.set_message_handler([this](Hdl hdl, WsServer::message_ptr msg) { OnMessage(hdl, msg); });
    }

    RemoteView::~RemoteView()
    {
        Stop();
    }

    auto RemoteView::Start(std::uint16_t port) -> void
    {
        websocketpp::lib::error_code ec;
        server_.listen(port, ec);
        if (ec)
        {
            PPR_THROW(core::error::Code::Network, std::format("listen on {} failed: {}", port, ec.message()));
        }
        server_.start_accept(ec);
        if (ec)
        {
            PPR_THROW(core::error::Code::Network, std::format("accept failed: {}", ec.message()));
        }

        gate_ = std::make_shared<core::PropsGate>([this](core::TableProps const& props) { Broadcast(props); });
        unsubscribe_ = core::SubscribeProps(*store_, gate_);

        {
            std::lock_guard<std::mutex> lock(mtx_);
            running_ = true;
        }
        net_thr_ = std::thread([this]()
        {
            try
            {
                server_.run();
            }
            catch (std::exception const& e)
            {
                std::print(stderr, "[view] network loop failed: {}\n", e.what());
            }
        });

        std::print("[view] listening on port {}\n", port);
    }

    auto RemoteView::Stop() -> void
    {
        std::set<Hdl, std::owner_less<Hdl>> viewers;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (!running_)
            {
                return;
            }
            running_ = false;
            viewers.swap(viewers_);
        }

        if (unsubscribe_)
        {
            unsubscribe_();
            unsubscribe_ = nullptr;
        }

        websocketpp::lib::error_code ec;
        server_.stop_listening(ec);
        if (ec)
        {
            std::print(stderr, "[view] stop_listening: {}\n", ec.message());
        }
        for (Hdl const& hdl : viewers)
        {
            websocketpp::lib::error_code close_ec;
            server_.close(hdl, websocketpp::close::status::going_away, "Server shutting down", close_ec);
        }
        server_.stop();

        if (net_thr_.joinable())
        {
            net_thr_.join();
        }
    }

    auto RemoteView::ViewerCount() const -> std::size_t
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return viewers_.size();
    }

    auto RemoteView::OnOpen(Hdl hdl) -> void
    {
        std::size_t count = 0;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            viewers_.insert(hdl);
            count = viewers_.size();
        }
        std::print("[view] viewer connected ({} total)\n", count);

        // A new viewer gets the current table straight away.
        core::TableProps const props = core::TableProps::FromModel(*store_->GetModel());
        SendTo(hdl, core::net::BuildProps(props, next_msg_id_++));
    }

    auto RemoteView::OnClose(Hdl hdl) -> void
    {
        std::size_t count = 0;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            viewers_.erase(hdl);
            count = viewers_.size();
        }
        std::print("[view] viewer disconnected ({} left)\n", count);
    }

    auto RemoteView::OnMessage(Hdl hdl, WsServer::message_ptr msg) -> void
    {
        // Only binary frames are valid
        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            std::print("[view] ignoring non-binary frame\n");
            return;
        }

        std::string const& payload = msg->get_payload();
        std::span<std::byte const> bytes{
            reinterpret_cast<std::byte const*>(payload.data()), payload.size()
        };

        auto decoded = core::net::DecodeIntent(bytes);
        if (!decoded.has_value())
        {
            std::print(stderr, "[view] bad intent: {}\n", decoded.error().message);
            SendTo(hdl, core::net::BuildError(decoded.error().message, next_msg_id_++));
            return;
        }

        store_->Dispatch(std::move(*decoded));
    }

    auto RemoteView::Broadcast(core::TableProps const& props) -> void
    {
        std::vector<Hdl> targets;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            targets.assign(viewers_.begin(), viewers_.end());
        }
        if (targets.empty())
        {
            return;
        }

        flatbuffers::DetachedBuffer const buf = core::net::BuildProps(props, next_msg_id_++);
        for (Hdl const& hdl : targets)
        {
            SendTo(hdl, buf);
        }
    }

    auto RemoteView::SendTo(Hdl hdl, flatbuffers::DetachedBuffer const& buf) -> bool
    {
        websocketpp::lib::error_code ec;
        server_.send(hdl,
                     reinterpret_cast<void const*>(buf.data()),
                     buf.size(),
                     websocketpp::frame::opcode::binary,
                     ec);
        if (ec)
        {
            std::print(stderr, "[view] send failed: {}\n", ec.message());
            return false;
        }
        return true;
    }
}
