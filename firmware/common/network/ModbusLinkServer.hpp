#pragma once

#include "common/protocol/modbus/Modbus.Framer.hpp"

/**
 * @brief RTU-over-TCP 从站链路（单例）
 *
 * 串口服务器透传的原始 RTU 帧经 TCP 到达。每个连接持有独立的 RtuFrameBuffer，
 * 切出的完整帧交给 FrameHandler，有回复则原连接发回。
 */
class ModbusLinkServer {
public:
    using TcpServer = trantor::TcpServer;
    using TcpConnectionPtr = trantor::TcpConnectionPtr;
    using MsgBuffer = trantor::MsgBuffer;
    using EventLoop = trantor::EventLoop;
    using InetAddress = trantor::InetAddress;
    using FrameHandler = std::function<std::optional<std::vector<uint8_t>>(const std::vector<uint8_t>&)>;

    static ModbusLinkServer& instance() {
        static ModbusLinkServer inst;
        return inst;
    }

    /**
     * @brief 启动监听
     * @param loop 运行 TcpServer 的事件循环（通常为 drogon 主循环）
     */
    void start(EventLoop* loop, const std::string& ip, uint16_t port, FrameHandler handler) {
        stop();
        handler_ = std::move(handler);

        auto addr = InetAddress(ip, port);
        server_ = std::make_shared<TcpServer>(loop, addr, "ModbusRtuServer");

        server_->setConnectionCallback([this](const TcpConnectionPtr& conn) {
            std::string clientAddr = conn->peerAddr().toIpPort();
            if (conn->connected()) {
                conn->setContext(std::make_shared<modbus::RtuFrameBuffer>());
                clientCount_.fetch_add(1, std::memory_order_relaxed);
                LOG_INFO << "[Modbus] Client connected: " << clientAddr;
            } else {
                clientCount_.fetch_sub(1, std::memory_order_relaxed);
                LOG_INFO << "[Modbus] Client disconnected: " << clientAddr;
            }
        });

        server_->setRecvMessageCallback([this](const TcpConnectionPtr& conn, MsgBuffer* buf) {
            std::string data(buf->peek(), buf->readableBytes());
            buf->retrieveAll();

            LOG_TRACE << "[Modbus] Recv " << data.size() << "B from " << conn->peerAddr().toIpPort();
            totalBytesRx_.fetch_add(static_cast<int64_t>(data.size()), std::memory_order_relaxed);

            auto framer = conn->getContext<modbus::RtuFrameBuffer>();
            if (!framer) return;

            for (const auto& frame : framer->append(data)) {
                try {
                    auto reply = handler_(frame);
                    if (reply) {
                        conn->send(reinterpret_cast<const char*>(reply->data()), reply->size());
                        totalBytesTx_.fetch_add(static_cast<int64_t>(reply->size()), std::memory_order_relaxed);
                    }
                } catch (const std::exception& e) {
                    LOG_ERROR << "[Modbus] Frame handling error: " << e.what() << " | "
                              << modbus::ModbusUtils::toHexString(frame);
                }
            }
        });

        server_->start();
        LOG_INFO << "[Modbus] RTU-over-TCP server listening on " << ip << ":" << port;
    }

    void stop() {
        if (server_) {
            server_->stop();
            server_.reset();
            LOG_INFO << "[Modbus] RTU-over-TCP server stopped";
        }
    }

    bool isRunning() const { return server_ != nullptr; }
    int clientCount() const { return clientCount_.load(std::memory_order_relaxed); }
    int64_t totalBytesRx() const { return totalBytesRx_.load(std::memory_order_relaxed); }
    int64_t totalBytesTx() const { return totalBytesTx_.load(std::memory_order_relaxed); }

private:
    ModbusLinkServer() = default;

    std::shared_ptr<TcpServer> server_;
    FrameHandler handler_;
    std::atomic<int> clientCount_{0};
    std::atomic<int64_t> totalBytesRx_{0};
    std::atomic<int64_t> totalBytesTx_{0};
};
