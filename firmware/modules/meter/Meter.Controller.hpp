#pragma once

#include "Meter.Service.hpp"
#include "common/network/ModbusLinkServer.hpp"
#include "common/utils/Response.hpp"

/**
 * @brief 仪表诊断接口（只读）
 *
 * 职责：参数校验，查询委托给 MeterService。配置只能经 Modbus 修改。
 */
class MeterController : public drogon::HttpController<MeterController> {
public:
    using enum drogon::HttpMethod;
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using HttpResponsePtr = drogon::HttpResponsePtr;
    template<typename T = void> using Task = drogon::Task<T>;

    METHOD_LIST_BEGIN
    ADD_METHOD_TO(MeterController::status, "/api/meter/status", Get);
    ADD_METHOD_TO(MeterController::options, "/api/meter/options", Get);
    ADD_METHOD_TO(MeterController::historyRange, "/api/meter/history/{kind}/range", Get);
    ADD_METHOD_TO(MeterController::historyAt, "/api/meter/history/{kind}", Get);
    METHOD_LIST_END

    /**
     * @brief 实时流量、累计计数与 Modbus 统计
     */
    Task<HttpResponsePtr> status(HttpRequestPtr /*req*/) {
        auto data = MeterService::instance().getStatus();

        const auto& link = ModbusLinkServer::instance();
        Json::Value linkJson;
        linkJson["running"] = link.isRunning();
        linkJson["clients"] = link.clientCount();
        linkJson["bytes_rx"] = static_cast<Json::Int64>(link.totalBytesRx());
        linkJson["bytes_tx"] = static_cast<Json::Int64>(link.totalBytesTx());
        data["link"] = linkJson;

        co_return Response::ok(data);
    }

    /**
     * @brief 当前配置记录
     */
    Task<HttpResponsePtr> options(HttpRequestPtr /*req*/) {
        co_return Response::ok(MeterService::instance().getOptions());
    }

    /**
     * @brief 单个桶的值
     * GET /api/meter/history/{hour|day|month}?time=<unix>
     */
    Task<HttpResponsePtr> historyAt(HttpRequestPtr req, std::string kind) {
        auto parsed = parseKind(kind);
        auto time = parseTime(req->getParameter("time"));
        co_return Response::ok(MeterService::instance().getHistoryAt(parsed, time));
    }

    /**
     * @brief 缓冲覆盖的时间范围
     */
    Task<HttpResponsePtr> historyRange(HttpRequestPtr /*req*/, std::string kind) {
        co_return Response::ok(MeterService::instance().getHistoryRange(parseKind(kind)));
    }

private:
    static history::HistoryKind parseKind(const std::string& kind) {
        auto parsed = history::parseHistoryKind(kind);
        if (!parsed) {
            throw ValidationException("未知的历史类型: " + kind + "（可选 hour/day/month）");
        }
        return *parsed;
    }

    static uint32_t parseTime(const std::string& value) {
        if (value.empty()) {
            throw ValidationException("缺少 time 参数");
        }
        uint32_t time = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), time);
        if (ec != std::errc() || ptr != value.data() + value.size()) {
            throw ValidationException("time 参数无效: " + value);
        }
        return time;
    }
};
