#pragma once

#include "ErrorCodes.hpp"

/**
 * @brief 统一响应格式工具类
 * { "code": 0, "message": "...", "data": ... }
 */
class Response {
public:
    using HttpResponsePtr = drogon::HttpResponsePtr;
    using HttpResponse = drogon::HttpResponse;
    using enum drogon::HttpStatusCode;

    static HttpResponsePtr ok(const Json::Value &data = Json::Value::null,
                               const std::string &message = "Success") {
        Json::Value json;
        json["code"] = ErrorCodes::SUCCESS;
        json["message"] = message;
        if (!data.isNull()) {
            json["data"] = data;
        }

        auto resp = HttpResponse::newHttpJsonResponse(json);
        resp->setStatusCode(k200OK);
        return resp;
    }
};
