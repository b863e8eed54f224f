/// \file HTTPTransport.h
/// \brief 远程模块获取使用的 HTTP 传输层

#ifndef MACHLINK_MODULE_HTTPTRANSPORT_H
#define MACHLINK_MODULE_HTTPTRANSPORT_H

#include <functional>
#include <string>

namespace machlink {

/// \brief 一次 GET 请求的结果
struct HTTPResponse {
    bool TransportOk = false;   ///< 请求是否到达服务器并得到响应
    long Status = 0;            ///< HTTP 状态码（TransportOk 时有效）
    std::string Body;           ///< 响应体
    std::string Error;          ///< 传输层错误描述

    bool isSuccess() const { return TransportOk && Status >= 200 && Status < 300; }
};

/// \brief 可注入的传输函数：GET url
///
/// 可能在工作线程中调用，实现必须线程安全。
using HTTPTransport = std::function<HTTPResponse(const std::string& url)>;

/// \brief 基于 libcurl 的默认传输
/// \param timeoutMs 传输超时（毫秒），0 表示使用 libcurl 默认值
HTTPTransport makeCurlTransport(long timeoutMs = 0);

} // namespace machlink

#endif // MACHLINK_MODULE_HTTPTRANSPORT_H
