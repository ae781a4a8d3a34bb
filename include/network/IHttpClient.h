#pragma once

#include <string>
#include <map>
#include <nlohmann/json.hpp>

namespace marketpipe {
namespace network {

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;

    bool isSuccess() const { return status_code >= 200 && status_code < 300; }
    bool isRateLimited() const { return status_code == 429; }
    bool isNotFound() const { return status_code == 404; }

    // 파싱 실패 시 nlohmann::json::parse_error
    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }
};

// 프로바이더가 사용하는 HTTP 추상화 (테스트에서는 fake 주입)
// 전송 실패(연결, 타임아웃)는 예외, HTTP 오류 코드는 HttpResponse 로 반환
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // GET 요청. url 은 scheme 포함 전체 주소
    virtual HttpResponse get(
        const std::string& url,
        const std::map<std::string, std::string>& query_params = {},
        const std::map<std::string, std::string>& headers = {}
    ) = 0;
};

} // namespace network
} // namespace marketpipe
