#pragma once

#include <gmock/gmock.h>
#include <IHttpClient.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>

namespace jobhook::tests {

class MockHttpClient : public IHttpClient {
public:
    MOCK_METHOD(bool, send, (const IRequest& req, IResponse& res), (override));
};

/**
 * @brief Копия отправленного запроса для проверок после send()
 */
inline SimpleRequest copyRequest(const IRequest& req) {
    return dynamic_cast<const SimpleRequest&>(req);
}

/**
 * @brief Заполнить ответ mock'а (SimpleResponse нужно кастить для setStatus/setBody)
 */
inline bool respond(IResponse& res, int status, const std::string& body = "") {
    auto& simpleRes = dynamic_cast<SimpleResponse&>(res);
    simpleRes.setStatus(status);
    simpleRes.setBody(body);
    return true;
}

} // namespace jobhook::tests
