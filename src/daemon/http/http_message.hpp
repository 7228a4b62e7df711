#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct HttpRequest {
    std::string method;
    std::string target;                         // as sent, e.g. "/logs?limit=5"
    std::string path;                           // target without the query
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers; // names lower-cased
    std::string body;

    std::optional<std::string_view> header(std::string_view name) const;
};

struct HttpResponse {
    int status = 200;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    std::string serialize() const;
};

HttpResponse json_response(int status, const nlohmann::json& body);
const char* http_reason(int status);

// Incremental HTTP/1.1 request reader: request line, headers, Content-Length body.
class HttpRequestParser {
public:
    static constexpr size_t kMaxHeaderBytes = 16 * 1024;
    static constexpr size_t kMaxBodyBytes = 1024 * 1024;

    enum class Status { Incomplete, Complete, Malformed, TooLarge };

    Status feed(std::string_view data);

    // Valid after feed() returned Complete.
    HttpRequest& request() { return request_; }

private:
    Status parse_head(std::string_view head);

    std::string buf_;
    bool head_done_ = false;
    size_t body_length_ = 0;
    HttpRequest request_;
};
