#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

struct HttpReply {
    long status = 0;
    std::string body;
};

// Blocking libcurl client for the rcmcpd HTTP API.
class HttpClient {
public:
    HttpClient(std::string base_url, std::string token);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    std::expected<HttpReply, std::string> get(const std::string& path);
    std::expected<HttpReply, std::string> post(const std::string& path, const nlohmann::json& body);

    // POSTs a JSON-RPC request to /mcp and returns its "result" member.
    std::expected<nlohmann::json, std::string> rpc(const std::string& method,
                                                   nlohmann::json params = nlohmann::json::object());

private:
    std::expected<HttpReply, std::string> perform(const std::string& path, const std::string* body);

    std::string base_url_;
    std::string token_;
    int next_id_ = 1;
};
