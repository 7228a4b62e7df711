#include "http_client.hpp"

#include <curl/curl.h>
#include <format>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

HttpClient::HttpClient(std::string base_url, std::string token)
    : base_url_(std::move(base_url)), token_(std::move(token)) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpClient::~HttpClient() {
    curl_global_cleanup();
}

std::expected<HttpReply, std::string> HttpClient::get(const std::string& path) {
    return perform(path, nullptr);
}

std::expected<HttpReply, std::string> HttpClient::post(const std::string& path, const json& body) {
    auto text = body.dump();
    return perform(path, &text);
}

std::expected<HttpReply, std::string> HttpClient::perform(const std::string& path, const std::string* body) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string url = base_url_ + path;
    std::string auth = "Authorization: Bearer " + token_;

    curl_slist* headers = nullptr;
    if (!token_.empty()) headers = curl_slist_append(headers, auth.c_str());
    if (body) headers = curl_slist_append(headers, "Content-Type: application/json");

    HttpReply reply;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &reply.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 60L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    if (body) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &reply.status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    return reply;
}

std::expected<json, std::string> HttpClient::rpc(const std::string& method, json params) {
    json request = {
        {"jsonrpc", "2.0"},
        {"id", next_id_++},
        {"method", method},
        {"params", std::move(params)},
    };

    auto reply = post("/mcp", request);
    if (!reply) return std::unexpected(reply.error());

    json response;
    try {
        response = json::parse(reply->body);
    } catch (const json::exception& e) {
        return std::unexpected(std::format("HTTP {}: unparseable response: {}", reply->status, e.what()));
    }

    if (reply->status != 200) {
        return std::unexpected(std::format("HTTP {}: {}", reply->status,
                                           response.value("message", response.dump())));
    }
    if (response.contains("error")) {
        auto& err = response["error"];
        return std::unexpected(std::format("JSON-RPC error {}: {}",
                                           err.value("code", 0), err.value("message", std::string{})));
    }
    if (!response.contains("result")) {
        return std::unexpected("response has no result");
    }
    return response["result"];
}
