#include "http/http_message.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t");
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string url_decode(std::string_view s) {
    std::string out;
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] == '+') {
            out.push_back(' ');
        } else if (s[i] == '%' && i + 2 < s.size() &&
                   hex_value(s[i + 1]) >= 0 && hex_value(s[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hex_value(s[i + 1]) * 16 + hex_value(s[i + 2])));
            i += 2;
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

void parse_query(std::string_view q, std::map<std::string, std::string>& out) {
    while (!q.empty()) {
        auto amp = q.find('&');
        auto pair = q.substr(0, amp);
        auto eq = pair.find('=');
        if (!pair.empty()) {
            if (eq == std::string_view::npos) out[url_decode(pair)] = "";
            else out[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
        }
        if (amp == std::string_view::npos) break;
        q.remove_prefix(amp + 1);
    }
}

} // namespace

std::optional<std::string_view> HttpRequest::header(std::string_view name) const {
    auto it = headers.find(lower(name));
    if (it == headers.end()) return std::nullopt;
    return std::string_view(it->second);
}

const char* http_reason(int status) {
    switch (status) {
        case 200: return "OK";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
    }
    return "Unknown";
}

std::string HttpResponse::serialize() const {
    std::string out = std::format("HTTP/1.1 {} {}\r\n", status, http_reason(status));
    for (auto& [name, value] : headers) {
        out += std::format("{}: {}\r\n", name, value);
    }
    out += std::format("Content-Length: {}\r\nConnection: close\r\n\r\n", body.size());
    out += body;
    return out;
}

HttpResponse json_response(int status, const nlohmann::json& body) {
    return HttpResponse{
        .status = status,
        .headers = {{"Content-Type", "application/json"}},
        .body = body.dump(),
    };
}

HttpRequestParser::Status HttpRequestParser::feed(std::string_view data) {
    buf_.append(data);

    if (!head_done_) {
        auto end = buf_.find("\r\n\r\n");
        if (end == std::string::npos) {
            return buf_.size() > kMaxHeaderBytes ? Status::TooLarge : Status::Incomplete;
        }
        if (end > kMaxHeaderBytes) return Status::TooLarge;

        auto status = parse_head(std::string_view(buf_).substr(0, end));
        if (status != Status::Complete) return status;

        buf_.erase(0, end + 4);
        head_done_ = true;
    }

    if (buf_.size() < body_length_) return Status::Incomplete;

    request_.body = buf_.substr(0, body_length_);
    buf_.erase(0, body_length_);
    return Status::Complete;
}

HttpRequestParser::Status HttpRequestParser::parse_head(std::string_view head) {
    auto line_end = head.find("\r\n");
    auto request_line = head.substr(0, line_end);

    auto sp1 = request_line.find(' ');
    if (sp1 == std::string_view::npos) return Status::Malformed;
    auto sp2 = request_line.find(' ', sp1 + 1);
    if (sp2 == std::string_view::npos) return Status::Malformed;

    request_.method = std::string(request_line.substr(0, sp1));
    request_.target = std::string(request_line.substr(sp1 + 1, sp2 - sp1 - 1));
    auto version = request_line.substr(sp2 + 1);
    if (request_.method.empty() || request_.target.empty() || !version.starts_with("HTTP/1.")) {
        return Status::Malformed;
    }

    auto q = request_.target.find('?');
    request_.path = request_.target.substr(0, q);
    if (q != std::string::npos) {
        parse_query(std::string_view(request_.target).substr(q + 1), request_.query);
    }

    std::string_view rest = line_end == std::string_view::npos ? std::string_view{}
                                                               : head.substr(line_end + 2);
    while (!rest.empty()) {
        auto eol = rest.find("\r\n");
        auto line = rest.substr(0, eol);
        auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) return Status::Malformed;
        request_.headers[lower(trim(line.substr(0, colon)))] = std::string(trim(line.substr(colon + 1)));
        if (eol == std::string_view::npos) break;
        rest.remove_prefix(eol + 2);
    }

    if (auto te = request_.header("transfer-encoding"); te && lower(*te) != "identity") {
        return Status::Malformed;
    }

    body_length_ = 0;
    if (auto cl = request_.header("content-length")) {
        auto first = cl->data();
        auto last = cl->data() + cl->size();
        auto [ptr, ec] = std::from_chars(first, last, body_length_);
        if (ec != std::errc{} || ptr != last) return Status::Malformed;
        if (body_length_ > kMaxBodyBytes) return Status::TooLarge;
    }
    return Status::Complete;
}
