#include "server_core.hpp"

#include "platform/platform_paths.hpp"
#include "version.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <print>
#include <utility>

using json = nlohmann::json;

namespace {

HttpResponse unauthorized(const std::string& message) {
    auto resp = json_response(401, {{"error", "unauthorized"}, {"message", message}});
    resp.headers.emplace_back("WWW-Authenticate", "Bearer");
    return resp;
}

HttpResponse not_found() {
    return json_response(404, {{"error", "not_found"}});
}

HttpResponse method_not_allowed(const char* allow) {
    auto resp = json_response(405, {{"error", "method_not_allowed"}});
    resp.headers.emplace_back("Allow", allow);
    return resp;
}

bool is_mcp_path(const std::string& path) {
    return path == "/mcp" || path == "/mcp/v1" || path.starts_with("/mcp/v1/");
}

} // namespace

ServerCore::ServerCore(Config config, bool verbose,
                       UiIntrospection& ui, ScreenCapture& capture, ScreenMetadata& metadata,
                       NotifyCallback notify)
    : config_(std::move(config)), verbose_(verbose),
      auth_(config_.server.bearer_token),
      registry_(verbose_),
      screen_tools_(ui, capture, metadata, ScreenToolOptions{
          .max_dimension = config_.screenshot.max_dimension,
          .jpeg_quality = config_.screenshot.jpeg_quality,
          .verbose = verbose_,
      }),
      rpc_(registry_, kServerVersion,
           [this](const std::string& name, const json& args, const ToolResult& result, int64_t ms) {
               record_call(name, args, result, ms);
           }),
      notify_(std::move(notify)) {}

ServerCore::~ServerCore() {
    shutdown();
}

bool ServerCore::init() {
    if (auth_.token().empty()) {
        std::println(stderr, "server: no bearer token configured");
        return false;
    }

    screen_tools_.register_all(registry_);
    log(std::format("{} tools registered", registry_.size()));

    if (config_.call_log.enabled) {
        auto path = config_.call_log.path;
        if (path.empty()) {
            auto data = platform::data_dir();
            path = (data.empty() ? std::string("/tmp/rcmcp") : data) + "/calls.db";
        }
        if (!call_log_.open(path)) {
            std::println(stderr, "Warning: call log failed to open, call logging disabled");
        } else {
            log("Call log at " + path);
        }
    }

    pool_ = std::make_unique<WorkerPool>(config_.server.workers);
    return true;
}

HttpResponse ServerCore::handle_request(const HttpRequest& request) {
    if (request.path == "/health") {
        if (request.method != "GET") return method_not_allowed("GET");
        return json_response(200, {
            {"status", "healthy"},
            {"version", kServerVersion},
            {"server", "running"},
        });
    }

    auto auth = auth_.check(request.header("authorization"));
    if (!auth.allowed) {
        log(std::format("{} {} rejected: {}", request.method, request.path, auth.message));
        return unauthorized(auth.message);
    }

    if (is_mcp_path(request.path)) return route_mcp(request);

    if (request.path == "/logs") {
        if (request.method != "GET") return method_not_allowed("GET");
        return handle_logs(request);
    }

    return not_found();
}

HttpResponse ServerCore::route_mcp(const HttpRequest& request) {
    const auto& path = request.path;

    if (path == "/mcp" || path == "/mcp/v1") {
        if (request.method != "POST") return method_not_allowed("POST");
        auto response = rpc_.handle_text(request.body);
        if (!response) return HttpResponse{.status = 202, .headers = {}, .body = {}};
        return json_response(200, *response);
    }

    if (path == "/mcp/v1/initialize") {
        if (request.method != "POST") return method_not_allowed("POST");
        return json_response(200, rpc_.initialize_result());
    }

    if (path == "/mcp/v1/tools/list") {
        if (request.method != "GET") return method_not_allowed("GET");
        return json_response(200, rpc_.tools_list_result());
    }

    if (path == "/mcp/v1/tools/call") {
        if (request.method != "POST") return method_not_allowed("POST");
        json params;
        try {
            params = json::parse(request.body);
        } catch (const json::exception&) {
            return json_response(400, {{"error", "parse_error"}, {"message", "Parse error: invalid JSON"}});
        }
        if (!params.is_object()) {
            return json_response(400, {{"error", "invalid_params"}, {"message", "Body must be an object"}});
        }
        auto response = rpc_.call_tool(nullptr, params);
        if (response.contains("error")) {
            return json_response(400, {
                {"error", "invalid_params"},
                {"message", response["error"]["message"]},
            });
        }
        return json_response(200, response["result"]);
    }

    return not_found();
}

HttpResponse ServerCore::handle_logs(const HttpRequest& request) {
    int limit = 20;
    if (auto it = request.query.find("limit"); it != request.query.end()) {
        auto& v = it->second;
        int parsed = 0;
        auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), parsed);
        if (ec != std::errc{} || ptr != v.data() + v.size()) {
            return json_response(400, {{"error", "invalid_params"}, {"message", "limit must be an integer"}});
        }
        limit = std::clamp(parsed, 1, 500);
    }

    json entries = json::array();
    for (auto& e : call_log_.recent(limit)) {
        entries.push_back({
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"tool", e.tool_name},
            {"params", e.params},
            {"duration_ms", e.duration_ms},
            {"is_error", e.is_error},
        });
    }
    return json_response(200, {{"entries", std::move(entries)}});
}

void ServerCore::submit(uint64_t connection, HttpRequest request) {
    // Every submitted request gets a completion, or its connection stays muted.
    auto job = [this, connection, request = std::move(request)] {
        HttpResponse response;
        try {
            response = handle_request(request);
        } catch (const std::exception& e) {
            std::println(stderr, "server: {} {} failed: {}", request.method, request.path, e.what());
            response = json_response(500, {{"error", "internal_error"}});
        } catch (...) {
            std::println(stderr, "server: {} {} failed with a non-standard exception",
                         request.method, request.path);
            response = json_response(500, {{"error", "internal_error"}});
        }
        {
            std::lock_guard lock(completed_mutex_);
            completed_.push_back({connection, std::move(response)});
        }
        notify_();
    };

    if (!pool_ || !pool_->submit(std::move(job))) {
        std::lock_guard lock(completed_mutex_);
        completed_.push_back({connection, json_response(503, {{"error", "shutting_down"}})});
        notify_();
    }
}

std::vector<ServerCore::Completion> ServerCore::take_completed() {
    std::lock_guard lock(completed_mutex_);
    return std::exchange(completed_, {});
}

void ServerCore::record_call(const std::string& name, const json& arguments,
                             const ToolResult& result, int64_t elapsed_ms) {
    log(std::format("tools/call {} {}ms{}", name, elapsed_ms, result.is_error ? " (error)" : ""));
    if (call_log_.is_open()) {
        call_log_.insert(name, arguments.is_null() ? "" : arguments.dump(), elapsed_ms, result.is_error);
    }
}

void ServerCore::shutdown() {
    if (pool_) {
        pool_->shutdown();
        pool_.reset();
    }
}

void ServerCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[rcmcp] {}", msg);
    }
}
