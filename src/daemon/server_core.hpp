#pragma once

#include "auth/bearer_auth.hpp"
#include "config.hpp"
#include "http/http_message.hpp"
#include "platform/screen_capture.hpp"
#include "platform/screen_metadata.hpp"
#include "platform/ui_introspection.hpp"
#include "protocol/jsonrpc_handler.hpp"
#include "storage/call_log_db.hpp"
#include "tools/screen_tools.hpp"
#include "tools/tool_registry.hpp"
#include "worker_pool.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Portable request handling: routing, authentication, JSON-RPC and tool
// dispatch. Requests run on a worker pool; finished responses are collected
// by the event loop after the notify callback fires.
class ServerCore {
public:
    using NotifyCallback = std::function<void()>;

    struct Completion {
        uint64_t connection;
        HttpResponse response;
    };

    ServerCore(Config config, bool verbose,
               UiIntrospection& ui, ScreenCapture& capture, ScreenMetadata& metadata,
               NotifyCallback notify);
    ~ServerCore();

    ServerCore(const ServerCore&) = delete;
    ServerCore& operator=(const ServerCore&) = delete;

    // Registers tools, opens the call log and starts the workers.
    bool init();

    // Runs on the calling thread.
    HttpResponse handle_request(const HttpRequest& request);

    // Queues request handling on a worker. connection is echoed back in the Completion.
    void submit(uint64_t connection, HttpRequest request);
    std::vector<Completion> take_completed();

    const ToolRegistry& registry() const { return registry_; }
    CallLogDb& call_log() { return call_log_; }

    void shutdown();

private:
    HttpResponse route_mcp(const HttpRequest& request);
    HttpResponse handle_logs(const HttpRequest& request);
    void record_call(const std::string& name, const nlohmann::json& arguments,
                     const ToolResult& result, int64_t elapsed_ms);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    BearerAuth auth_;
    ToolRegistry registry_;
    ScreenTools screen_tools_;
    JsonRpcHandler rpc_;
    CallLogDb call_log_;

    NotifyCallback notify_;
    std::unique_ptr<WorkerPool> pool_;

    std::mutex completed_mutex_;
    std::vector<Completion> completed_;
};
