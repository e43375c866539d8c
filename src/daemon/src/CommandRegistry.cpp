/*
 * MicrogridControl — Command registry (implementation)
 * (c) 2025 MicrogridControl contributors
 */
#include "include/CommandRegistry.hpp"
#include "include/ControlError.hpp"
#include "include/Log.hpp"

#include <algorithm>
#include <utility>

namespace mgc {

using nlohmann::json;

static int rpcCodeFor(ErrorCode c) {
    switch (c) {
        case ErrorCode::NotFound:           return rpc_code::NotFound;
        case ErrorCode::InvalidArgument:    return rpc_code::InvalidArgument;
        case ErrorCode::PreconditionFailed: return rpc_code::PreconditionFailed;
        case ErrorCode::InvalidState:       return rpc_code::InvalidState;
        case ErrorCode::DriverError:        return rpc_code::DriverError;
        case ErrorCode::Unavailable:        return rpc_code::Unavailable;
    }
    return rpc_code::Internal;
}

RpcResult errFromControlError(const RpcRequest& rq, const char* method, const ControlError& e) {
    json data{{"errorCode", errorCodeName(e.code())}, {"componentId", e.componentId()}};
    if (!e.step().empty()) data["step"] = e.step();
    return err_(rq, method, rpcCodeFor(e.code()), e.what(), data);
}

struct CommandRegistry::Impl {
    std::map<std::string, std::pair<CommandRegistry::RpcHandler, std::string>> map;
    mutable std::mutex mtx;
};

CommandRegistry::CommandRegistry()
    : impl_(new Impl) {
    installBuiltins_();
}

CommandRegistry::~CommandRegistry() = default;

void CommandRegistry::add(const std::string& name, const std::string& helpText, RpcHandler fn) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->map[name] = std::make_pair(std::move(fn), helpText);
}

void CommandRegistry::remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->map.erase(name);
}

bool CommandRegistry::exists(const std::string& name) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->map.find(name) != impl_->map.end();
}

size_t CommandRegistry::size() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->map.size();
}

RpcResult CommandRegistry::call(const RpcRequest& req) {
    RpcHandler fn;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        auto it = impl_->map.find(req.method);
        if (it == impl_->map.end()) throw CommandNotFound(req.method);
        fn = it->second.first;
    }
    return fn(req);
}

static std::string plainError(const json& id, int code, const std::string& msg, const std::string& detail = {}) {
    json e{{"code", code}, {"message", msg}};
    if (!detail.empty()) e["data"] = detail;
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"error", e}}.dump();
}

std::string CommandRegistry::handleLine(const std::string& line) {
    json req = json::parse(line, nullptr, /*allow_exceptions=*/false);
    if (req.is_discarded()) {
        LOG_WARN("rpc: parse error");
        return plainError(nullptr, rpc_code::ParseError, "Parse error");
    }
    const json id = req.is_object() && req.contains("id") ? req["id"] : json();
    if (!req.is_object() || !req.contains("method") || !req["method"].is_string()) {
        return plainError(id, rpc_code::InvalidRequest, "Invalid Request");
    }

    RpcRequest r;
    r.id     = id;
    r.method = req["method"].get<std::string>();
    r.params = req.contains("params") ? req["params"] : json();

    LOG_TRACE("rpc: call method='%s' id=%s", r.method.c_str(), id.dump().c_str());
    try {
        return call(r).toJson().dump();
    } catch (const CommandNotFound&) {
        return plainError(id, rpc_code::MethodNotFound, "Method not found", r.method);
    } catch (const std::exception& ex) {
        LOG_ERROR("rpc: %s failed: %s", r.method.c_str(), ex.what());
        return plainError(id, rpc_code::Internal, "Internal error", ex.what());
    }
}

std::vector<CommandInfo> CommandRegistry::list() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<CommandInfo> out;
    out.reserve(impl_->map.size());
    for (const auto& kv : impl_->map) out.push_back(CommandInfo{kv.first, kv.second.second});
    return out;  // std::map keeps names sorted
}

json CommandRegistry::listJson() const {
    json arr = json::array();
    for (const auto& ci : list()) arr.push_back({{"name", ci.name}, {"help", ci.help}});
    return arr;
}

std::optional<std::string> CommandRegistry::help(const std::string& name) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->map.find(name);
    if (it == impl_->map.end()) return std::nullopt;
    return it->second.second;
}

void CommandRegistry::installBuiltins_() {
    add("commands", "List available commands",
        [this](const RpcRequest& rq) -> RpcResult {
            return ok_(rq, "commands", listJson());
        });

    // params: {"name": "<command>"}
    add("help", "Show help for a command",
        [this](const RpcRequest& rq) -> RpcResult {
            const json p = paramsAsObject(rq);
            const std::string name = p.contains("name") && p["name"].is_string() ? p["name"].get<std::string>() : "";
            if (name.empty()) return err_(rq, "help", rpc_code::InvalidArgument, "missing 'name'");
            auto h = help(name);
            if (!h) return err_(rq, "help", rpc_code::MethodNotFound, "unknown command", json{{"name", name}});
            return ok_(rq, "help", json{{"name", name}, {"help", *h}});
        });
}

} // namespace mgc
