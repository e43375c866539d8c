/*
 * MicrogridControl — Command registry (RPC command table)
 * (c) 2025 MicrogridControl contributors
 */
#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mgc {

class ControlError;

struct CommandInfo {
    std::string name;
    std::string help;   // one line
};

/* JSON-RPC 2.0 request as received. */
struct RpcRequest {
    nlohmann::json id;      // number | string | null, echoed verbatim
    std::string    method;
    nlohmann::json params;  // object | array | null
};

/*
 * JSON-RPC result. Both outcomes travel in "result" with a
 * {success, method, data|error} envelope; transport-level failures
 * (parse error, unknown method) use the plain JSON-RPC "error" member.
 */
struct RpcResult {
    bool            ok{true};
    nlohmann::json  id;
    nlohmann::json  result;
    int             code{0};
    std::string     message;
    nlohmann::json  data;
    std::string     method;

    static RpcResult makeOk(const nlohmann::json& id, const nlohmann::json& res) {
        RpcResult r; r.ok = true; r.id = id; r.result = res; return r;
    }

    static RpcResult makeError(const nlohmann::json& id, const std::string& method, int code,
                               const std::string& msg, const nlohmann::json& data = {}) {
        RpcResult r; r.ok = false; r.id = id; r.method = method; r.code = code; r.message = msg; r.data = data;
        return r;
    }

    nlohmann::json toJson() const {
        if (ok) {
            return nlohmann::json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
        }
        nlohmann::json payload = {
            {"success", false},
            {"method",  method},
            {"error",   nlohmann::json{{"code", code}, {"message", message}}}
        };
        if (!data.is_null() && !data.empty()) payload["error"]["data"] = data;
        return nlohmann::json{{"jsonrpc", "2.0"}, {"id", id}, {"result", payload}};
    }
};

// --- envelope helpers shared by all Rpc*.cpp --------------------------------
inline RpcResult ok_(const RpcRequest& rq, const char* method,
                     const nlohmann::json& data = nlohmann::json::object()) {
    return RpcResult::makeOk(rq.id, nlohmann::json{{"success", true}, {"method", method}, {"data", data}});
}

inline RpcResult err_(const RpcRequest& rq, const char* method, int code, const std::string& message,
                      const nlohmann::json& extra = nlohmann::json::object()) {
    return RpcResult::makeError(rq.id, method, code, message, extra);
}

/* JSON-RPC error codes of the control plane. */
namespace rpc_code {
constexpr int MethodNotFound     = -32601;
constexpr int InvalidRequest     = -32600;
constexpr int ParseError         = -32700;
constexpr int InvalidArgument    = -32602;
constexpr int NotFound           = -32004;
constexpr int PreconditionFailed = -32009;
constexpr int InvalidState       = -32010;
constexpr int DriverError        = -32011;
constexpr int Unavailable        = -32012;
constexpr int Internal           = -32603;
} // namespace rpc_code

/* Maps a ControlError onto the envelope: {errorCode, componentId, step?} in data. */
RpcResult errFromControlError(const RpcRequest& rq, const char* method, const ControlError& e);

class CommandNotFound : public std::runtime_error {
public:
    explicit CommandNotFound(const std::string& n)
        : std::runtime_error("Unknown command: " + n) {}
};

/*
 * Thread-safe command registry.
 * - name -> (handler, help); handlers run without the registry lock held.
 * - Built-ins "commands" and "help" are always present.
 */
class CommandRegistry {
public:
    using RpcHandler = std::function<RpcResult(const RpcRequest&)>;

    CommandRegistry();
    ~CommandRegistry();

    void add(const std::string& name, const std::string& help, RpcHandler fn);
    void remove(const std::string& name);
    bool exists(const std::string& name) const;
    size_t size() const;

    /* Throws CommandNotFound if missing. */
    RpcResult call(const RpcRequest& req);

    /*
     * One newline-delimited request in, one serialized reply out. Parse
     * failures and unknown methods become JSON-RPC errors; nothing throws.
     */
    std::string handleLine(const std::string& line);

    std::vector<CommandInfo> list() const;
    nlohmann::json listJson() const;
    std::optional<std::string> help(const std::string& name) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    void installBuiltins_();
};

/* Object-shaped params; accepts [ {...} ] too. Anything else yields {}. */
inline nlohmann::json paramsAsObject(const nlohmann::json& p) {
    if (p.is_object()) return p;
    if (p.is_array() && p.size() == 1 && p[0].is_object()) return p[0];
    return nlohmann::json::object();
}

inline nlohmann::json paramsAsObject(const RpcRequest& rq) {
    return paramsAsObject(rq.params);
}

} // namespace mgc
