#include "execution_types.hpp"

using json = nlohmann::json;

json ExecutionResult::to_json() const {
    return json{{"action", action}, {"status", status}, {"output", output}};
}

ExecutionResult ExecutionResult::from_response(const json& action, const json& body, const std::string& raw_body) {
    ExecutionResult r;
    r.action = action;
    r.status = "ok";
    r.output = raw_body;
    if (!body.is_object()) return r;
    if (body.contains("status") && body["status"].is_string()) r.status = body["status"].get<std::string>();
    if (body.contains("output")) {
        const auto& out = body["output"];
        r.output = out.is_string() ? out.get<std::string>() : out.dump();
    }
    return r;
}

ExecutionResult make_result(const json& action, std::string status, std::string output) {
    ExecutionResult r;
    r.action = action;
    r.status = std::move(status);
    r.output = std::move(output);
    return r;
}
