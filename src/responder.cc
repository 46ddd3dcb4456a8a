#include <json/writer.h>
#include <snipbox/overloaded.hh>
#include <snipbox/responder.hh>

namespace snipbox {

ExecutionResponse respond(const ExecutionResult& result) {
    return std::visit(
        overloaded{
            [](const ExecutionOutcome& outcome) {
                Json::Value body{Json::objectValue};
                body["success"] = true;
                body["output"] = outcome.stdout_data;
                body["error"] = Json::Value{Json::nullValue};
                return ExecutionResponse{.status = 200, .body = std::move(body)};
            },
            [](const ExecutionError& error) {
                Json::Value body{Json::objectValue};
                body["success"] = false;
                body["output"] = "";
                body["error"] = error.message;
                unsigned status = error.kind == ExecutionError::Kind::IoFailure ? 500 : 400;
                return ExecutionResponse{.status = status, .body = std::move(body)};
            },
        },
        result
    );
}

std::string to_json_string(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

} // namespace snipbox
