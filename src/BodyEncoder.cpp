#include "BodyEncoder.hpp"
#include "QueryString.hpp"

#include <string>

// ============================================================================
// Public Methods
// ============================================================================

void BodyEncoder::encode(RequestPlan& plan) {
    // Step 1: A caller stream is sent chunked; its length is unknown
    if (plan.hasStreamBody()) {
        plan.headers.remove("Content-Length");
        if (!plan.headers.has("Transfer-Encoding")) {
            plan.headers.set("Transfer-Encoding", "chunked");
        }
        return;
    }

    // Step 2: Explicit content is sent as-is
    if (plan.hasBufferBody()) {
        const auto& bytes = std::get<BufferBody>(plan.body).bytes;
        plan.headers.set("Content-Length", std::to_string(bytes.size()));
        return;
    }

    // Step 3: data goes to the query or to the body
    if (plan.data && !plan.data->isNull()) {
        const Json::Value& data = *plan.data;

        if (plan.data_as_query_string || isQueryMethod(plan.method)) {
            std::string addition = toQueryString(data, plan.nested_querystring);
            if (!addition.empty()) {
                plan.url.query = query_string::appendQuery(plan.url.query, addition);
                plan.url.has_query = true;
            }
        } else {
            std::string bytes;
            if (plan.json_content) {
                bytes = data.isString() ? data.asString() : toJson(data);
            } else {
                bytes = toQueryString(data, plan.nested_querystring);
                if (!plan.headers.has("Content-Type")) {
                    plan.headers.set("Content-Type", "application/x-www-form-urlencoded");
                }
            }
            plan.body = BufferBody{bytes};
            plan.headers.set("Content-Length", std::to_string(bytes.size()));
            return;
        }
    }

    // Step 4: No body at all
    if (expectsBody(plan.method) && !plan.headers.has("Content-Length")) {
        plan.headers.set("Content-Length", "0");
    }
}

std::string BodyEncoder::toQueryString(const Json::Value& data, bool nested) {
    if (data.isString()) {
        return data.asString();
    }
    return nested ? query_string::stringifyNested(data) : query_string::stringify(data);
}

std::string BodyEncoder::toJson(const Json::Value& data) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, data);
}

bool BodyEncoder::isQueryMethod(const std::string& method) {
    return method == "GET" || method == "HEAD";
}

bool BodyEncoder::expectsBody(const std::string& method) {
    return method == "POST" || method == "PUT" || method == "PATCH";
}
