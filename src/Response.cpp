#include "Response.hpp"

std::string Result::bodyString() const {
    if (hasBuffer()) {
        const auto& bytes = buffer();
        return std::string(bytes.begin(), bytes.end());
    }
    if (hasText()) {
        return text();
    }
    if (hasJson()) {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";
        return Json::writeString(builder, json());
    }
    return "";
}
