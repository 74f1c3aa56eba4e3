#include "HeaderMap.hpp"
#include "StringUtils.hpp"

#include <algorithm>

using namespace utils;

HeaderMap::HeaderMap(std::initializer_list<Field> fields) {
    for (const auto& field : fields) {
        append(field.first, field.second);
    }
}

void HeaderMap::set(const std::string& name, const std::string& value) {
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const Field& f) { return iequals(f.first, name); });
    if (it == entries.end()) {
        entries.emplace_back(name, value);
        return;
    }

    // Keep the first occurrence in place, drop the rest
    it->second = value;
    auto first = it - entries.begin();
    entries.erase(std::remove_if(entries.begin() + first + 1, entries.end(),
                                 [&](const Field& f) { return iequals(f.first, name); }),
                  entries.end());
}

void HeaderMap::append(const std::string& name, const std::string& value) {
    entries.emplace_back(name, value);
}

std::optional<std::string> HeaderMap::get(const std::string& name) const {
    for (const auto& field : entries) {
        if (iequals(field.first, name)) {
            return field.second;
        }
    }
    return std::nullopt;
}

std::vector<std::string> HeaderMap::getAll(const std::string& name) const {
    std::vector<std::string> values;
    for (const auto& field : entries) {
        if (iequals(field.first, name)) {
            values.push_back(field.second);
        }
    }
    return values;
}

bool HeaderMap::has(const std::string& name) const {
    return get(name).has_value();
}

bool HeaderMap::remove(const std::string& name) {
    auto before = entries.size();
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [&](const Field& f) { return iequals(f.first, name); }),
                  entries.end());
    return entries.size() != before;
}

void HeaderMap::merge(const HeaderMap& other) {
    std::vector<std::string> replaced;
    for (const auto& field : other.entries) {
        bool seen = std::any_of(replaced.begin(), replaced.end(),
                                [&](const std::string& n) { return iequals(n, field.first); });
        if (!seen) {
            remove(field.first);
            replaced.push_back(field.first);
        }
        entries.push_back(field);
    }
}

std::string HeaderMap::serialize() const {
    std::string out;
    for (const auto& field : entries) {
        out += field.first;
        out += ": ";
        out += field.second;
        out += "\r\n";
    }
    return out;
}
