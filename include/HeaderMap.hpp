#ifndef HEADER_MAP_HPP
#define HEADER_MAP_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * HeaderMap - Ordered, case-insensitive collection of HTTP header fields
 *
 * Field names keep the spelling they were first inserted with, and fields
 * serialize in insertion order. Lookups ignore case.
 */
class HeaderMap {
public:
    using Field = std::pair<std::string, std::string>;

    HeaderMap() = default;
    HeaderMap(std::initializer_list<Field> fields);

    /**
     * Replace every field with this name by a single field
     *
     * @param name Header name (case-insensitive)
     * @param value Header value
     */
    void set(const std::string& name, const std::string& value);

    /**
     * Add a field without touching existing fields of the same name
     */
    void append(const std::string& name, const std::string& value);

    /**
     * First value for a header
     *
     * @param name Header name (case-insensitive)
     * @return Value, or std::nullopt when absent
     */
    std::optional<std::string> get(const std::string& name) const;

    /**
     * Every value for a header, in insertion order
     */
    std::vector<std::string> getAll(const std::string& name) const;

    bool has(const std::string& name) const;

    /**
     * Remove every field with this name
     *
     * @return true if at least one field was removed
     */
    bool remove(const std::string& name);

    /**
     * Overlay another map: each name present in other replaces the
     * fields of the same name here
     */
    void merge(const HeaderMap& other);

    /**
     * Serialize as "Name: value\r\n" lines (no terminating blank line)
     */
    std::string serialize() const;

    const std::vector<Field>& fields() const { return entries; }
    size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }

private:
    std::vector<Field> entries;
};

#endif // HEADER_MAP_HPP
