#pragma once

#include "../types.hpp"
#include "schema_node.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace quarry {
namespace schema {

/**
 * @brief Compiles untyped schema descriptions into SchemaNode trees
 *
 * Accepts the JSON-Schema-like description used to author tool argument
 * contracts. Compilation is pure: the same description always produces a
 * structurally equal tree.
 *
 * Resolution rules:
 * - an absent or unrecognized "type" resolves to object
 * - "properties" and "required" apply to object nodes only; "items" to
 *   array nodes only. Elsewhere they are ignored
 * - "additionalProperties" defaults to false; only a boolean is honoured
 *
 * Rejected (ErrorCode::InvalidSchema):
 * - a node that is not a JSON object
 * - "properties" that is not an object of objects
 * - an array node without an "items" object
 * - a "required" entry that is not a string naming a declared property
 * - an "enum" that is not an array of strings
 */
class SchemaCompiler {
public:
    static Expected<SchemaNode> compile(const nlohmann::json& description) {
        return compile_node(description, "$");
    }

private:
    static Error invalid(const std::string& message, const std::string& path) {
        return Error{ErrorCode::InvalidSchema, message, path};
    }

    static Expected<SchemaNode> compile_node(const nlohmann::json& source, const std::string& path) {
        if (!source.is_object()) {
            return tl::unexpected(invalid("Schema node must be a JSON object", path));
        }

        SchemaNode node;

        if (auto it = source.find("type"); it != source.end() && it->is_string()) {
            node.kind = kind_from_string(it->get_ref<const std::string&>());
        }

        if (auto it = source.find("description"); it != source.end() && it->is_string()) {
            node.description = it->get<std::string>();
        }

        const bool is_object = node.kind == SchemaKind::Object;

        if (auto it = source.find("properties"); is_object && it != source.end()) {
            if (!it->is_object()) {
                return tl::unexpected(invalid("\"properties\" must be an object", path));
            }
            std::map<std::string, SchemaNodePtr> properties;
            for (const auto& [name, child_source] : it->items()) {
                auto child = compile_node(child_source, path + ".properties." + name);
                if (!child) {
                    return tl::unexpected(child.error());
                }
                properties.emplace(name, std::make_shared<const SchemaNode>(std::move(*child)));
            }
            node.properties = std::move(properties);
        }

        if (node.kind == SchemaKind::Array) {
            auto it = source.find("items");
            if (it == source.end() || !it->is_object()) {
                return tl::unexpected(invalid("Array schema requires an \"items\" object", path));
            }
            auto items = compile_node(*it, path + ".items");
            if (!items) {
                return tl::unexpected(items.error());
            }
            node.items = std::make_shared<const SchemaNode>(std::move(*items));
        }

        if (auto it = source.find("required"); is_object && it != source.end()) {
            if (!it->is_array()) {
                return tl::unexpected(invalid("\"required\" must be an array of property names", path));
            }
            std::vector<std::string> required;
            for (const auto& entry : *it) {
                if (!entry.is_string()) {
                    return tl::unexpected(invalid("\"required\" entries must be strings", path));
                }
                const auto& name = entry.get_ref<const std::string&>();
                if (node.property(name) == nullptr) {
                    return tl::unexpected(invalid("Required property is not declared: " + name, path));
                }
                bool seen = false;
                for (const auto& r : required) {
                    if (r == name) {
                        seen = true;
                        break;
                    }
                }
                if (!seen) {
                    required.push_back(name);
                }
            }
            node.required = std::move(required);
        }

        if (auto it = source.find("additionalProperties"); it != source.end() && it->is_boolean()) {
            node.additional_properties_allowed = it->get<bool>();
        }

        if (auto it = source.find("enum"); it != source.end()) {
            if (!it->is_array()) {
                return tl::unexpected(invalid("\"enum\" must be an array of strings", path));
            }
            std::vector<std::string> values;
            values.reserve(it->size());
            for (const auto& value : *it) {
                if (!value.is_string()) {
                    return tl::unexpected(invalid("\"enum\" values must be strings", path));
                }
                values.push_back(value.get<std::string>());
            }
            node.enum_values = std::move(values);
        }

        return node;
    }
};

} // namespace schema
} // namespace quarry
