#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quarry {
namespace schema {

// ============================================================================
// Schema Kind
// ============================================================================

/** @brief Value kind of a schema node. */
enum class SchemaKind {
    Object,
    Array,
    String,
    Integer,
    Number,
    Boolean
};

[[nodiscard]] inline const char* kind_to_string(SchemaKind kind) {
    switch (kind) {
        case SchemaKind::Object: return "object";
        case SchemaKind::Array: return "array";
        case SchemaKind::String: return "string";
        case SchemaKind::Integer: return "integer";
        case SchemaKind::Number: return "number";
        case SchemaKind::Boolean: return "boolean";
    }
    return "object";
}

/**
 * @brief Resolve a declared type name.
 *
 * Anything that is not one of the six known names resolves to Object,
 * so a partially authored schema still advertises as an object.
 */
[[nodiscard]] inline SchemaKind kind_from_string(std::string_view name) {
    if (name == "array") return SchemaKind::Array;
    if (name == "string") return SchemaKind::String;
    if (name == "integer") return SchemaKind::Integer;
    if (name == "number") return SchemaKind::Number;
    if (name == "boolean") return SchemaKind::Boolean;
    return SchemaKind::Object;
}

// ============================================================================
// SchemaNode
// ============================================================================

struct SchemaNode;
using SchemaNodePtr = std::shared_ptr<const SchemaNode>;

/**
 * @brief Typed node of a tool argument schema.
 *
 * Trees are immutable once compiled; child nodes are shared read-only.
 * Invariants established by SchemaCompiler:
 * - an Array node always has items
 * - every name in required is a key of properties
 *
 * @threadsafety Immutable after construction; safe to share across threads
 */
struct SchemaNode {
    SchemaKind kind = SchemaKind::Object;                          ///< Value kind
    std::optional<std::string> description;                        ///< Human-readable description
    std::optional<std::map<std::string, SchemaNodePtr>> properties; ///< Object members (Object kind only)
    SchemaNodePtr items;                                           ///< Element schema (Array kind only)
    std::optional<std::vector<std::string>> required;              ///< Required member names, authoring order
    bool additional_properties_allowed = false;                    ///< Extra members permitted
    std::optional<std::vector<std::string>> enum_values;           ///< Allowed string values, ordered

    /**
     * @brief Serialize to the JSON-Schema-like advertisement form.
     *
     * Emits type, description, properties, items, required,
     * additionalProperties and enum. additionalProperties is always present.
     */
    nlohmann::json to_json() const {
        nlohmann::json out = nlohmann::json::object();
        out["type"] = kind_to_string(kind);
        if (description) {
            out["description"] = *description;
        }
        if (properties) {
            nlohmann::json props = nlohmann::json::object();
            for (const auto& [name, child] : *properties) {
                props[name] = child ? child->to_json() : nlohmann::json::object();
            }
            out["properties"] = std::move(props);
        }
        if (items) {
            out["items"] = items->to_json();
        }
        if (required) {
            out["required"] = *required;
        }
        out["additionalProperties"] = additional_properties_allowed;
        if (enum_values) {
            out["enum"] = *enum_values;
        }
        return out;
    }

    /// Look up a direct member schema, or nullptr.
    const SchemaNode* property(const std::string& name) const {
        if (!properties) return nullptr;
        auto it = properties->find(name);
        if (it == properties->end()) return nullptr;
        return it->second.get();
    }

    bool is_required(const std::string& name) const {
        if (!required) return false;
        for (const auto& r : *required) {
            if (r == name) return true;
        }
        return false;
    }

    // Structural equality (children compared by value)
    bool operator==(const SchemaNode& other) const {
        if (kind != other.kind ||
            description != other.description ||
            required != other.required ||
            additional_properties_allowed != other.additional_properties_allowed ||
            enum_values != other.enum_values) {
            return false;
        }
        if (!same_node(items, other.items)) {
            return false;
        }
        if (properties.has_value() != other.properties.has_value()) {
            return false;
        }
        if (properties) {
            if (properties->size() != other.properties->size()) {
                return false;
            }
            auto lhs = properties->begin();
            auto rhs = other.properties->begin();
            for (; lhs != properties->end(); ++lhs, ++rhs) {
                if (lhs->first != rhs->first || !same_node(lhs->second, rhs->second)) {
                    return false;
                }
            }
        }
        return true;
    }

    bool operator!=(const SchemaNode& other) const {
        return !(*this == other);
    }

private:
    static bool same_node(const SchemaNodePtr& a, const SchemaNodePtr& b) {
        if (!a || !b) return !a && !b;
        return *a == *b;
    }
};

} // namespace schema
} // namespace quarry
