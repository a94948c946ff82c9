#pragma once

#include <nlohmann/json.hpp>

namespace quarry {
namespace testing {
namespace schemas {

// Nested description exercising every node kind
inline nlohmann::json contact_list() {
    return nlohmann::json::parse(R"({
      "type": "object",
      "description": "Contacts made at the event",
      "properties": {
        "event_id": {"type": "string", "description": "UUID of the event"},
        "rating": {"type": "integer"},
        "score": {"type": "number"},
        "would_recommend": {"type": "boolean"},
        "tone": {"type": "string", "enum": ["professional", "casual", "warm"]},
        "contacts": {
          "type": "array",
          "items": {
            "type": "object",
            "properties": {
              "name": {"type": "string"},
              "company": {"type": "string"}
            },
            "required": ["name"]
          }
        }
      },
      "required": ["event_id", "rating"]
    })");
}

// No type and no additionalProperties anywhere
inline nlohmann::json untyped() {
    return nlohmann::json::parse(R"({
      "description": "Free-form details",
      "properties": {
        "details": {"description": "Anything"}
      }
    })");
}

} // namespace schemas
} // namespace testing
} // namespace quarry
