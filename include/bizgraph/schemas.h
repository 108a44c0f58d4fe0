#pragma once
// ═══════════════════════════════════════════════════════════════════
//  bizgraph/schemas.h - Validation schemas for ingested records
// ═══════════════════════════════════════════════════════════════════

#include "json_utils.h"
#include "validator.h"
#include <optional>
#include <string>

namespace bizgraph::schemas {

inline std::optional<std::string> checkTimestamp(const nlohmann::json& v) {
    try {
        parseTimestamp(v.get<std::string>());
        return std::nullopt;
    } catch (const Error& e) {
        return std::string(e.what());
    }
}

inline validator::Schema business() {
    validator::Schema s;
    s.field("id").required().isString().minLength(1).maxLength(256);
    s.field("name").optional().isString().maxLength(512);
    s.field("category").optional().isString();
    s.field("location").optional().isString();
    s.field("size_class").optional().isString();
    s.field("created_at").optional().isString().custom(checkTimestamp);
    s.field("updated_at").optional().isString().custom(checkTimestamp);
    return s;
}

inline validator::Schema relationship() {
    validator::Schema s;
    s.field("source").required().isString().minLength(1);
    s.field("target").required().isString().minLength(1);
    s.field("relationship_type").required().isString().oneOf({"vendor", "client", "partner"});
    s.field("transaction_volume").required().isNumber().min(0);
    s.field("frequency").optional().isString();
    s.field("created_at").optional().isString().custom(checkTimestamp);
    s.field("last_transaction").optional().isString().custom(checkTimestamp);
    return s;
}

// Envelope of a change arriving from the ingestion side:
//   {"entity": "edge", "kind": "created", "relationship": {...}, "overwrite": false}
//   {"entity": "edge", "kind": "deleted", "source": "A", "target": "B", "relationship_type": "vendor"}
//   {"entity": "node", "kind": "updated", "business": {...}}
//   {"entity": "node", "kind": "deleted", "id": "A"}
inline validator::Schema relationshipChange() {
    validator::Schema s;
    s.field("entity").required().isString().oneOf({"node", "edge"});
    s.field("kind").required().isString().oneOf({"created", "updated", "deleted"});
    s.field("relationship").optional().isObject();
    s.field("business").optional().isObject();
    s.field("overwrite").optional().isBool();
    s.field("source").optional().isString().minLength(1);
    s.field("target").optional().isString().minLength(1);
    s.field("relationship_type").optional().isString().oneOf({"vendor", "client", "partner"});
    s.field("id").optional().isString().minLength(1);
    return s;
}

} // namespace bizgraph::schemas
