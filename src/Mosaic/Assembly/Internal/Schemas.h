//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>

namespace mosaic::assembly::internal {

// The `properties` definition is repeated in each schema so that every
// schema stays self-contained.

inline constexpr std::string_view kSidecarSchema = R"({
"$schema": "http://json-schema.org/draft-07/schema#",
"title": "Mosaic Fragment Sidecar",
"type": "object",
"additionalProperties": false,
"required": ["version", "file", "object"],
"properties": {
    "version": { "type": "integer", "const": 1 },
    "file": { "type": "string", "minLength": 1 },
    "object": { "type": "string", "minLength": 1 },
    "order": { "type": "integer", "minimum": 0 },
    "parents": {
        "type": "array",
        "items": { "type": "string", "minLength": 1 }
    },
    "containers": {
        "type": "object",
        "additionalProperties": {
            "type": "string",
            "enum": ["group", "dummy", "point", "layer"]
        }
    },
    "movedToOrigin": { "type": "boolean" },
    "properties": { "$ref": "#/definitions/properties" }
},
"definitions": {
    "properties": {
        "type": "object",
        "additionalProperties": false,
        "properties": {
            "geomType": { "type": "string", "enum": ["auto", "xform", "scope", "Xform", "Scope"] },
            "kind": { "type": "string", "enum": ["none", "assembly", "group", "component", "subcomponent", "model"] },
            "purpose": { "type": "string", "enum": ["default", "render", "proxy", "guide"] },
            "instanceable": { "type": "boolean" },
            "hidden": { "type": "boolean" },
            "active": { "type": "boolean" },
            "payload": { "type": "boolean" },
            "assetVersion": { "type": "string" },
            "drawMode": { "type": "string", "enum": ["default", "bounds", "origin", "cards"] }
        }
    }
}
})";

inline constexpr std::string_view kAttributeStoreSchema = R"({
"$schema": "http://json-schema.org/draft-07/schema#",
"title": "Mosaic Attribute Store",
"type": "object",
"additionalProperties": { "$ref": "#/definitions/properties" },
"definitions": {
    "properties": {
        "type": "object",
        "additionalProperties": false,
        "properties": {
            "geomType": { "type": "string", "enum": ["auto", "xform", "scope", "Xform", "Scope"] },
            "kind": { "type": "string", "enum": ["none", "assembly", "group", "component", "subcomponent", "model"] },
            "purpose": { "type": "string", "enum": ["default", "render", "proxy", "guide"] },
            "instanceable": { "type": "boolean" },
            "hidden": { "type": "boolean" },
            "active": { "type": "boolean" },
            "payload": { "type": "boolean" },
            "assetVersion": { "type": "string" },
            "drawMode": { "type": "string", "enum": ["default", "bounds", "origin", "cards"] }
        }
    }
}
})";

inline constexpr std::string_view kAssemblyConfigSchema = R"({
"$schema": "http://json-schema.org/draft-07/schema#",
"title": "Mosaic Assembly Configuration",
"type": "object",
"additionalProperties": false,
"properties": {
    "version": { "type": "integer", "const": 1 },
    "defaultPrim": { "type": "string" },
    "upAxis": { "type": "string", "enum": ["Y", "Z"] },
    "metersPerUnit": { "type": "number", "exclusiveMinimum": 0 },
    "fps": { "type": "number", "exclusiveMinimum": 0 },
    "startFrame": { "type": "number" },
    "endFrame": { "type": "number" },
    "variantSetName": { "type": "string", "minLength": 1 },
    "relativeAssetPaths": { "type": "boolean" },
    "stripWrapper": { "type": "boolean" },
    "nestMaterialScopes": { "type": "boolean" },
    "wrapperName": { "type": "string", "minLength": 1 },
    "materialScopeNames": {
        "type": "array",
        "items": { "type": "string", "minLength": 1 }
    },
    "rewriteThreads": { "type": "integer", "minimum": 0, "maximum": 256 },
    "output": { "type": "string", "minLength": 1 },
    "report": { "type": "string", "minLength": 1 },
    "attributeStore": { "type": "string", "minLength": 1 }
}
})";

} // namespace mosaic::assembly::internal
