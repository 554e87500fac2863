#pragma once

#include <aion_mcp/core/json.hpp>
#include <aion_mcp/core/result.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace aion_mcp {

// ---------------------------------------------------------------------------
// FieldKind: the shape a tool input field must have.
// ---------------------------------------------------------------------------
enum class FieldKind {
    Any,
    String,
    Object,
    Array,
    Number,
    Integer,
    Boolean,
};

const char* FieldKindName(FieldKind kind);

struct FieldSpec {
    std::string name;
    FieldKind kind = FieldKind::Any;
    bool required = false;
    std::string description;
};

// ---------------------------------------------------------------------------
// InputSchema: ordered field list; rendered as a JSON Schema object.
// ---------------------------------------------------------------------------
struct InputSchema {
    std::vector<FieldSpec> fields;

    [[nodiscard]] Json ToJsonSchema() const;
};

struct ToolDescriptor {
    std::string name;
    std::string description;
    InputSchema input_schema;

    [[nodiscard]] Json ToJson() const;
};

struct ResourceDescriptor {
    std::string name;
    std::string kind;
    std::string locator;
    std::string description;

    [[nodiscard]] Json ToJson() const;
};

// ---------------------------------------------------------------------------
// ValidationFailure: why Validate() rejected a tool call.
// ---------------------------------------------------------------------------
struct TypeMismatch {
    std::string field;
    std::string expected;
    std::string actual;
};

enum class ValidationFailureKind {
    UnknownTool,
    SchemaError,
};

struct ValidationFailure {
    ValidationFailureKind kind = ValidationFailureKind::SchemaError;
    std::string tool;
    std::vector<std::string> missing;
    std::vector<TypeMismatch> mismatched;

    // {"missing":[...]} and/or {"mismatched":[{field,expected,actual}...]}
    [[nodiscard]] Json ToData() const;
    [[nodiscard]] std::string Summary() const;
};

// ---------------------------------------------------------------------------
// CapabilityRegistry: immutable catalog of tools and resources.
//
// Built once at startup through Builder and shared read-only afterwards.
// List order is insertion order and never changes.
// ---------------------------------------------------------------------------
class CapabilityRegistry {
public:
    class Builder {
    public:
        Builder& AddTool(ToolDescriptor tool);
        Builder& AddTools(std::vector<ToolDescriptor> tools);
        Builder& AddResource(ResourceDescriptor resource);
        Builder& AddResources(std::vector<ResourceDescriptor> resources);

        // Fails on duplicate tool names or resource locators.
        [[nodiscard]] Result<CapabilityRegistry, Error> Build() &&;

    private:
        std::vector<ToolDescriptor> tools_;
        std::vector<ResourceDescriptor> resources_;
    };

    [[nodiscard]] const std::vector<ToolDescriptor>& ListTools() const noexcept {
        return tools_;
    }

    [[nodiscard]] const std::vector<ResourceDescriptor>& ListResources() const noexcept {
        return resources_;
    }

    [[nodiscard]] const ToolDescriptor* FindTool(std::string_view name) const;

    // Check inputs against the tool's schema. On success returns the inputs
    // to forward (extra fields pass through unchanged).
    [[nodiscard]] Result<Json, ValidationFailure> Validate(
        const std::string& tool_name, const Json& inputs) const;

private:
    CapabilityRegistry(std::vector<ToolDescriptor> tools,
                       std::vector<ResourceDescriptor> resources)
        : tools_(std::move(tools)), resources_(std::move(resources)) {}

    std::vector<ToolDescriptor> tools_;
    std::vector<ResourceDescriptor> resources_;
};

/// run_inference and data_analysis.
std::vector<ToolDescriptor> DefaultTools();

/// The always-present model catalog resource (aion-r://models/catalog).
ResourceDescriptor ModelCatalogResource();

/// Convert a backend model listing into "model" resources. Accepts either a
/// bare array or {"models": [...]}; entries without an id are skipped.
std::vector<ResourceDescriptor> ModelResourcesFromCatalog(const Json& catalog);

} // namespace aion_mcp
