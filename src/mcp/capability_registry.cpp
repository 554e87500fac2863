#include <aion_mcp/mcp/capability_registry.hpp>

#include <aion_mcp/core/log.hpp>

#include <optional>
#include <set>

namespace aion_mcp {

namespace {

constexpr const char* kModelUriPrefix = "aion-r://models/";

Error MakeRegistryError(const std::string& message) {
    return Error{"BuildRegistry", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Internal};
}

bool Matches(FieldKind kind, const Json& value) {
    switch (kind) {
        case FieldKind::Any:     return true;
        case FieldKind::String:  return value.is_string();
        case FieldKind::Object:  return value.is_object();
        case FieldKind::Array:   return value.is_array();
        case FieldKind::Number:  return value.is_number();
        case FieldKind::Integer: return value.is_number_integer();
        case FieldKind::Boolean: return value.is_boolean();
    }
    return false;
}

// String form of a JSON id, for model locators ("7" or "llama-3").
std::optional<std::string> IdText(const Json& id) {
    if (id.is_string() && !id.get<std::string>().empty()) {
        return id.get<std::string>();
    }
    if (id.is_number_integer()) {
        return id.dump();
    }
    return std::nullopt;
}

} // anonymous namespace

const char* FieldKindName(FieldKind kind) {
    switch (kind) {
        case FieldKind::Any:     return "any";
        case FieldKind::String:  return "string";
        case FieldKind::Object:  return "object";
        case FieldKind::Array:   return "array";
        case FieldKind::Number:  return "number";
        case FieldKind::Integer: return "integer";
        case FieldKind::Boolean: return "boolean";
    }
    return "any";
}

// ---------------------------------------------------------------------------
// Descriptors
// ---------------------------------------------------------------------------
Json InputSchema::ToJsonSchema() const {
    Json properties = Json::object();
    Json required = Json::array();
    for (const auto& field : fields) {
        Json prop = Json::object();
        if (field.kind != FieldKind::Any) {
            prop["type"] = FieldKindName(field.kind);
        }
        if (!field.description.empty()) {
            prop["description"] = field.description;
        }
        properties[field.name] = std::move(prop);
        if (field.required) {
            required.push_back(field.name);
        }
    }
    return Json{{"type", "object"},
                {"properties", std::move(properties)},
                {"required", std::move(required)}};
}

Json ToolDescriptor::ToJson() const {
    return Json{{"name", name},
                {"description", description},
                {"inputSchema", input_schema.ToJsonSchema()}};
}

Json ResourceDescriptor::ToJson() const {
    Json j{{"uri", locator}, {"name", name}, {"kind", kind}};
    if (!description.empty()) {
        j["description"] = description;
    }
    return j;
}

// ---------------------------------------------------------------------------
// ValidationFailure
// ---------------------------------------------------------------------------
Json ValidationFailure::ToData() const {
    Json data = Json::object();
    if (kind == ValidationFailureKind::UnknownTool) {
        data["tool"] = tool;
        return data;
    }
    if (!missing.empty()) {
        data["missing"] = missing;
    }
    if (!mismatched.empty()) {
        Json list = Json::array();
        for (const auto& m : mismatched) {
            list.push_back(Json{{"field", m.field},
                                {"expected", m.expected},
                                {"actual", m.actual}});
        }
        data["mismatched"] = std::move(list);
    }
    return data;
}

std::string ValidationFailure::Summary() const {
    if (kind == ValidationFailureKind::UnknownTool) {
        return "unknown tool '" + tool + "'";
    }
    std::string out;
    for (const auto& name : missing) {
        out += (out.empty() ? "" : ", ") + std::string("missing ") + name;
    }
    for (const auto& m : mismatched) {
        out += (out.empty() ? "" : ", ") + m.field + " is " + m.actual +
               " (expected " + m.expected + ")";
    }
    return out;
}

// ---------------------------------------------------------------------------
// Builder
// ---------------------------------------------------------------------------
CapabilityRegistry::Builder& CapabilityRegistry::Builder::AddTool(
    ToolDescriptor tool) {
    tools_.push_back(std::move(tool));
    return *this;
}

CapabilityRegistry::Builder& CapabilityRegistry::Builder::AddTools(
    std::vector<ToolDescriptor> tools) {
    for (auto& tool : tools) {
        tools_.push_back(std::move(tool));
    }
    return *this;
}

CapabilityRegistry::Builder& CapabilityRegistry::Builder::AddResource(
    ResourceDescriptor resource) {
    resources_.push_back(std::move(resource));
    return *this;
}

CapabilityRegistry::Builder& CapabilityRegistry::Builder::AddResources(
    std::vector<ResourceDescriptor> resources) {
    for (auto& resource : resources) {
        resources_.push_back(std::move(resource));
    }
    return *this;
}

Result<CapabilityRegistry, Error> CapabilityRegistry::Builder::Build() && {
    std::set<std::string> tool_names;
    for (const auto& tool : tools_) {
        if (tool.name.empty()) {
            return Result<CapabilityRegistry, Error>::Err(
                MakeRegistryError("Tool name must not be empty"));
        }
        if (!tool_names.insert(tool.name).second) {
            return Result<CapabilityRegistry, Error>::Err(
                MakeRegistryError("Duplicate tool name: " + tool.name));
        }
    }

    std::set<std::string> locators;
    for (const auto& resource : resources_) {
        if (resource.locator.empty()) {
            return Result<CapabilityRegistry, Error>::Err(
                MakeRegistryError("Resource '" + resource.name +
                                  "' has no locator"));
        }
        if (!locators.insert(resource.locator).second) {
            return Result<CapabilityRegistry, Error>::Err(
                MakeRegistryError("Duplicate resource locator: " +
                                  resource.locator));
        }
    }

    return Result<CapabilityRegistry, Error>::Ok(
        CapabilityRegistry(std::move(tools_), std::move(resources_)));
}

// ---------------------------------------------------------------------------
// Lookup / validation
// ---------------------------------------------------------------------------
const ToolDescriptor* CapabilityRegistry::FindTool(std::string_view name) const {
    for (const auto& tool : tools_) {
        if (tool.name == name) {
            return &tool;
        }
    }
    return nullptr;
}

Result<Json, ValidationFailure> CapabilityRegistry::Validate(
    const std::string& tool_name, const Json& inputs) const {
    const auto* tool = FindTool(tool_name);
    if (tool == nullptr) {
        return Result<Json, ValidationFailure>::Err(ValidationFailure{
            ValidationFailureKind::UnknownTool, tool_name, {}, {}});
    }

    ValidationFailure failure;
    failure.kind = ValidationFailureKind::SchemaError;
    failure.tool = tool_name;

    if (!inputs.is_object()) {
        failure.mismatched.push_back({"inputs", "object", inputs.type_name()});
        return Result<Json, ValidationFailure>::Err(std::move(failure));
    }

    for (const auto& field : tool->input_schema.fields) {
        auto it = inputs.find(field.name);
        if (it == inputs.end()) {
            if (field.required) {
                failure.missing.push_back(field.name);
            }
            continue;
        }
        if (!Matches(field.kind, *it)) {
            failure.mismatched.push_back(
                {field.name, FieldKindName(field.kind), it->type_name()});
        }
    }

    if (!failure.missing.empty() || !failure.mismatched.empty()) {
        return Result<Json, ValidationFailure>::Err(std::move(failure));
    }
    return Result<Json, ValidationFailure>::Ok(inputs);
}

// ---------------------------------------------------------------------------
// Built-in catalog
// ---------------------------------------------------------------------------
std::vector<ToolDescriptor> DefaultTools() {
    return {
        ToolDescriptor{
            "run_inference",
            "Runs AI inference by calling the backend AION-R API.",
            InputSchema{{
                {"model", FieldKind::String, true, "Model identifier"},
                {"prompt", FieldKind::String, true, "Prompt text"},
                {"params", FieldKind::Object, false,
                 "Model-specific generation parameters"},
            }}},
        ToolDescriptor{
            "data_analysis",
            "Runs data analysis by calling the backend AION-R API.",
            InputSchema{{
                {"data", FieldKind::Any, true, "Data to analyze"},
                {"ops", FieldKind::Array, true, "Analysis operations to apply"},
            }}},
    };
}

ResourceDescriptor ModelCatalogResource() {
    return ResourceDescriptor{"Model catalog", "catalog",
                              std::string(kModelUriPrefix) + "catalog",
                              "Models available on the backend"};
}

std::vector<ResourceDescriptor> ModelResourcesFromCatalog(const Json& catalog) {
    const Json* entries = &catalog;
    if (catalog.is_object() && catalog.contains("models")) {
        entries = &catalog["models"];
    }
    std::vector<ResourceDescriptor> out;
    if (!entries->is_array()) {
        LogWarn("registry", "model catalog is not a list; ignoring it");
        return out;
    }

    for (const auto& entry : *entries) {
        if (!entry.is_object() || !entry.contains("id")) {
            LogWarn("registry", "skipping model entry without an id");
            continue;
        }
        auto id = IdText(entry["id"]);
        if (!id) {
            LogWarn("registry", "skipping model entry with an unusable id");
            continue;
        }
        ResourceDescriptor resource;
        resource.kind = "model";
        resource.locator = kModelUriPrefix + *id;
        resource.name = entry.contains("name") && entry["name"].is_string()
            ? entry["name"].get<std::string>()
            : *id;
        if (entry.contains("description") && entry["description"].is_string()) {
            resource.description = entry["description"].get<std::string>();
        }
        out.push_back(std::move(resource));
    }
    return out;
}

} // namespace aion_mcp
