#include <flightlock/core/catalog/product.hpp>
#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace FlightLock {

namespace {

// The YAML parser also accepts block mappings and plain scalars. JSON
// requires a braced object, quoted keys and a quoted name; quoted scalars
// carry the non-specific tag "!", plain ones "?".
bool isQuoted(const YAML::Node& node) {
    return node.IsScalar() && node.Tag() == "!";
}

bool startsWithBrace(const std::string& raw) {
    auto pos = raw.find_first_not_of(" \t\r\n");
    return pos != std::string::npos && raw[pos] == '{';
}

} // namespace

// JSON is emitted as a YAML flow mapping with double-quoted strings and
// parsed back with the YAML parser, which accepts JSON documents.
std::string ProductCodec::encode(const Product& product) {
    YAML::Emitter out;
    out << YAML::Flow << YAML::BeginMap;
    out << YAML::Key << YAML::DoubleQuoted << "id" << YAML::Value << product.id;
    out << YAML::Key << YAML::DoubleQuoted << "name" << YAML::Value << YAML::DoubleQuoted << product.name;
    out << YAML::EndMap;
    if (!out.good()) {
        throw std::runtime_error("encoding product " + std::to_string(product.id) + ": " + out.GetLastError());
    }
    return out.c_str();
}

bool ProductCodec::decode(const std::string& raw, Product& out, std::string& error) {
    if (!startsWithBrace(raw)) {
        error = "product must be a JSON object";
        return false;
    }

    YAML::Node node;
    try {
        node = YAML::Load(raw);
    } catch (const YAML::ParserException& e) {
        error = std::string("malformed product: ") + e.what();
        return false;
    }

    if (!node.IsMap()) {
        error = "product must be an object";
        return false;
    }
    for (const auto& entry : node) {
        if (!isQuoted(entry.first)) {
            error = "product keys must be JSON strings";
            return false;
        }
    }
    if (!node["id"] || !node["name"]) {
        error = "product requires 'id' and 'name'";
        return false;
    }
    if (isQuoted(node["id"]) || !isQuoted(node["name"])) {
        error = "product 'id' must be a number and 'name' a string";
        return false;
    }

    try {
        out.id = node["id"].as<int64_t>();
        out.name = node["name"].as<std::string>();
    } catch (const YAML::BadConversion& e) {
        error = std::string("invalid product field: ") + e.what();
        return false;
    }
    return true;
}

} // namespace FlightLock
