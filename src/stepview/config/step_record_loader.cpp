/**
 * @file step_record_loader.cpp
 */
#include "stepview/config/step_record_loader.hpp"

#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

#include <yaml-cpp/yaml.h>

namespace stepview
{

namespace
{

/// A key that is missing or explicitly null counts as absent.
bool is_present(const YAML::Node& node)
{
    return node.IsDefined() && !node.IsNull();
}

[[noreturn]] void throw_malformed(const std::string& origin, const std::string& what)
{
    throw StepViewError(StepViewErrorCode::MalformedInput, origin + ": " + what);
}

std::string scalar_text(const YAML::Node& node)
{
    if (node.IsNull())
    {
        return "null";
    }
    if (node.IsScalar())
    {
        return node.Scalar();
    }
    YAML::Emitter out;
    out << YAML::Flow << node;
    return out.c_str();
}

std::string read_required_scalar(const YAML::Node& root, const char* key, const std::string& origin)
{
    const YAML::Node node = root[key];
    if (!is_present(node))
    {
        throw StepViewError(
            StepViewErrorCode::MissingRequiredField,
            origin + ": required field '" + key + "' is missing");
    }
    if (!node.IsScalar())
    {
        throw_malformed(origin, std::string("field '") + key + "' must be a scalar");
    }
    return node.Scalar();
}

std::vector<std::string> read_port_list(const YAML::Node& root, const char* key, const std::string& origin)
{
    std::vector<std::string> ports;
    const YAML::Node node = root[key];
    if (!is_present(node))
    {
        return ports;
    }
    if (!node.IsSequence())
    {
        throw_malformed(origin, std::string("field '") + key + "' must be a sequence");
    }

    std::set<std::string> seen;
    for (const auto& item : node)
    {
        if (!item.IsScalar())
        {
            throw_malformed(origin, std::string("entries of '") + key + "' must be scalars");
        }
        const std::string& port = item.Scalar();
        if (port.empty() || port.find_first_of(" \t\r\n|") != std::string::npos)
        {
            throw_malformed(origin, "port name '" + port + "' in '" + key +
                                        "' must be non-empty without whitespace or '|'");
        }
        if (!seen.insert(port).second)
        {
            throw_malformed(origin, "port '" + port + "' is listed twice in '" + key + "'");
        }
        ports.push_back(port);
    }
    return ports;
}

EdgeMap read_edge_map(const YAML::Node& root, const char* key, const std::string& origin)
{
    EdgeMap edges;
    const YAML::Node node = root[key];
    if (!is_present(node))
    {
        return edges;
    }
    if (!node.IsMap())
    {
        throw_malformed(origin, std::string("field '") + key + "' must be a map");
    }

    for (auto it = node.begin(); it != node.end(); ++it)
    {
        const std::string port = it->first.as<std::string>();
        EdgeList& list = edges[port];
        if (!is_present(it->second))
        {
            continue;
        }
        if (!it->second.IsSequence())
        {
            throw_malformed(origin, std::string("edges of port '") + port + "' in '" + key +
                                        "' must be a sequence");
        }
        for (const auto& entry : it->second)
        {
            if (!entry.IsMap() || !entry["f"] || !entry["step"] ||
                !entry["f"].IsScalar() || !entry["step"].IsScalar())
            {
                throw_malformed(origin, std::string("edge of port '") + port + "' in '" + key +
                                            "' needs scalar 'f' and 'step' keys");
            }
            list.push_back(EdgeRef{StepId{entry["step"].Scalar()}, entry["f"].Scalar()});
        }
    }
    return edges;
}

std::optional<ParameterList> read_parameters(const YAML::Node& root, const std::string& origin)
{
    const YAML::Node node = root["parameters"];
    if (!is_present(node))
    {
        return std::nullopt;
    }
    if (!node.IsMap())
    {
        throw_malformed(origin, "field 'parameters' must be a map");
    }

    ParameterList params;
    for (auto it = node.begin(); it != node.end(); ++it)
    {
        std::string key = it->first.as<std::string>();
        if (it->second.IsSequence())
        {
            std::vector<std::string> items;
            for (const auto& item : it->second)
            {
                items.push_back(scalar_text(item));
            }
            params.emplace_back(std::move(key), std::move(items));
        }
        else
        {
            params.emplace_back(std::move(key), scalar_text(it->second));
        }
    }
    return params;
}

std::optional<bool> read_sandbox(const YAML::Node& root, const std::string& origin)
{
    const YAML::Node node = root["sandbox"];
    if (!is_present(node))
    {
        return std::nullopt;
    }
    bool value = false;
    if (!node.IsScalar() || !YAML::convert<bool>::decode(node, value))
    {
        throw_malformed(origin, "field 'sandbox' must be a boolean");
    }
    return value;
}

} // namespace

StepRecord load_step_record_from_string(const std::string& text, const std::string& origin)
{
    YAML::Node root;
    try
    {
        root = YAML::Load(text);
    }
    catch (const YAML::ParserException& e)
    {
        std::ostringstream oss;
        oss << origin << ":" << (e.mark.line + 1) << ":" << (e.mark.column + 1) << ": " << e.msg;
        throw StepViewError(StepViewErrorCode::MalformedInput, oss.str());
    }

    if (root.IsNull())
    {
        // An empty document has no keys at all; report the first required one.
        throw StepViewError(
            StepViewErrorCode::MissingRequiredField,
            origin + ": required field 'name' is missing");
    }
    if (!root.IsMap())
    {
        throw_malformed(origin, "top level must be a map");
    }

    StepRecord record;
    try
    {
        record.name = read_required_scalar(root, "name", origin);
        record.inputs = read_port_list(root, "inputs", origin);
        record.outputs = read_port_list(root, "outputs", origin);
        record.edges_i = read_edge_map(root, "edges_i", origin);
        record.edges_o = read_edge_map(root, "edges_o", origin);
        record.parameters = read_parameters(root, origin);
        record.sandbox = read_sandbox(root, origin);
        record.source = read_required_scalar(root, "source", origin);
    }
    catch (const YAML::Exception& e)
    {
        throw_malformed(origin, e.what());
    }
    return record;
}

StepRecord load_step_record(const std::string& path)
{
    // A directory opens without error on Linux and then reads as nothing.
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
    {
        throw StepViewError(
            StepViewErrorCode::FileNotFound,
            "Configuration path '" + path + "' is not a readable file");
    }

    std::ifstream in(path);
    if (!in)
    {
        throw StepViewError(
            StepViewErrorCode::FileNotFound,
            "Cannot open configuration file '" + path + "'");
    }
    std::ostringstream buffer;
    if (in.peek() != std::ifstream::traits_type::eof())
    {
        buffer << in.rdbuf();
    }
    if (in.bad())
    {
        throw StepViewError(
            StepViewErrorCode::FileNotFound,
            "Cannot read configuration file '" + path + "'");
    }
    return load_step_record_from_string(buffer.str(), path);
}

} // namespace stepview
