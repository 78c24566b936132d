#include "template_store.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <fstream>

Result<TemplateStore> TemplateStore::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<TemplateStore>::Err("Templates file not found at " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        TemplateStore store;

        if (root && !root.IsNull() && !root.IsMap()) {
            return Result<TemplateStore>::Err("Templates file must be a map of name to commands");
        }

        for (const auto& kv : root) {
            Template tmpl;
            tmpl.name = kv.first.as<std::string>();

            // A bare string is a one-command template.
            if (kv.second.IsScalar()) {
                tmpl.commands.push_back(kv.second.as<std::string>());
            } else if (kv.second.IsSequence()) {
                for (const auto& cmd : kv.second) {
                    tmpl.commands.push_back(cmd.as<std::string>());
                }
            } else {
                return Result<TemplateStore>::Err(
                    "Template '" + tmpl.name + "' must be a command or a list of commands");
            }
            if (tmpl.commands.empty()) {
                return Result<TemplateStore>::Err("Template '" + tmpl.name + "' has no commands.");
            }
            store.templates_.push_back(std::move(tmpl));
        }

        return Result<TemplateStore>::Ok(std::move(store));
    } catch (const std::exception& e) {
        return Result<TemplateStore>::Err(std::string("Failed to parse templates file: ") + e.what());
    }
}

Result<void> TemplateStore::save(const fs::path& path) const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    for (const auto& tmpl : templates_) {
        out << YAML::Key << tmpl.name;
        out << YAML::Value << YAML::BeginSeq;
        for (const auto& cmd : tmpl.commands) {
            out << YAML::DoubleQuoted << cmd;
        }
        out << YAML::EndSeq;
    }
    out << YAML::EndMap;

    if (!out.good()) {
        return Result<void>::Err("Failed to format templates: " + out.GetLastError());
    }

    try {
        if (path.has_parent_path()) fs::create_directories(path.parent_path());
        std::ofstream file(path);
        if (!file) {
            return Result<void>::Err("Failed to write templates file at " + path.string());
        }
        file << "# kanri templates: name -> commands run in order inside the new project\n";
        file << out.c_str() << "\n";
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err(std::string("Failed to write templates file: ") + e.what());
    }
}

const Template* TemplateStore::get(const std::string& name) const {
    auto it = std::find_if(templates_.begin(), templates_.end(),
                           [&](const Template& t) { return t.name == name; });
    return it == templates_.end() ? nullptr : &*it;
}

std::vector<std::string> TemplateStore::names() const {
    std::vector<std::string> out;
    out.reserve(templates_.size());
    for (const auto& t : templates_) out.push_back(t.name);
    return out;
}

Result<void> TemplateStore::add(const std::string& name, std::vector<std::string> commands) {
    if (name.empty()) {
        return Result<void>::Err("Template name cannot be empty.");
    }
    if (get(name)) {
        return Result<void>::Err("Template '" + name + "' already exists.");
    }
    if (commands.empty()) {
        return Result<void>::Err("Template '" + name + "' has no commands.");
    }
    templates_.push_back({name, std::move(commands)});
    return Result<void>::Ok();
}

Result<void> TemplateStore::remove(const std::string& name) {
    auto it = std::find_if(templates_.begin(), templates_.end(),
                           [&](const Template& t) { return t.name == name; });
    if (it == templates_.end()) {
        return Result<void>::Err("Template '" + name + "' not found.");
    }
    templates_.erase(it);
    return Result<void>::Ok();
}
