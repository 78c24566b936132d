#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Named command templates, persisted as a YAML map of name -> command list.
// Order of templates and of commands inside each template is preserved.
class TemplateStore {
public:
    TemplateStore() = default;

    static Result<TemplateStore> load(const fs::path& path);
    Result<void> save(const fs::path& path) const;

    // Returns nullptr if no template has this name.
    const Template* get(const std::string& name) const;

    std::vector<std::string> names() const;
    const std::vector<Template>& templates() const { return templates_; }

    // Fails if the name is taken or there are no commands.
    Result<void> add(const std::string& name, std::vector<std::string> commands);

    // Fails if no template has this name.
    Result<void> remove(const std::string& name);

    void clear() { templates_.clear(); }
    bool empty() const { return templates_.empty(); }

private:
    std::vector<Template> templates_;
};
