#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include <servherd/app/server_service.h>

namespace servherd::cli {

/// Storage for the shared `[name] --all --tag` target options
struct SelectorArgs {
    std::string name;
    bool all{false};
    std::string tag;

    app::Selector toSelector() const {
        app::Selector s;
        if (!name.empty())
            s.name = name;
        s.all = all;
        if (!tag.empty())
            s.tag = tag;
        return s;
    }
};

inline void addSelectorOptions(CLI::App* cmd, SelectorArgs& args) {
    cmd->add_option("name", args.name, "Server name");
    cmd->add_flag("-a,--all", args.all, "Apply to all servers");
    cmd->add_option("-t,--tag", args.tag, "Apply to servers with this tag");
}

} // namespace servherd::cli
