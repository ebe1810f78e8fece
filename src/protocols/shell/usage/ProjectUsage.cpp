#include "protocols/shell/usage/ProjectUsage.hpp"

using namespace rv::shell;

CommandUsage ProjectUsage::init() {
    CommandUsage cmd;
    cmd.command = "init";
    cmd.description = "Start tracking a project file and store its first version.";
    cmd.positionals = {{"<file>", "Project file to track (.aepx)"}};
    cmd.optional = {{"--force", "Re-initialize even if the directory already holds a project", {"-f"}}};
    cmd.examples.push_back({"reelvault init ~/Projects/promo/promo.aepx", "Store version 0 of promo.aepx and every asset it references."});
    return cmd;
}

CommandUsage ProjectUsage::commit() {
    CommandUsage cmd;
    cmd.command = "commit";
    cmd.aliases = {"c", "save"};
    cmd.description = "Save a new version of the selected project.";
    cmd.positionals = {
        {"<message>", "Commit message"},
        {"[file]", "Project file to commit; defaults to the last committed path"}
    };
    cmd.examples.push_back({"reelvault commit \"color pass\"", "Commit the current project file."});
    cmd.examples.push_back({"reelvault commit \"alt cut\" promo_alt.aepx", "Commit a different file as the next version."});
    return cmd;
}

CommandUsage ProjectUsage::list() {
    CommandUsage cmd;
    cmd.command = "list";
    cmd.aliases = {"ls", "projects"};
    cmd.description = "List projects in storage, or the commits of one of them.";
    cmd.positionals = {{"[n]", "Project number from the listing"}};
    cmd.examples.push_back({"reelvault list", "Show every stored project."});
    cmd.examples.push_back({"reelvault list 2", "Show the commits of project #2."});
    return cmd;
}

CommandUsage ProjectUsage::log() {
    CommandUsage cmd;
    cmd.command = "log";
    cmd.aliases = {"history"};
    cmd.description = "Show the commit history of the selected project.";
    return cmd;
}

CommandUsage ProjectUsage::show() {
    CommandUsage cmd;
    cmd.command = "show";
    cmd.description = "Show one version with its assets.";
    cmd.positionals = {{"<version>", "Version number"}};
    return cmd;
}

CommandUsage ProjectUsage::tracking() {
    CommandUsage cmd;
    cmd.command = "tracking";
    cmd.aliases = {"diff"};
    cmd.description = "Show which assets a version added, kept and dropped.";
    cmd.positionals = {{"<version>", "Version number"}};
    return cmd;
}

CommandUsage ProjectUsage::remove() {
    CommandUsage cmd;
    cmd.command = "remove";
    cmd.aliases = {"rm"};
    cmd.description = "Remove a version from the history. Other versions keep their numbers.";
    cmd.positionals = {{"<version>", "Version number"}};
    return cmd;
}

CommandUsage ProjectUsage::prune() {
    CommandUsage cmd;
    cmd.command = "prune";
    cmd.description = "Drop versions whose stored project file is missing from storage.";
    return cmd;
}

CommandUsage ProjectUsage::pull() {
    CommandUsage cmd;
    cmd.command = "pull";
    cmd.aliases = {"restore", "checkout"};
    cmd.description = "Restore a version into a directory. Assets missing from their original location are restored beside it and relinked.";
    cmd.positionals = {
        {"<version>", "Version number"},
        {"[dir]", "Output directory (default: current directory)"}
    };
    cmd.examples.push_back({"reelvault pull 1 ./restored", "Restore version 1 into ./restored."});
    return cmd;
}

CommandUsage ProjectUsage::del() {
    CommandUsage cmd;
    cmd.command = "delete";
    cmd.description = "Delete a project's stored versions, assets and local metadata. Cannot be undone.";
    cmd.positionals = {{"<name>", "Project name or id"}};
    cmd.optional = {{"--yes", "Confirm the deletion", {"-y"}}};
    return cmd;
}

CommandUsage ProjectUsage::use() {
    CommandUsage cmd;
    cmd.command = "use";
    cmd.aliases = {"select", "switch"};
    cmd.description = "Select the project that later commands operate on.";
    cmd.positionals = {{"<name|path>", "Project name, id, directory, project file or config.json"}};
    cmd.optional = {{"--clear", "Forget the current selection"}};
    return cmd;
}

CommandUsage ProjectUsage::status() {
    CommandUsage cmd;
    cmd.command = "status";
    cmd.aliases = {"st"};
    cmd.description = "Show the selected project and its latest version.";
    return cmd;
}

CommandUsage SystemUsage::help() {
    CommandUsage cmd;
    cmd.command = "help";
    cmd.aliases = {"h", "?"};
    cmd.description = "Show help information about commands.";
    cmd.positionals = {{"[command]", "Command to describe"}};
    return cmd;
}

CommandUsage SystemUsage::version() {
    CommandUsage cmd;
    cmd.command = "version";
    cmd.aliases = {"v"};
    cmd.description = "Show version information.";
    return cmd;
}

CommandUsage SystemUsage::serve() {
    CommandUsage cmd;
    cmd.command = "serve";
    cmd.description = "Start the read-only HTTP query API.";
    cmd.positionals = {{"[port]", "Port to listen on (default from config, 8080)"}};
    cmd.optional = {{"--host", "Address to bind (default from config, 127.0.0.1)"}};
    return cmd;
}
