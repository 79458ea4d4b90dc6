#include "config/ConfigRegistry.hpp"
#include "db/PgSession.hpp"
#include "db/Transactions.hpp"
#include "fs/Filesystem.hpp"
#include "fs/errors.hpp"
#include "fs/model/Path.hpp"
#include "fs/model/json.hpp"
#include "log/Registry.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"

#include <filesystem>
#include <algorithm>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace tfs::config;
using namespace tfs::db;
using namespace tfs::fs;
using namespace tfs::util;

namespace {

using Args = std::vector<std::string>;

constexpr auto AUTHOR = "tablefs-cli";
constexpr auto JSON_FLAG = "--json";

// Strips --json from args and reports whether it was there.
bool takeJsonFlag(Args& args) {
    const auto it = std::ranges::find(args, JSON_FLAG);
    if (it == args.end()) return false;
    args.erase(it);
    return true;
}

void importFile(const std::string& target, const std::filesystem::path& source) {
    const auto existing = Filesystem::locateFileByPath(target);
    const auto result = Filesystem::save(existing ? std::optional(existing->id) : std::nullopt, target, AUTHOR,
                                         readFileToVector(source));
    fmt::print("** IMPORT {} -> {}\n", target, result.file_id);
}

int runImport(const Args& args) {
    for (const auto& arg : args) {
        const std::filesystem::path source(arg);
        if (std::filesystem::is_regular_file(source)) {
            importFile("/" + source.filename().string(), source);
            continue;
        }
        if (!std::filesystem::is_directory(source)) throw std::runtime_error("Cannot import " + arg);

        for (auto it = std::filesystem::recursive_directory_iterator(source); it != std::filesystem::recursive_directory_iterator(); ++it) {
            if (isHidden(it->path())) {
                if (it->is_directory()) it.disable_recursion_pending();
                continue;
            }
            if (!it->is_regular_file()) continue;
            importFile(model::Path(std::filesystem::relative(it->path(), source).generic_string()).toAbsolute(), it->path());
        }
    }
    return 0;
}

int runExport(const Args& args) {
    const std::filesystem::path targetDir = args.empty() ? "." : args.front();
    std::filesystem::create_directories(targetDir);

    const auto listing = Filesystem::listAll();
    for (const auto& [id, file] : listing.files) {
        const model::Path path(listing.buildPath(file));
        if (path.empty()) continue;

        auto dir = targetDir;
        for (const auto& segment : path.parent().segments) dir /= segment;
        std::filesystem::create_directories(dir);

        const auto content = Filesystem::read(id);
        if (!content) {
            tfs::log::Registry::cli()->warn("[export] {} vanished during export", path.toAbsolute());
            continue;
        }

        const auto out = dir / path.tail();
        writeFile(out, *content);
        fmt::print("** EXPORT {}\n", std::filesystem::absolute(out).string());
    }
    return 0;
}

void printFolder(const model::Listing& listing, const std::string& folderId, const std::string& indent) {
    for (const auto& childId : listing.childrenOf(folderId)) {
        fmt::print("{}{}/\n", indent, listing.folders.at(childId).name);
        printFolder(listing, childId, indent + "  ");
    }
    for (const auto& fileId : listing.filesOf(folderId)) {
        const auto& file = listing.files.at(fileId);
        fmt::print("{}{}  [{}{}]\n", indent, file.name, file.id, file.frozen ? ", frozen" : "");
    }
}

int runList(Args args) {
    const bool json = takeJsonFlag(args);
    const auto listing = Filesystem::listAll();
    const auto path = args.empty() ? std::string("/") : args.front();
    const auto folder = Filesystem::locateFolder(path);
    if (!folder) throw NotFoundError("Folder not found: " + path);

    if (json) {
        auto out = nlohmann::json(listing);
        if (!folder->isRoot()) {
            const auto prefix = listing.folderPath(folder->id);
            for (const auto* key : {"folders", "files"}) {
                auto kept = nlohmann::json::array();
                for (const auto& record : out[key]) {
                    const auto p = record.at("path").get<std::string>();
                    if (p == prefix || p.starts_with(prefix + "/")) kept.push_back(record);
                }
                out[key] = std::move(kept);
            }
        }
        fmt::print("{}\n", out.dump(2));
        return 0;
    }

    printFolder(listing, folder->id, "");
    return 0;
}

int runRmDir(const Args& args) {
    for (const auto& path : args) {
        fmt::print("** RMDIR {}\n", path);
        Filesystem::removeFolder(path);
    }
    return 0;
}

int runRmFile(const Args& args) {
    int rc = 0;
    for (const auto& path : args) {
        const auto file = Filesystem::locateFileByPath(path);
        if (!file) {
            fmt::print("** File not found: {}\n", path);
            rc = 1;
            continue;
        }
        fmt::print("** Removing file {} -> {}\n", path, file->id);
        Filesystem::removeFile(file->id, path);
    }
    return rc;
}

int runMvDir(const Args& args) {
    if (args.size() != 2) throw std::invalid_argument("Need exactly two arguments for mvdir");
    fmt::print("** MVDIR {} to {}\n", args[0], args[1]);
    Filesystem::moveFolder(args[0], args[1]);
    return 0;
}

int runMvFile(const Args& args) {
    if (args.size() != 2) throw std::invalid_argument("Need exactly two arguments for mvfile");
    const auto file = Filesystem::locateFileByPath(args[0]);
    if (!file) throw NotFoundError("Source file not found: " + args[0]);
    fmt::print("** MVFILE {} to {}\n", file->id, args[1]);
    Filesystem::moveFile(file->id, args[0], args[1]);
    return 0;
}

int runCheckpoint(const Args& args) {
    if (args.empty()) throw std::invalid_argument("checkpoint needs a file path");
    const auto& path = args[0];
    const auto message = args.size() > 1 ? args[1] : std::string("?");
    const auto author = args.size() > 2 ? args[2] : std::string("?");

    const auto file = Filesystem::locateFileByPath(path);
    if (!file) throw NotFoundError("File not found: " + path);

    const auto versionId = Filesystem::checkpoint(file->id, path, message, author);
    fmt::print("** CHECKPOINT {} -> {}\n", path, versionId);
    return 0;
}

int runHistory(Args args) {
    const bool json = takeJsonFlag(args);
    auto out = nlohmann::json::object();

    for (const auto& path : args) {
        const auto file = Filesystem::locateFileByPath(path);
        if (!file) throw NotFoundError("File not found: " + path);
        const auto versions = Filesystem::history(file->id);

        if (json) {
            out[path] = {{"file", *file}, {"versions", versions}};
            continue;
        }

        fmt::print("** HISTORY {} ({})\n", path, file->id);
        for (const auto& v : versions)
            fmt::print("{}  {}  {:<16} {}{}\n", v.id, timestampToString(v.created_at), v.author, v.message,
                       v.id == file->version_id ? "  (current)" : "");
    }

    if (json) fmt::print("{}\n", out.dump(2));
    return 0;
}

const std::map<std::string, std::function<int(const Args&)>> COMMANDS{
    {"import", runImport},
    {"export", runExport},
    {"ls", runList},
    {"rmdir", runRmDir},
    {"rmfile", runRmFile},
    {"mvdir", runMvDir},
    {"mvfile", runMvFile},
    {"checkpoint", runCheckpoint},
    {"history", runHistory},
};

void printUsage() {
    fmt::print(stderr,
               "Usage: tablefs-cli <config.yaml> <command> [args]\n"
               "  import <path>...                      copy local files or directory trees in\n"
               "  export [dir]                          write every file out under dir\n"
               "  ls [--json] [folder]                  print the tree\n"
               "  rmdir <folder>...                     remove folders recursively\n"
               "  rmfile <file>...                      remove files with their history\n"
               "  mvdir <from> <to>                     move or rename a folder\n"
               "  mvfile <from> <to>                    move or rename a file\n"
               "  checkpoint <file> [message] [author]  freeze the current version\n"
               "  history [--json] <file>...            list versions\n");
}

}

int main(const int argc, char** argv) {
    if (argc < 3) {
        printUsage();
        return 2;
    }

    const auto command = COMMANDS.find(argv[2]);
    if (command == COMMANDS.end()) {
        fmt::print(stderr, "Unsupported command: {}\n", argv[2]);
        printUsage();
        return 2;
    }

    try {
        ConfigRegistry::init(argv[1]);
        tfs::log::Registry::init();

        const auto& config = ConfigRegistry::get();
        Transactions::init(std::make_shared<PgSessionFactory>(config.database), config.retry);

        tfs::log::Registry::cli()->debug("[*] Running {}", argv[2]);
        return command->second(Args(argv + 3, argv + argc));
    } catch (const std::exception& e) {
        if (tfs::log::Registry::isInitialized()) tfs::log::Registry::cli()->error("[!] {} failed: {}", argv[2], e.what());
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
}
