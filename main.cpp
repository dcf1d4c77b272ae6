#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/NodeApi.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/FileNodeProfile.hpp"

using namespace radview;

namespace {

constexpr int ExitOk = 0;
constexpr int ExitFailure = 1;
constexpr int ExitNotFound = 2;
constexpr int ExitUsage = 64;

void PrintUsage(std::ostream& out) {
    out << "Usage: radview <command> [args]\n"
        << "\n"
        << "Commands:\n"
        << "  nid                               Print the local node id\n"
        << "  rid-at <path>                     Repository id of a working copy\n"
        << "  project <rid>                     Show one project\n"
        << "  projects                          List seeded public projects\n"
        << "  patches <rid> [--state <status>]  List patches (draft|open|archived|merged)\n"
        << "  patch <rid> <id>                  Show one patch\n"
        << "  issues <rid>                      List issues\n"
        << "  issue <rid> <id>                  Show one issue\n"
        << "\n"
        << "The profile home is read from RAD_HOME, else $HOME/.radicle.\n";
}

struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

void Expect(const std::vector<std::string>& args, std::size_t count) {
    if (args.size() != count) {
        throw UsageError("'" + args[0] + "' expects " + std::to_string(count - 1) + " argument(s)");
    }
}

nlohmann::json Run(application::NodeApi& api, const std::vector<std::string>& args) {
    const std::string& cmd = args[0];

    if (cmd == "nid") {
        Expect(args, 1);
        return api.currentNodeId();
    }
    if (cmd == "rid-at") {
        Expect(args, 2);
        return api.repoIdAtPath(args[1]);
    }
    if (cmd == "project") {
        Expect(args, 2);
        return api.getProject(args[1]);
    }
    if (cmd == "projects") {
        Expect(args, 1);
        return api.listProjects();
    }
    if (cmd == "patches") {
        if (args.size() == 2) {
            return api.listPatches(args[1]);
        }
        if (args.size() == 4 && args[2] == "--state") {
            return api.listPatches(args[1], args[3]);
        }
        throw UsageError("'patches' expects <rid> [--state <status>]");
    }
    if (cmd == "patch") {
        Expect(args, 3);
        return api.getPatch(args[1], args[2]);
    }
    if (cmd == "issues") {
        Expect(args, 2);
        return api.listIssues(args[1]);
    }
    if (cmd == "issue") {
        Expect(args, 3);
        return api.getIssue(args[1], args[2]);
    }
    throw UsageError("unknown command '" + cmd + "'");
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || args[0] == "-h" || args[0] == "--help") {
        PrintUsage(args.empty() ? std::cerr : std::cout);
        return args.empty() ? ExitUsage : ExitOk;
    }

    application::NodeApi api(std::make_shared<infrastructure::FileProfileContext>());

    try {
        std::cout << Run(api, args).dump(2) << std::endl;
        return ExitOk;
    } catch (const UsageError& e) {
        std::cerr << "error: " << e.what() << "\n\n";
        PrintUsage(std::cerr);
        return ExitUsage;
    } catch (const domain::HintedError& e) {
        std::cerr << "error: " << e.what() << std::endl;
        std::cerr << "hint: " << e.hint() << std::endl;
        return ExitFailure;
    } catch (const domain::NotFoundError& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return ExitNotFound;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return ExitFailure;
    }
}
