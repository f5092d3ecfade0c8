// Core API - everything you always need
#include "vaultwire/vaultwire.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace vaultwire;

static const char* kPublicKeyFile = "public.der";
static const char* kPrivateKeyFile = "private.der";

static void usage() {
    std::cerr <<
        "usage: vault_cli <config.json> <command> [args...]\n"
        "  create-keys\n"
        "  create-user <user>\n"
        "  sources     <user>\n"
        "  get         <user> <source>\n"
        "  set         <user> <source> <password>\n"
        "  delete      <user> <source>\n"
        "  delete-user <user>\n";
}

static int printReply(const Message& res) {
    std::cout << res.bodyString() << '\n';
    return res.isSuccess() ? EXIT_SUCCESS : EXIT_FAILURE;
}

static bool loggedIn(AuthenticatedSession& vault, const std::string& user) {
    Message res = vault.login(user);
    if (vault.state() == SessionState::Authenticated)
        return true;
    std::cerr << "login failed" << (res.body().empty() ? std::string{} : ": " + res.bodyString()) << '\n';
    return false;
}

static int run(const ClientConfig& cfg, const std::vector<std::string>& args) {
    AuthenticatedSession vault(cfg);
    const std::string& cmd = args[0];

    if (cmd == "create-keys") {
        auto [pub, priv] = vault.createNewKeys(kPublicKeyFile, kPrivateKeyFile);
        std::cout << pub.string() << '\n' << priv.string() << '\n';
        return EXIT_SUCCESS;
    }
    if (args.size() < 2) {
        usage();
        return EXIT_FAILURE;
    }

    const auto pubPath = cfg.keysDirectory / kPublicKeyFile;
    const auto privPath = cfg.keysDirectory / kPrivateKeyFile;
    if (std::filesystem::exists(pubPath) || std::filesystem::exists(privPath))
        vault.importKeys(pubPath, privPath);
    else
        vault.createNewKeys(kPublicKeyFile, kPrivateKeyFile);

    const std::string& user = args[1];

    if (cmd == "create-user")
        return printReply(vault.createUser(user));

    if (!loggedIn(vault, user))
        return EXIT_FAILURE;

    if (cmd == "sources") {
        Message res = vault.getSources();
        for (const auto& source : AuthenticatedSession::parseSources(res.bodyString()))
            std::cout << source << '\n';
        return EXIT_SUCCESS;
    }
    if (cmd == "get" && args.size() == 3) {
        Message res = vault.getPassword(args[2]);
        if (res.body().empty()) {
            std::cerr << "no password stored for " << args[2] << '\n';
            return EXIT_FAILURE;
        }
        std::cout << vault.decryptPassword(res.body()) << '\n';
        return EXIT_SUCCESS;
    }
    if (cmd == "set" && args.size() == 4)
        return printReply(vault.setPassword(args[2], args[3]));
    if (cmd == "delete" && args.size() == 3)
        return printReply(vault.deletePassword(args[2]));
    if (cmd == "delete-user")
        return printReply(vault.deleteUser());

    usage();
    return EXIT_FAILURE;
}

int main(int argc, char** argv) {
    if (argc < 3) {
        usage();
        return EXIT_FAILURE;
    }

    try {
        ClientConfig cfg = loadClientConfig(argv[1]);
        Logger::inst().setLevel(cfg.logLevel);
        return run(cfg, std::vector<std::string>(argv + 2, argv + argc));
    }
    catch (const TransportError& e) {
        LOG_ERROR(std::string("connection failed (") + toString(e.code()) + "): " + e.what());
    }
    catch (const ClientError& e) {
        LOG_ERROR(std::string(toString(e.code())) + ": " + e.what());
    }
    catch (const std::exception& e) {
        LOG_ERROR(e.what());
    }
    return EXIT_FAILURE;
}
