#include <iostream>
#include <filesystem>

#include "debug/log.hpp"

#include "core/Interceptor.hpp"
#include "core/AnswerBuilder.hpp"
#include "sandbox/SandboxEvaluator.hpp"
#include "transport/PistacheTransport.hpp"
#include "helpers/FsUtils.hpp"
#include "helpers/UrlUtils.hpp"
#include "logging/TrafficLogger.hpp"

#include "config/Config.hpp"

#include "GlobalState.hpp"

static void printHelp() {
    std::cout << "clearance [-c config] [-o outfile] [-q] <url>\n"
              << "clearance [-c config] --solve <page.html> --host <host>\n";
}

static std::string resolveLocation(const std::string& current, const std::string& location) {
    if (NUrlUtils::parse(location))
        return location;

    const auto BASE = NUrlUtils::parse(current);
    if (!BASE)
        return location;

    if (location.starts_with("//"))
        return BASE->scheme + ":" + location;

    if (location.starts_with("/"))
        return NUrlUtils::toString(NUrlUtils::resolvePath(*BASE, location));

    // relative to the current directory
    const auto DIR = BASE->path.substr(0, BASE->path.find_last_of('/') + 1);
    return NUrlUtils::toString(NUrlUtils::resolvePath(*BASE, (DIR.empty() ? "/" : DIR) + location));
}

static int solveOffline() {
    const auto PAGE = NFsUtils::readFileAsString(g_pGlobalState->solvePagePath);
    if (!PAGE) {
        Debug::log(CRIT, "Cannot read {}: {}", g_pGlobalState->solvePagePath, PAGE.error());
        return 1;
    }

    const auto CHALLENGE = CIUAMExtractor{}.extract(*PAGE, g_pGlobalState->solveHost);
    if (!CHALLENGE) {
        Debug::log(ERR, "Extraction failed ({}): {}", errorKindToString(CHALLENGE.error().kind), CHALLENGE.error().message);
        return 2;
    }

    const auto ANSWER = CSandboxEvaluator::evaluate(CHALLENGE->script, std::chrono::milliseconds(g_pConfig->m_config.evaluation_timeout_ms));
    if (!ANSWER) {
        Debug::log(ERR, "Evaluation failed ({}): {}", errorKindToString(ANSWER.error().kind), ANSWER.error().message);
        return 2;
    }

    std::cout << "script: " << CHALLENGE->script << "\n";
    std::cout << "jschl_vc: " << CHALLENGE->verificationToken.value_or("<none>") << "\n";
    std::cout << "pass: " << CHALLENGE->passToken.value_or("<none>") << "\n";
    std::cout << "jschl_answer: " << CAnswerBuilder::formatAnswer(*ANSWER) << "\n";

    return 0;
}

int main(int argc, char** argv, char** envp) {

    if (argc < 2) {
        printHelp();
        return 1;
    }

    std::vector<std::string> ARGS{};
    ARGS.resize(argc);
    for (int i = 0; i < argc; ++i) {
        ARGS[i] = std::string{argv[i]};
    }

    std::vector<std::string> command;

    g_pGlobalState->cwd = std::filesystem::current_path();

    for (int i = 1; i < argc; ++i) {
        if (ARGS[i].starts_with("-")) {
            if (ARGS[i] == "--help" || ARGS[i] == "-h") {
                printHelp();
                return 0;
            } else if ((ARGS[i] == "--config" || ARGS[i] == "-c") && i + 1 < argc) {
                g_pGlobalState->configPath = ARGS[i + 1];
                i++;
            } else if ((ARGS[i] == "--output" || ARGS[i] == "-o") && i + 1 < argc) {
                g_pGlobalState->outputPath = ARGS[i + 1];
                i++;
            } else if (ARGS[i] == "--solve" && i + 1 < argc) {
                g_pGlobalState->solvePagePath = ARGS[i + 1];
                i++;
            } else if (ARGS[i] == "--host" && i + 1 < argc) {
                g_pGlobalState->solveHost = ARGS[i + 1];
                i++;
            } else if (ARGS[i] == "--quiet" || ARGS[i] == "-q") {
                Debug::quiet = true;
            } else {
                std::cerr << "Unrecognized / invalid use of option " << ARGS[i] << "\nContinuing...\n";
                continue;
            }
        } else
            command.push_back(ARGS[i]);
    }

    g_pConfig = std::make_unique<CConfig>();

    if (!g_pGlobalState->solvePagePath.empty()) {
        if (g_pGlobalState->solveHost.empty()) {
            Debug::log(CRIT, "--solve needs --host");
            return 1;
        }

        return solveOffline();
    }

    if (command.size() != 1) {
        Debug::log(CRIT, "Expected exactly one url");
        return 1;
    }

    g_pTrafficLogger = std::make_unique<CTrafficLogger>();

    auto         transport = std::make_shared<CPistacheTransport>();
    CInterceptor interceptor(transport);

    SHttpRequest req;
    req.method = "GET";
    req.url    = command.front();

    std::expected<SHttpResponse, SError> resp;
    for (int redirects = 0;; ++redirects) {
        resp = interceptor.handle(req);

        if (!resp) {
            Debug::log(ERR, "Request failed ({}): {}", errorKindToString(resp.error().kind), resp.error().message);
            return 2;
        }

        const auto LOCATION = resp->headers.get("Location");
        if (resp->code < 300 || resp->code >= 400 || !LOCATION)
            break;

        if (redirects >= g_pConfig->m_config.max_redirects) {
            Debug::log(WARN, "Not following redirect to {}, limit of {} reached", *LOCATION, g_pConfig->m_config.max_redirects);
            break;
        }

        req.url = resolveLocation(req.url, *LOCATION);
        Debug::log(LOG, "Following redirect ({}) to {}", resp->code, req.url);
    }

    Debug::log(LOG, "Response: {} ({} bytes)", resp->code, resp->body.size());

    if (!g_pGlobalState->outputPath.empty()) {
        if (const auto WRITTEN = NFsUtils::writeFile(g_pGlobalState->outputPath, resp->body); !WRITTEN) {
            Debug::log(ERR, "Cannot write {}: {}", g_pGlobalState->outputPath, WRITTEN.error());
            return 1;
        }
    } else
        std::cout << resp->body;

    return 0;
}
